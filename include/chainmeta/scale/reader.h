#ifndef CHAINMETA_SCALE_READER_H
#define CHAINMETA_SCALE_READER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ChainMeta::scale {

/**
 * @brief Raised by Reader when the input does not match the expected shape.
 *
 * Carries the byte offset of the failure and the dotted field path that was
 * being decoded (for example `pallets[2].storage.entries[0].ty`).
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& reason, size_t offset, std::string path);

    size_t offset() const { return offset_; }
    const std::string& path() const { return path_; }
    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
    size_t offset_;
    std::string path_;
};

/// Strict UTF-8: no overlong forms, surrogates or code points above U+10FFFF.
bool is_valid_utf8(std::string_view text);

class Reader {
public:
    Reader(const uint8_t* data, size_t size) : begin_ptr(data), current_ptr(data), end_ptr(data + size) {}
    explicit Reader(std::span<const uint8_t> data) : Reader(data.data(), data.size()) {}
    explicit Reader(const std::vector<uint8_t>& data) : Reader(data.data(), data.size()) {}

    uint8_t read_u8();
    bool read_bool();
    uint16_t read_u16_le();
    uint32_t read_u32_le();
    uint64_t read_u64_le();

    /// Compact integers must be canonical and fit the requested width.
    uint32_t read_compact_u32();
    uint64_t read_compact_u64();

    /**
     * @brief Reads a compact sequence length.
     *
     * Every element of every sequence in the schema occupies at least one
     * byte, so a length larger than the remaining input is rejected here,
     * before the caller allocates anything.
     */
    size_t read_length();

    /// Rejects invalid UTF-8 and rewinds to the length prefix.
    std::string read_string();
    std::vector<uint8_t> read_bytes();
    void read_fixed(uint8_t* out, size_t count);

    /// Reads a one-byte discriminant and rejects values above max_tag.
    uint8_t read_tag(std::string_view what, uint8_t max_tag);

    [[noreturn]] void fail(const std::string& reason) const;

    /// Throws when any input is left unread.
    void expect_end() const;

    size_t offset() const { return static_cast<size_t>(current_ptr - begin_ptr); }
    size_t remaining_bytes() const { return static_cast<size_t>(end_ptr - current_ptr); }
    bool is_eos() const { return current_ptr >= end_ptr; }

    // Field path bookkeeping, see FieldScope
    void push_field(std::string name) { path_.push_back(std::move(name)); }
    void pop_field() { path_.pop_back(); }
    std::string field_path() const;

private:
    void check_available(size_t num_bytes) const;
    uint64_t read_compact_big(uint8_t first, size_t max_bytes);

    const uint8_t* begin_ptr;
    const uint8_t* current_ptr;
    const uint8_t* end_ptr;
    std::vector<std::string> path_;
};

/// Names the field being decoded for the lifetime of the scope.
class FieldScope {
public:
    FieldScope(Reader& reader, std::string name) : reader_(reader) {
        reader_.push_field(std::move(name));
    }
    ~FieldScope() { reader_.pop_field(); }

    FieldScope(const FieldScope&) = delete;
    FieldScope& operator=(const FieldScope&) = delete;

private:
    Reader& reader_;
};

} // namespace ChainMeta::scale

#endif // CHAINMETA_SCALE_READER_H
