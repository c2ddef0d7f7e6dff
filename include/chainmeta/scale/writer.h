#ifndef CHAINMETA_SCALE_WRITER_H
#define CHAINMETA_SCALE_WRITER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace ChainMeta::scale {

/// Raised when a value cannot be represented on the wire of its version.
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Writer {
public:
    Writer() = default;

    void write_u8(uint8_t value) { buffer_.push_back(value); }
    void write_bool(bool value) { buffer_.push_back(value ? 1 : 0); }
    void write_u16_le(uint16_t value);
    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);

    /// Shortest (canonical) compact form of value.
    void write_compact(uint64_t value);
    void write_length(size_t length) { write_compact(static_cast<uint64_t>(length)); }

    void write_string(std::string_view value);
    void write_bytes(std::span<const uint8_t> value);
    void write_fixed(std::span<const uint8_t> value);

    const std::vector<uint8_t>& buffer() const { return buffer_; }
    std::vector<uint8_t> take_buffer() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

} // namespace ChainMeta::scale

#endif // CHAINMETA_SCALE_WRITER_H
