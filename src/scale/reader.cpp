#include "chainmeta/scale/reader.h"

#include <algorithm>

#include "chainmeta/internal/debug.h"
#include "chainmeta/logger.h"

namespace ChainMeta::scale {

bool is_valid_utf8(std::string_view text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();
    while (p < end) {
        unsigned char lead = *p;
        if (lead < 0x80) {
            ++p;
            continue;
        }
        size_t len;
        uint32_t cp;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
            cp = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            cp = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (static_cast<size_t>(end - p) < len) {
            return false;
        }
        for (size_t i = 1; i < len; ++i) {
            if ((p[i] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (p[i] & 0x3F);
        }
        if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        p += len;
    }
    return true;
}

DecodeError::DecodeError(const std::string& reason, size_t offset, std::string path)
    : std::runtime_error(path.empty()
                             ? detail::format("%s (offset %zu)", reason.c_str(), offset)
                             : detail::format("%s at %s (offset %zu)", reason.c_str(), path.c_str(), offset)),
      reason_(reason),
      offset_(offset),
      path_(std::move(path)) {}

void Reader::check_available(size_t num_bytes) const {
    if (num_bytes > remaining_bytes()) {
        fail(detail::format("unexpected end of input: need %zu bytes, %zu remaining",
                            num_bytes, remaining_bytes()));
    }
}

void Reader::fail(const std::string& reason) const {
    CMETA_DEBUG("decode failure at offset %zu: %s", offset(), reason.c_str());
    throw DecodeError(reason, offset(), field_path());
}

std::string Reader::field_path() const {
    std::string out;
    for (const auto& segment : path_) {
        if (!out.empty() && segment.front() != '[') {
            out += '.';
        }
        out += segment;
    }
    return out;
}

uint8_t Reader::read_u8() {
    check_available(1);
    return *current_ptr++;
}

bool Reader::read_bool() {
    uint8_t val = read_u8();
    if (val > 1) {
        --current_ptr;
        fail(detail::format("invalid bool byte 0x%02x", val));
    }
    return val != 0;
}

uint16_t Reader::read_u16_le() {
    check_available(2);
    uint16_t val = static_cast<uint16_t>(current_ptr[0] | (current_ptr[1] << 8));
    current_ptr += 2;
    return val;
}

uint32_t Reader::read_u32_le() {
    check_available(4);
    uint32_t val = 0;
    for (int i = 3; i >= 0; --i) {
        val = (val << 8) | current_ptr[i];
    }
    current_ptr += 4;
    return val;
}

uint64_t Reader::read_u64_le() {
    check_available(8);
    uint64_t val = 0;
    for (int i = 7; i >= 0; --i) {
        val = (val << 8) | current_ptr[i];
    }
    current_ptr += 8;
    return val;
}

uint64_t Reader::read_compact_big(uint8_t first, size_t max_bytes) {
    // Failures are reported at the prefix byte, which has already been consumed
    const uint8_t* prefix = current_ptr - 1;
    auto reject = [&](const std::string& reason) {
        current_ptr = prefix;
        fail(reason);
    };
    size_t len = static_cast<size_t>(first >> 2) + 4;
    if (len > max_bytes) {
        reject(detail::format("compact integer of %zu bytes overflows a %zu-byte target", len, max_bytes));
    }
    if (len > remaining_bytes()) {
        reject(detail::format("unexpected end of input: need %zu bytes, %zu remaining", len, remaining_bytes()));
    }
    uint64_t val = 0;
    for (size_t i = len; i > 0; --i) {
        val = (val << 8) | current_ptr[i - 1];
    }
    if (current_ptr[len - 1] == 0) {
        reject("non-canonical compact integer: trailing zero byte");
    }
    if (val <= 0x3FFFFFFFull) {
        reject("non-canonical compact integer: fits the four-byte form");
    }
    current_ptr += len;
    return val;
}

uint64_t Reader::read_compact_u64() {
    size_t start = offset();
    check_available(1);
    uint8_t first = current_ptr[0];
    switch (first & 0b11) {
        case 0b00:
            ++current_ptr;
            return first >> 2;
        case 0b01: {
            uint16_t raw = read_u16_le();
            uint64_t val = raw >> 2;
            if (val < 64) {
                current_ptr = begin_ptr + start;
                fail("non-canonical compact integer: fits the one-byte form");
            }
            return val;
        }
        case 0b10: {
            uint32_t raw = read_u32_le();
            uint64_t val = raw >> 2;
            if (val < (1u << 14)) {
                current_ptr = begin_ptr + start;
                fail("non-canonical compact integer: fits the two-byte form");
            }
            return val;
        }
        default:
            ++current_ptr;
            return read_compact_big(first, 8);
    }
}

uint32_t Reader::read_compact_u32() {
    size_t start = offset();
    uint64_t val = read_compact_u64();
    if (val > 0xFFFFFFFFull) {
        current_ptr = begin_ptr + start;
        fail("compact integer does not fit in 32 bits");
    }
    return static_cast<uint32_t>(val);
}

size_t Reader::read_length() {
    size_t start = offset();
    uint64_t len = read_compact_u64();
    if (len > remaining_bytes()) {
        current_ptr = begin_ptr + start;
        fail(detail::format("length prefix %llu exceeds the %zu remaining bytes",
                            static_cast<unsigned long long>(len), remaining_bytes()));
    }
    return static_cast<size_t>(len);
}

std::string Reader::read_string() {
    size_t start = offset();
    size_t len = read_length();
    std::string result(reinterpret_cast<const char*>(current_ptr), len);
    if (!is_valid_utf8(result)) {
        current_ptr = begin_ptr + start;
        fail("string is not valid UTF-8");
    }
    current_ptr += len;
    return result;
}

std::vector<uint8_t> Reader::read_bytes() {
    size_t len = read_length();
    std::vector<uint8_t> result(current_ptr, current_ptr + len);
    current_ptr += len;
    return result;
}

void Reader::read_fixed(uint8_t* out, size_t count) {
    check_available(count);
    std::copy(current_ptr, current_ptr + count, out);
    current_ptr += count;
}

uint8_t Reader::read_tag(std::string_view what, uint8_t max_tag) {
    uint8_t tag = read_u8();
    if (tag > max_tag) {
        --current_ptr;
        fail(detail::format("invalid %.*s discriminant %u",
                            static_cast<int>(what.size()), what.data(), static_cast<unsigned>(tag)));
    }
    return tag;
}

void Reader::expect_end() const {
    if (!is_eos()) {
        fail(detail::format("%zu trailing bytes after a complete value", remaining_bytes()));
    }
}

} // namespace ChainMeta::scale
