#include "chainmeta/scale/writer.h"

#include "chainmeta/scale/reader.h"

namespace ChainMeta::scale {

void Writer::write_u16_le(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value));
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void Writer::write_u32_le(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void Writer::write_u64_le(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void Writer::write_compact(uint64_t value) {
    if (value < (1ull << 6)) {
        write_u8(static_cast<uint8_t>(value << 2));
    } else if (value < (1ull << 14)) {
        write_u16_le(static_cast<uint16_t>((value << 2) | 0b01));
    } else if (value < (1ull << 30)) {
        write_u32_le(static_cast<uint32_t>((value << 2) | 0b10));
    } else {
        uint8_t len = 0;
        for (uint64_t rest = value; rest != 0; rest >>= 8) {
            ++len;
        }
        write_u8(static_cast<uint8_t>(((len - 4) << 2) | 0b11));
        for (uint8_t i = 0; i < len; ++i) {
            buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
}

void Writer::write_string(std::string_view value) {
    if (!is_valid_utf8(value)) {
        throw EncodeError("string is not valid UTF-8");
    }
    write_length(value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void Writer::write_bytes(std::span<const uint8_t> value) {
    write_length(value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void Writer::write_fixed(std::span<const uint8_t> value) {
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

} // namespace ChainMeta::scale
