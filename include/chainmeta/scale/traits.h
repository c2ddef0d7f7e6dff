#ifndef CHAINMETA_SCALE_TRAITS_H
#define CHAINMETA_SCALE_TRAITS_H

#include <algorithm>
#include <array>
#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "reader.h"
#include "writer.h"

namespace ChainMeta::scale {

/// Upper bound on what a sequence decoder allocates before its elements are read.
inline constexpr size_t kMaxReserveBytes = 64 * 1024;

// ============================================================================
// CORE CONCEPTS
// ============================================================================

/**
 * Concepts for types that describe their own wire form.
 * Schema records implement `void scale_encode(Writer&) const` and
 * `static T scale_decode(Reader&)`.
 */
template<typename T>
concept HasMemberEncode = requires(const T& t, Writer& w) {
    { t.scale_encode(w) } -> std::same_as<void>;
};

template<typename T>
concept HasStaticDecode = requires(Reader& r) {
    { T::scale_decode(r) } -> std::same_as<T>;
};

/**
 * Primary template for serialization traits.
 * Specialize this for types that cannot carry member functions.
 */
template<typename T>
struct scale_traits {
    static void encode(Writer& writer, const T& value) {
        if constexpr (HasMemberEncode<T>) {
            value.scale_encode(writer);
        } else {
            static_assert(sizeof(T) == 0, "Type must implement scale_encode or specialize scale_traits");
        }
    }

    static T decode(Reader& reader) {
        if constexpr (HasStaticDecode<T>) {
            return T::scale_decode(reader);
        } else {
            static_assert(sizeof(T) == 0, "Type must implement scale_decode or specialize scale_traits");
        }
    }
};

template<typename T>
void encode(Writer& writer, const T& value) {
    scale_traits<T>::encode(writer, value);
}

template<typename T>
T decode(Reader& reader) {
    return scale_traits<T>::decode(reader);
}

/// Decodes one field under its name so failures report where they happened.
template<typename T>
T decode_field(Reader& reader, const char* name) {
    FieldScope scope(reader, name);
    return scale_traits<T>::decode(reader);
}

// ============================================================================
// COMPACT INTEGERS
// ============================================================================

/// Marks an unsigned integer that travels in compact form.
template<typename T>
struct Compact {
    static_assert(std::same_as<T, uint32_t> || std::same_as<T, uint64_t>,
                  "Compact supports uint32_t and uint64_t");
    T value{};

    bool operator==(const Compact&) const = default;
    auto operator<=>(const Compact&) const = default;
};

template<typename T>
struct scale_traits<Compact<T>> {
    static void encode(Writer& writer, const Compact<T>& value) {
        writer.write_compact(value.value);
    }
    static Compact<T> decode(Reader& reader) {
        if constexpr (std::same_as<T, uint32_t>) {
            return Compact<T>{reader.read_compact_u32()};
        } else {
            return Compact<T>{reader.read_compact_u64()};
        }
    }
};

// ============================================================================
// PRIMITIVES
// ============================================================================

template<> struct scale_traits<bool> {
    static void encode(Writer& w, bool v) { w.write_bool(v); }
    static bool decode(Reader& r) { return r.read_bool(); }
};

template<> struct scale_traits<uint8_t> {
    static void encode(Writer& w, uint8_t v) { w.write_u8(v); }
    static uint8_t decode(Reader& r) { return r.read_u8(); }
};

template<> struct scale_traits<uint16_t> {
    static void encode(Writer& w, uint16_t v) { w.write_u16_le(v); }
    static uint16_t decode(Reader& r) { return r.read_u16_le(); }
};

template<> struct scale_traits<uint32_t> {
    static void encode(Writer& w, uint32_t v) { w.write_u32_le(v); }
    static uint32_t decode(Reader& r) { return r.read_u32_le(); }
};

template<> struct scale_traits<uint64_t> {
    static void encode(Writer& w, uint64_t v) { w.write_u64_le(v); }
    static uint64_t decode(Reader& r) { return r.read_u64_le(); }
};

template<> struct scale_traits<std::string> {
    static void encode(Writer& w, const std::string& v) { w.write_string(v); }
    static std::string decode(Reader& r) { return r.read_string(); }
};

// ============================================================================
// CONTAINERS
// ============================================================================

/// Byte blobs: compact length followed by the raw bytes.
template<> struct scale_traits<std::vector<uint8_t>> {
    static void encode(Writer& w, const std::vector<uint8_t>& v) { w.write_bytes(v); }
    static std::vector<uint8_t> decode(Reader& r) { return r.read_bytes(); }
};

template<size_t N>
struct scale_traits<std::array<uint8_t, N>> {
    static void encode(Writer& w, const std::array<uint8_t, N>& v) { w.write_fixed(v); }
    static std::array<uint8_t, N> decode(Reader& r) {
        std::array<uint8_t, N> out{};
        r.read_fixed(out.data(), N);
        return out;
    }
};

template<typename T>
struct scale_traits<std::vector<T>> {
    static void encode(Writer& w, const std::vector<T>& value) {
        w.write_length(value.size());
        for (const auto& item : value) {
            scale::encode(w, item);
        }
    }

    static std::vector<T> decode(Reader& r) {
        size_t size = r.read_length();
        std::vector<T> result;
        // The length is only bounded by the input size, not by sizeof(T)
        result.reserve(std::min(size, kMaxReserveBytes / sizeof(T)));
        for (size_t i = 0; i < size; ++i) {
            FieldScope scope(r, "[" + std::to_string(i) + "]");
            result.push_back(scale::decode<T>(r));
        }
        return result;
    }
};

template<typename T>
struct scale_traits<std::optional<T>> {
    static void encode(Writer& w, const std::optional<T>& value) {
        if (value.has_value()) {
            w.write_u8(1);
            scale::encode(w, *value);
        } else {
            w.write_u8(0);
        }
    }

    static std::optional<T> decode(Reader& r) {
        uint8_t tag = r.read_tag("Option", 1);
        if (tag == 0) {
            return std::nullopt;
        }
        return scale::decode<T>(r);
    }
};

/**
 * Ordered maps travel as a sequence of (key, value) pairs in ascending key
 * order. Unsorted or repeated keys are rejected so that every decoded map
 * re-encodes to the same bytes.
 */
template<typename K, typename V>
struct scale_traits<std::map<K, V>> {
    static void encode(Writer& w, const std::map<K, V>& value) {
        w.write_length(value.size());
        for (const auto& [key, item] : value) {
            scale::encode(w, key);
            scale::encode(w, item);
        }
    }

    static std::map<K, V> decode(Reader& r) {
        size_t size = r.read_length();
        std::map<K, V> result;
        for (size_t i = 0; i < size; ++i) {
            FieldScope scope(r, "[" + std::to_string(i) + "]");
            K key = scale::decode<K>(r);
            if (!result.empty() && !(result.rbegin()->first < key)) {
                r.fail("map keys are not in strictly ascending order");
            }
            V item = scale::decode<V>(r);
            result.emplace_hint(result.end(), std::move(key), std::move(item));
        }
        return result;
    }
};

// ============================================================================
// WHOLE-BUFFER HELPERS
// ============================================================================

template<typename T>
std::vector<uint8_t> to_bytes(const T& value) {
    Writer writer;
    scale::encode(writer, value);
    return writer.take_buffer();
}

/// Decodes a complete value; trailing input is an error.
template<typename T>
T from_bytes(std::span<const uint8_t> bytes) {
    Reader reader(bytes);
    T value = scale::decode<T>(reader);
    reader.expect_end();
    return value;
}

} // namespace ChainMeta::scale

#endif // CHAINMETA_SCALE_TRAITS_H
