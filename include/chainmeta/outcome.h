#ifndef CHAINMETA_OUTCOME_H
#define CHAINMETA_OUTCOME_H

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "chainmeta/error_handling.h"

namespace ChainMeta {

template <typename T>
class Outcome;

// ==================== Outcome<T> ====================

template <typename T>
class [[nodiscard]] Outcome {
private:
    // index 0 = Ok(T), index 1 = Err(MetadataError)
    std::variant<T, MetadataError> value_;

    explicit Outcome(std::in_place_index_t<0>, T value)
        : value_(std::in_place_index<0>, std::move(value)) {}

    explicit Outcome(std::in_place_index_t<1>, MetadataError error)
        : value_(std::in_place_index<1>, std::move(error)) {}

public:
    using value_type = T;

    // ---- Factories ----
    static Outcome Ok(T value) {
        return Outcome(std::in_place_index<0>, std::move(value));
    }

    static Outcome Err(MetadataError error) {
        return Outcome(std::in_place_index<1>, std::move(error));
    }

    // Allows `return MetadataError::...;` from functions returning Outcome<T>
    Outcome(MetadataError error)
        : value_(std::in_place_index<1>, std::move(error)) {}

    // ---- State ----
    bool is_ok() const { return value_.index() == 0; }
    bool is_err() const { return value_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // ---- Accessors ----
    // Precondition: is_ok()
    T& value() & { return std::get<0>(value_); }
    const T& value() const & { return std::get<0>(value_); }
    T&& value() && { return std::get<0>(std::move(value_)); }

    // Precondition: is_err()
    const MetadataError& error() const & { return std::get<1>(value_); }
    MetadataError&& error() && { return std::get<1>(std::move(value_)); }

    template <typename U>
    T value_or(U&& fallback) const & {
        return is_ok() ? std::get<0>(value_) : T(std::forward<U>(fallback));
    }
};

// ==================== Outcome<void> specialization ====================

template <>
class [[nodiscard]] Outcome<void> {
private:
    std::optional<MetadataError> error_;

    explicit Outcome(std::nullopt_t) : error_(std::nullopt) {}

public:
    using value_type = void;

    Outcome(MetadataError error) : error_(std::move(error)) {}

    // ---- Factories ----
    static Outcome Ok() {
        return Outcome(std::nullopt);
    }

    static Outcome Err(MetadataError error) {
        return Outcome(std::move(error));
    }

    // ---- State ----
    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    // Precondition: is_err()
    const MetadataError& error() const & { return *error_; }
    MetadataError&& error() && { return std::move(*error_); }
};

// ==================== Free helper functions ====================

inline Outcome<void> Ok() {
    return Outcome<void>::Ok();
}

template <typename T>
inline Outcome<std::decay_t<T>> Ok(T&& value) {
    return Outcome<std::decay_t<T>>::Ok(std::forward<T>(value));
}

template <typename T>
inline Outcome<T> Err(MetadataError error) {
    return Outcome<T>::Err(std::move(error));
}

} // namespace ChainMeta

#endif // CHAINMETA_OUTCOME_H
