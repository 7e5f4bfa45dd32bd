#pragma once

/// @file bare_item_decoder.hpp
/// @brief Single-value container: one bare item -> one C++ scalar.
///
/// Conversions:
///   - integer    -> any integral type except bool, if exactly representable
///   - decimal    -> float / double (through double)
///   - string     -> std::string
///   - token      -> std::string
///   - boolean    -> bool
/// Everything else is a kind mismatch; nothing is coerced.

#include "coding_path.hpp"
#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace sfv {

class BareItemDecoder {
public:
    BareItemDecoder(const BareItem& item, CodingPath path)
        : item_(&item), path_(std::move(path)) {}

    [[nodiscard]] const CodingPath& coding_path() const noexcept { return path_; }
    [[nodiscard]] const BareItem& item() const noexcept { return *item_; }

    /// Bare items have no null variant.
    [[nodiscard]] bool decode_nil() const noexcept { return false; }

    template <typename T>
    [[nodiscard]] T decode() const {
        if constexpr (std::is_same_v<T, bool>) {
            if (SFV_UNLIKELY(!item_->is_bool())) throw_wrong_kind("boolean");
            return item_->as_bool();
        } else if constexpr (std::is_integral_v<T>) {
            return decode_integer<T>();
        } else if constexpr (std::is_floating_point_v<T>) {
            if (SFV_UNLIKELY(!item_->is_decimal())) throw_wrong_kind("decimal");
            // Precision beyond double is not recovered.
            return static_cast<T>(item_->as_decimal().to_double());
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (item_->is_string()) return item_->as_string();
            if (item_->is_token())  return item_->as_token();
            throw_wrong_kind("string or token");
        } else {
            throw TypeError(std::string("cannot decode ") + kind_name(item_->kind()) +
                            " as the requested type", path_);
        }
    }

private:
    template <typename T>
    T decode_integer() const {
        if (SFV_UNLIKELY(!item_->is_integer())) throw_wrong_kind("integer");
        const int64_t v = item_->as_integer();
        bool fits;
        if constexpr (std::is_signed_v<T>) {
            fits = v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                   v <= static_cast<int64_t>(std::numeric_limits<T>::max());
        } else {
            fits = v >= 0 &&
                   static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        }
        if (SFV_UNLIKELY(!fits))
            throw IntegerOutOfRangeError(
                "integer " + std::to_string(v) + " out of range for " +
                std::to_string(std::numeric_limits<T>::digits + (std::is_signed_v<T> ? 1 : 0)) +
                "-bit " + (std::is_signed_v<T> ? "signed" : "unsigned") + " integer",
                path_);
        return static_cast<T>(v);
    }

    [[noreturn]] void throw_wrong_kind(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " +
                        kind_name(item_->kind()), path_);
    }

    const BareItem* item_;
    CodingPath path_;
};

} // namespace sfv
