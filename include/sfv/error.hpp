#pragma once

/// @file error.hpp
/// @brief Error types for sfv: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: TypeError, IntegerOutOfRangeError, ... (default)
///   - Via error_code: sfv::errc enum + sfv_category() (exception-free)
///
/// Use StructuredFieldValueDecoder::try_decode() for exception-free decoding.

#include "coding_path.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace sfv {

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief Decoding error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    wrong_kind_for_item   = 1,
    integer_out_of_range  = 2,
    unsupported_operation = 3,
    key_not_found         = 4,
    value_not_found       = 5,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class sfv_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "structured-header";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                    return "success";
            case errc::wrong_kind_for_item:   return "wrong kind for item";
            case errc::integer_out_of_range:  return "integer out of range";
            case errc::unsupported_operation: return "unsupported operation";
            case errc::key_not_found:         return "key not found";
            case errc::value_not_found:       return "value not found";
            default:                          return "unknown structured header error";
        }
    }

    /// unsupported_operation also satisfies the wrong_kind_for_item condition:
    /// a container that cannot be super-decoded is a kind mismatch for it.
    bool equivalent(int code, const std::error_condition& cond) const noexcept override {
        if (cond.category() == *this &&
            code == static_cast<int>(errc::unsupported_operation) &&
            cond.value() == static_cast<int>(errc::wrong_kind_for_item))
            return true;
        return std::error_category::equivalent(code, cond);
    }
};

} // namespace detail

/// @brief Get the structured header error category singleton.
inline const std::error_category& sfv_category() noexcept {
    static const detail::sfv_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from sfv::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), sfv_category()};
}

/// @brief Create an error_condition from sfv::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), sfv_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Base decoding error with the coding path at the point of failure.
class DecodingError : public std::system_error {
public:
    DecodingError(errc code, const std::string& message, CodingPath path)
        : std::system_error(make_error_code(code), format_message(message, path))
        , path_(std::move(path)) {}

    /// @brief Coding path captured when the error was raised.
    [[nodiscard]] const CodingPath& coding_path() const noexcept {
        return path_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const CodingPath& path) {
        return "structured header decode error at " + to_string(path) + ": " + msg;
    }

    CodingPath path_;
};

/// @brief The node cannot satisfy the requested type or container shape.
class TypeError : public DecodingError {
public:
    TypeError(const std::string& msg, CodingPath path)
        : DecodingError(errc::wrong_kind_for_item, msg, std::move(path)) {}
};

/// @brief Integer not representable in the requested width.
class IntegerOutOfRangeError : public DecodingError {
public:
    IntegerOutOfRangeError(const std::string& msg, CodingPath path)
        : DecodingError(errc::integer_out_of_range, msg, std::move(path)) {}
};

/// @brief Operation the container never supports (e.g. super decoding).
class UnsupportedOperationError : public DecodingError {
public:
    UnsupportedOperationError(const std::string& msg, CodingPath path)
        : DecodingError(errc::unsupported_operation, msg, std::move(path)) {}
};

/// @brief Key absent from the current dictionary, parameter map or record.
class KeyNotFoundError : public DecodingError {
public:
    KeyNotFoundError(const std::string& msg, CodingPath path)
        : DecodingError(errc::key_not_found, msg, std::move(path)) {}
};

/// @brief Sequence exhausted.
class ValueNotFoundError : public DecodingError {
public:
    ValueNotFoundError(const std::string& msg, CodingPath path)
        : DecodingError(errc::value_not_found, msg, std::move(path)) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = decoder.try_decode<T>(dict);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace sfv

// Register sfv::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<sfv::errc> : true_type {};
} // namespace std
