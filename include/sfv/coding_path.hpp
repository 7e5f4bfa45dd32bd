#pragma once

/// @file coding_path.hpp
/// @brief Coding keys and the coding path used for error attribution.
///
/// A coding path is the trail of keys from the root of the value tree to
/// the node being decoded:
///   {}                   -> root
///   {"items", 0}         -> first bare item of an inner list
///   {"foo", "parameters", "q"}

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sfv {

/// @brief One segment of a coding path: a string key or a sequence index.
class CodingKey {
public:
    /// Keyed segment (dictionary key, parameter name or field name).
    explicit CodingKey(std::string key)
        : string_value_(std::move(key)) {}

    /// Sequence segment (position in a list or inner list).
    explicit CodingKey(size_t index)
        : string_value_(std::to_string(index)), int_value_(index) {}

    [[nodiscard]] const std::string& string_value() const noexcept { return string_value_; }
    [[nodiscard]] std::optional<size_t> int_value() const noexcept { return int_value_; }
    [[nodiscard]] bool is_index() const noexcept { return int_value_.has_value(); }

    bool operator==(const CodingKey& other) const {
        return int_value_ == other.int_value_ && string_value_ == other.string_value_;
    }
    bool operator!=(const CodingKey& other) const { return !(*this == other); }

private:
    std::string string_value_;
    std::optional<size_t> int_value_;
};

using CodingPath = std::vector<CodingKey>;

/// @brief Render a coding path for diagnostics, e.g. "foo.parameters.q" or "items[1]".
inline std::string to_string(const CodingPath& path) {
    if (path.empty()) return "<root>";
    std::string out;
    for (const auto& key : path) {
        if (key.is_index()) {
            out += '[';
            out += key.string_value();
            out += ']';
        } else {
            if (!out.empty()) out += '.';
            out += key.string_value();
        }
    }
    return out;
}

} // namespace sfv
