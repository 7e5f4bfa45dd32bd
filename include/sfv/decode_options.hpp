#pragma once

/// @file decode_options.hpp
/// @brief Decoder configuration: how declared field names map onto
/// structural keys.
///
/// Available strategies:
///   - Verbatim: field names are used as keys unchanged (default)
///   - Lowercase: field names are lowercased (structured header keys are
///     always lowercase)
///   - Custom: a caller-supplied name transform

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace sfv {

enum class KeyDecodingStrategy : uint8_t {
    verbatim  = 0,
    lowercase = 1,
    custom    = 2,
};

/// @brief Decoder configuration, fixed before a decode begins.
struct DecodeOptions {
    KeyDecodingStrategy key_strategy = KeyDecodingStrategy::verbatim;

    /// Used only when key_strategy is custom.
    std::function<std::string(std::string_view)> key_transform;

    /// Apply the strategy to a declared field name.
    [[nodiscard]] std::string transform_key(std::string_view field) const {
        switch (key_strategy) {
            case KeyDecodingStrategy::verbatim:
                break;
            case KeyDecodingStrategy::lowercase: {
                std::string out(field);
                std::transform(out.begin(), out.end(), out.begin(), [](char c) {
                    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
                });
                return out;
            }
            case KeyDecodingStrategy::custom:
                if (key_transform) return key_transform(field);
                break;
        }
        return std::string(field);
    }

    // ─── Factory methods ─────────────────────────────────────────────────

    static DecodeOptions verbatim() {
        return {};
    }

    static DecodeOptions lowercase() {
        DecodeOptions opts;
        opts.key_strategy = KeyDecodingStrategy::lowercase;
        return opts;
    }

    static DecodeOptions custom(std::function<std::string(std::string_view)> fn) {
        DecodeOptions opts;
        opts.key_strategy  = KeyDecodingStrategy::custom;
        opts.key_transform = std::move(fn);
        return opts;
    }
};

} // namespace sfv
