#pragma once

/// @file keyed_map_decoder.hpp
/// @brief Keyed container over a dictionary or a parameter map.
///
/// Keys are the map's own keys, in map order. Dictionary members resolve to
/// an item or an inner list; parameters resolve to a bare item.

#include "coding_path.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sfv {

template <typename Map>
class KeyedMapDecoder {
    static_assert(std::is_same_v<Map, Dictionary> || std::is_same_v<Map, Parameters>,
                  "KeyedMapDecoder supports Dictionary and Parameters");

public:
    KeyedMapDecoder(const Map& map, Decoder& decoder)
        : map_(&map), decoder_(&decoder), path_(decoder.coding_path()) {}

    [[nodiscard]] const CodingPath& coding_path() const noexcept { return path_; }

    [[nodiscard]] std::vector<CodingKey> all_keys() const {
        std::vector<CodingKey> keys;
        keys.reserve(map_->size());
        for (const auto& entry : *map_) keys.emplace_back(entry.first);
        return keys;
    }

    [[nodiscard]] bool contains(const CodingKey& key) const noexcept {
        return map_->contains(key.string_value());
    }
    [[nodiscard]] bool contains(std::string_view field) const {
        return contains(decoder_->make_key(field));
    }

    [[nodiscard]] bool decode_nil(const CodingKey&) const noexcept { return false; }
    [[nodiscard]] bool decode_nil(std::string_view) const noexcept { return false; }

    template <typename T>
    T decode(const CodingKey& key) const {
        PathGuard guard(*decoder_, path_, key, element_for(key));
        return decoder_->decode<T>();
    }
    template <typename T>
    T decode(std::string_view field) const {
        return decode<T>(decoder_->make_key(field));
    }

    // Defined in keyed_container.hpp
    KeyedDecodingContainer nested_container(const CodingKey& key) const;
    UnkeyedDecoder nested_unkeyed_container(const CodingKey& key) const;

    Decoder& super_decoder() const {
        throw UnsupportedOperationError(
            std::string(std::is_same_v<Map, Dictionary> ? "dictionary" : "parameters") +
            " does not support super decoding", path_);
    }
    Decoder& super_decoder(const CodingKey&) const { return super_decoder(); }

private:
    Element element_for(const CodingKey& key) const {
        const auto* value = map_->find(key.string_value());
        if (SFV_UNLIKELY(!value)) {
            CodingPath at = path_;
            at.push_back(key);
            throw KeyNotFoundError("key not found: \"" + key.string_value() + "\"",
                                   std::move(at));
        }
        if constexpr (std::is_same_v<Map, Dictionary>) {
            return Element::member(*value);
        } else {
            return Element(value);
        }
    }

    const Map* map_;
    Decoder* decoder_;
    CodingPath path_;
};

} // namespace sfv
