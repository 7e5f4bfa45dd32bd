#pragma once

/// @file keyed_item_decoder.hpp
/// @brief Keyed container over an item: fields "item" and "parameters".

#include "coding_path.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sfv {

class KeyedItemDecoder {
public:
    KeyedItemDecoder(const Item& item, Decoder& decoder)
        : item_(&item), decoder_(&decoder), path_(decoder.coding_path()) {}

    [[nodiscard]] const CodingPath& coding_path() const noexcept { return path_; }

    [[nodiscard]] std::vector<CodingKey> all_keys() const {
        return {CodingKey(field_name(ItemField::item)),
                CodingKey(field_name(ItemField::parameters))};
    }

    [[nodiscard]] bool contains(const CodingKey& key) const noexcept {
        return item_field(key.string_value()) != ItemField::unknown;
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
        throw UnsupportedOperationError("item does not support super decoding", path_);
    }
    Decoder& super_decoder(const CodingKey&) const { return super_decoder(); }

private:
    Element element_for(const CodingKey& key) const {
        switch (item_field(key.string_value())) {
            case ItemField::item:       return Element(&item_->bare_item);
            case ItemField::parameters: return Element(&item_->parameters);
            case ItemField::unknown:    break;
        }
        CodingPath at = path_;
        at.push_back(key);
        throw KeyNotFoundError("item has no field \"" + key.string_value() + "\"",
                               std::move(at));
    }

    const Item* item_;
    Decoder* decoder_;
    CodingPath path_;
};

} // namespace sfv
