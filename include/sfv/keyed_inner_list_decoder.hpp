#pragma once

/// @file keyed_inner_list_decoder.hpp
/// @brief Keyed container over an inner list.
///
/// An inner list has exactly two fields:
///   "items"      -> the bare items, decoded as a sequence
///   "parameters" -> the parameter map
/// No other key is ever present, whatever the list contains.

#include "coding_path.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sfv {

class KeyedInnerListDecoder {
public:
    KeyedInnerListDecoder(const InnerList& list, Decoder& decoder)
        : list_(&list), decoder_(&decoder), path_(decoder.coding_path()) {}

    [[nodiscard]] const CodingPath& coding_path() const noexcept { return path_; }

    [[nodiscard]] std::vector<CodingKey> all_keys() const {
        return {CodingKey(field_name(InnerListField::items)),
                CodingKey(field_name(InnerListField::parameters))};
    }

    [[nodiscard]] bool contains(const CodingKey& key) const noexcept {
        return inner_list_field(key.string_value()) != InnerListField::unknown;
    }
    [[nodiscard]] bool contains(std::string_view field) const {
        return contains(decoder_->make_key(field));
    }

    /// Neither field is ever null.
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

    /// Inner lists never have a base representation.
    Decoder& super_decoder() const {
        throw UnsupportedOperationError("inner list does not support super decoding", path_);
    }
    Decoder& super_decoder(const CodingKey&) const { return super_decoder(); }

private:
    Element element_for(const CodingKey& key) const {
        switch (inner_list_field(key.string_value())) {
            case InnerListField::items:      return Element(&list_->items);
            case InnerListField::parameters: return Element(&list_->parameters);
            case InnerListField::unknown:    break;
        }
        CodingPath at = path_;
        at.push_back(key);
        throw KeyNotFoundError("inner list has no field \"" + key.string_value() + "\"",
                               std::move(at));
    }

    const InnerList* list_;
    Decoder* decoder_;
    CodingPath path_;
};

} // namespace sfv
