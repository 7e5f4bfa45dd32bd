#pragma once

/// @file keyed_container.hpp
/// @brief KeyedDecodingContainer: the keyed container handed out by a Decoder.
///
/// A closed wrapper over the four keyed adapters (dictionary, parameters,
/// item, inner list). Field-level helpers live here:
///   - decode<T>(field)            required field
///   - decode_if_present<T>(field) absent -> std::nullopt
///   - decode(field, out)          out-parameter form used by
///                                 SFV_DEFINE_DECODABLE; std::optional
///                                 members take the if-present path
///
/// Also defines the Decoder's container dispatch and the adapters'
/// nested_container() / nested_unkeyed_container(), which need every
/// container type to be complete.

#include "bare_item_decoder.hpp"
#include "coding_path.hpp"
#include "decoder.hpp"
#include "keyed_inner_list_decoder.hpp"
#include "keyed_item_decoder.hpp"
#include "keyed_map_decoder.hpp"
#include "unkeyed_decoder.hpp"

#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace sfv {

class KeyedDecodingContainer {
public:
    using storage_type = std::variant<KeyedMapDecoder<Dictionary>, KeyedMapDecoder<Parameters>,
                                      KeyedItemDecoder, KeyedInnerListDecoder>;

    template <typename Impl,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, KeyedDecodingContainer>>>
    explicit KeyedDecodingContainer(Impl impl) : impl_(std::move(impl)) {}

    [[nodiscard]] const CodingPath& coding_path() const noexcept {
        return std::visit([](const auto& c) -> const CodingPath& { return c.coding_path(); }, impl_);
    }

    [[nodiscard]] std::vector<CodingKey> all_keys() const {
        return std::visit([](const auto& c) { return c.all_keys(); }, impl_);
    }

    [[nodiscard]] bool contains(const CodingKey& key) const {
        return std::visit([&](const auto& c) { return c.contains(key); }, impl_);
    }
    [[nodiscard]] bool contains(std::string_view field) const {
        return std::visit([&](const auto& c) { return c.contains(field); }, impl_);
    }

    [[nodiscard]] bool decode_nil(const CodingKey& key) const {
        return std::visit([&](const auto& c) { return c.decode_nil(key); }, impl_);
    }
    [[nodiscard]] bool decode_nil(std::string_view field) const {
        return std::visit([&](const auto& c) { return c.decode_nil(field); }, impl_);
    }

    template <typename T>
    T decode(const CodingKey& key) const {
        return std::visit([&](const auto& c) -> T { return c.template decode<T>(key); }, impl_);
    }
    template <typename T>
    T decode(std::string_view field) const {
        return std::visit([&](const auto& c) -> T { return c.template decode<T>(field); }, impl_);
    }

    template <typename T>
    std::optional<T> decode_if_present(const CodingKey& key) const {
        if (!contains(key) || decode_nil(key)) return std::nullopt;
        return decode<T>(key);
    }
    template <typename T>
    std::optional<T> decode_if_present(std::string_view field) const {
        return std::visit([&](const auto& c) -> std::optional<T> {
            if (!c.contains(field) || c.decode_nil(field)) return std::nullopt;
            return c.template decode<T>(field);
        }, impl_);
    }

    template <typename T>
    void decode(std::string_view field, T& out) const {
        out = decode<T>(field);
    }
    template <typename T>
    void decode(std::string_view field, std::optional<T>& out) const {
        out = decode_if_present<T>(field);
    }

    [[nodiscard]] KeyedDecodingContainer nested_container(const CodingKey& key) const {
        return std::visit([&](const auto& c) { return c.nested_container(key); }, impl_);
    }
    [[nodiscard]] UnkeyedDecoder nested_unkeyed_container(const CodingKey& key) const {
        return std::visit([&](const auto& c) { return c.nested_unkeyed_container(key); }, impl_);
    }

    Decoder& super_decoder() const {
        return std::visit([](const auto& c) -> Decoder& { return c.super_decoder(); }, impl_);
    }
    Decoder& super_decoder(const CodingKey& key) const {
        return std::visit([&](const auto& c) -> Decoder& { return c.super_decoder(key); }, impl_);
    }

    /// The concrete adapter, for callers that need it.
    [[nodiscard]] const storage_type& storage() const noexcept { return impl_; }

private:
    storage_type impl_;
};

// =====================================================================
// Decoder container dispatch
// =====================================================================

inline BareItemDecoder Decoder::single_value_container() const {
    const Element& e = current();
    switch (e.kind()) {
        case ElementKind::BareItem: return BareItemDecoder(e.as<BareItem>(), path_);
        case ElementKind::Item:     return BareItemDecoder(e.as<Item>().bare_item, path_);
        default: break;
    }
    throw_shape_mismatch("a single value");
}

inline KeyedDecodingContainer Decoder::keyed_container() {
    const Element& e = current();
    switch (e.kind()) {
        case ElementKind::Dictionary:
            return KeyedDecodingContainer(KeyedMapDecoder<Dictionary>(e.as<Dictionary>(), *this));
        case ElementKind::Parameters:
            return KeyedDecodingContainer(KeyedMapDecoder<Parameters>(e.as<Parameters>(), *this));
        case ElementKind::Item:
            return KeyedDecodingContainer(KeyedItemDecoder(e.as<Item>(), *this));
        case ElementKind::InnerList:
            return KeyedDecodingContainer(KeyedInnerListDecoder(e.as<InnerList>(), *this));
        default: break;
    }
    throw_shape_mismatch("a keyed container");
}

inline UnkeyedDecoder Decoder::unkeyed_container() {
    const Element& e = current();
    switch (e.kind()) {
        case ElementKind::List:          return UnkeyedDecoder(e.as<List>(), *this);
        case ElementKind::BareInnerList: return UnkeyedDecoder(e.as<BareInnerList>(), *this);
        case ElementKind::InnerList:     return UnkeyedDecoder(e.as<InnerList>().items, *this);
        default: break;
    }
    throw_shape_mismatch("an unkeyed container");
}

// =====================================================================
// Nested containers: push -> dispatch -> guaranteed pop
// =====================================================================

inline KeyedDecodingContainer KeyedInnerListDecoder::nested_container(const CodingKey& key) const {
    PathGuard guard(*decoder_, path_, key, element_for(key));
    return decoder_->keyed_container();
}

inline UnkeyedDecoder KeyedInnerListDecoder::nested_unkeyed_container(const CodingKey& key) const {
    PathGuard guard(*decoder_, path_, key, element_for(key));
    return decoder_->unkeyed_container();
}

inline KeyedDecodingContainer KeyedItemDecoder::nested_container(const CodingKey& key) const {
    PathGuard guard(*decoder_, path_, key, element_for(key));
    return decoder_->keyed_container();
}

inline UnkeyedDecoder KeyedItemDecoder::nested_unkeyed_container(const CodingKey& key) const {
    PathGuard guard(*decoder_, path_, key, element_for(key));
    return decoder_->unkeyed_container();
}

template <typename Map>
KeyedDecodingContainer KeyedMapDecoder<Map>::nested_container(const CodingKey& key) const {
    PathGuard guard(*decoder_, path_, key, element_for(key));
    return decoder_->keyed_container();
}

template <typename Map>
UnkeyedDecoder KeyedMapDecoder<Map>::nested_unkeyed_container(const CodingKey& key) const {
    PathGuard guard(*decoder_, path_, key, element_for(key));
    return decoder_->unkeyed_container();
}

inline KeyedDecodingContainer UnkeyedDecoder::nested_container() {
    PathGuard guard(*decoder_, path_, CodingKey(index_), next_element());
    auto container = decoder_->keyed_container();
    ++index_;
    return container;
}

inline UnkeyedDecoder UnkeyedDecoder::nested_unkeyed_container() {
    PathGuard guard(*decoder_, path_, CodingKey(index_), next_element());
    auto container = decoder_->unkeyed_container();
    ++index_;
    return container;
}

} // namespace sfv
