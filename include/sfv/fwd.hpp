#pragma once

/// @file fwd.hpp
/// @brief Forward declarations, kind enums and type aliases for sfv.

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sfv {

// ─── Forward declarations ───────────────────────────────────────────────
template <typename K, typename V> class OrderedMap;
class BareItem;
struct Item;
struct InnerList;
class Decoder;

/// Bare item kinds
enum class ItemKind : uint8_t {
    Integer      = 0,
    Decimal      = 1,
    String       = 2,
    Token        = 3,
    Boolean      = 4,
    ByteSequence = 5
};

/// @brief Returns the string representation of an item kind.
inline const char* kind_name(ItemKind k) noexcept {
    switch (k) {
        case ItemKind::Integer:      return "integer";
        case ItemKind::Decimal:      return "decimal";
        case ItemKind::String:       return "string";
        case ItemKind::Token:        return "token";
        case ItemKind::Boolean:      return "boolean";
        case ItemKind::ByteSequence: return "byte sequence";
    }
    return "unknown";
}

// ─── Fixed key sets ─────────────────────────────────────────────────────

/// The two fields an inner list exposes to keyed decoding.
enum class InnerListField : uint8_t { items, parameters, unknown };

/// The two fields an item exposes to keyed decoding.
enum class ItemField : uint8_t { item, parameters, unknown };

inline InnerListField inner_list_field(std::string_view key) noexcept {
    if (key == "items")      return InnerListField::items;
    if (key == "parameters") return InnerListField::parameters;
    return InnerListField::unknown;
}

inline ItemField item_field(std::string_view key) noexcept {
    if (key == "item")       return ItemField::item;
    if (key == "parameters") return ItemField::parameters;
    return ItemField::unknown;
}

inline const char* field_name(InnerListField f) noexcept {
    switch (f) {
        case InnerListField::items:      return "items";
        case InnerListField::parameters: return "parameters";
        case InnerListField::unknown:    break;
    }
    return "unknown";
}

inline const char* field_name(ItemField f) noexcept {
    switch (f) {
        case ItemField::item:       return "item";
        case ItemField::parameters: return "parameters";
        case ItemField::unknown:    break;
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// Parameters attached to an item or inner list: token -> bare item.
using Parameters = OrderedMap<std::string, BareItem>;

/// The bare items of an inner list.
using BareInnerList = std::vector<BareItem>;

/// A list or dictionary member.
using ItemOrInnerList = std::variant<Item, InnerList>;

/// Top-level list.
using List = std::vector<ItemOrInnerList>;

/// Top-level dictionary.
using Dictionary = OrderedMap<std::string, ItemOrInnerList>;

} // namespace sfv
