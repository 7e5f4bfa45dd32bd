#pragma once

/// @file value.hpp
/// @brief Structured header value tree: BareItem, Item, InnerList.
///
/// Implementation:
///   - BareItem is a closed tagged union over integer, decimal, string,
///     token, boolean and byte sequence
///   - Values are produced by a parser (or built by hand) and are not
///     modified afterwards
///   - Typed accessors throw TypeError on kind mismatch

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "ordered_map.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sfv {

/// @brief Fixed-point decimal with three fractional digits.
///
/// Stored as a signed count of thousandths: 1.5 is Decimal::from_thousandths(1500).
class Decimal {
public:
    constexpr Decimal() noexcept = default;

    [[nodiscard]] static constexpr Decimal from_thousandths(int64_t v) noexcept {
        Decimal d;
        d.thousandths_ = v;
        return d;
    }

    [[nodiscard]] constexpr int64_t thousandths() const noexcept { return thousandths_; }

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(thousandths_) / 1000.0;
    }

    constexpr bool operator==(Decimal o) const noexcept { return thousandths_ == o.thousandths_; }
    constexpr bool operator!=(Decimal o) const noexcept { return thousandths_ != o.thousandths_; }

private:
    int64_t thousandths_ = 0;
};

/// @brief Bare identifier text. Decodes as text, like a string.
struct Token {
    std::string value;

    bool operator==(const Token& o) const { return value == o.value; }
    bool operator!=(const Token& o) const { return value != o.value; }
};

/// @brief Raw bytes. Present for completeness of the value model; no
/// decode path accepts it.
struct ByteSequence {
    std::vector<uint8_t> bytes;

    bool operator==(const ByteSequence& o) const { return bytes == o.bytes; }
    bool operator!=(const ByteSequence& o) const { return bytes != o.bytes; }
};

class BareItem {
public:
    // Alternative order matches ItemKind.
    using storage_type = std::variant<int64_t, Decimal, std::string, Token, bool, ByteSequence>;

    BareItem() noexcept : v_(int64_t{0}) {}
    BareItem(int v) noexcept : v_(static_cast<int64_t>(v)) {}
    BareItem(int64_t v) noexcept : v_(v) {}
    BareItem(Decimal v) noexcept : v_(v) {}
    BareItem(bool v) noexcept : v_(v) {}
    BareItem(const char* v) : v_(std::string(v)) {}
    BareItem(std::string_view v) : v_(std::string(v)) {}
    BareItem(std::string v) : v_(std::move(v)) {}
    BareItem(Token v) : v_(std::move(v)) {}
    BareItem(ByteSequence v) : v_(std::move(v)) {}

    [[nodiscard]] ItemKind kind() const noexcept { return static_cast<ItemKind>(v_.index()); }
    [[nodiscard]] bool is_integer()  const noexcept { return kind() == ItemKind::Integer; }
    [[nodiscard]] bool is_decimal()  const noexcept { return kind() == ItemKind::Decimal; }
    [[nodiscard]] bool is_string()   const noexcept { return kind() == ItemKind::String; }
    [[nodiscard]] bool is_token()    const noexcept { return kind() == ItemKind::Token; }
    [[nodiscard]] bool is_bool()     const noexcept { return kind() == ItemKind::Boolean; }
    [[nodiscard]] bool is_bytes()    const noexcept { return kind() == ItemKind::ByteSequence; }

    int64_t as_integer() const { return get<int64_t>(ItemKind::Integer); }
    Decimal as_decimal() const { return get<Decimal>(ItemKind::Decimal); }
    bool as_bool() const { return get<bool>(ItemKind::Boolean); }
    [[nodiscard]] const std::string& as_string() const { return get<std::string>(ItemKind::String); }
    [[nodiscard]] const std::string& as_token() const { return get<Token>(ItemKind::Token).value; }
    [[nodiscard]] const ByteSequence& as_bytes() const { return get<ByteSequence>(ItemKind::ByteSequence); }

    [[nodiscard]] const storage_type& storage() const noexcept { return v_; }

    bool operator==(const BareItem& o) const { return v_ == o.v_; }
    bool operator!=(const BareItem& o) const { return !(v_ == o.v_); }

private:
    template <typename T>
    const T& get(ItemKind expected) const {
        const T* p = std::get_if<T>(&v_);
        if (SFV_UNLIKELY(!p))
            throw TypeError(std::string("expected ") + kind_name(expected) +
                            ", got " + kind_name(kind()), {});
        return *p;
    }

    storage_type v_;
};

/// @brief A bare item with its parameters.
struct Item {
    BareItem bare_item;
    Parameters parameters;

    bool operator==(const Item& o) const {
        return bare_item == o.bare_item && parameters == o.parameters;
    }
    bool operator!=(const Item& o) const { return !(*this == o); }
};

/// @brief An ordered sequence of bare items with attached parameters.
struct InnerList {
    BareInnerList items;
    Parameters parameters;

    bool operator==(const InnerList& o) const {
        return items == o.items && parameters == o.parameters;
    }
    bool operator!=(const InnerList& o) const { return !(*this == o); }
};

// ─── Stream output (debug rendering) ────────────────────────────────────

inline std::ostream& operator<<(std::ostream& os, Decimal d) {
    // Magnitude in uint64_t: INT64_MIN has no positive int64_t counterpart.
    const int64_t t = d.thousandths();
    uint64_t v = static_cast<uint64_t>(t);
    if (t < 0) {
        os << '-';
        v = 0 - v;
    }
    os << v / 1000 << '.';
    const uint64_t frac = v % 1000;
    if (frac < 100) os << '0';
    if (frac < 10) os << '0';
    return os << frac;
}

inline std::ostream& operator<<(std::ostream& os, const BareItem& item) {
    switch (item.kind()) {
        case ItemKind::Integer:      return os << item.as_integer();
        case ItemKind::Decimal:      return os << item.as_decimal();
        case ItemKind::String:       return os << '"' << item.as_string() << '"';
        case ItemKind::Token:        return os << item.as_token();
        case ItemKind::Boolean:      return os << (item.as_bool() ? "?1" : "?0");
        case ItemKind::ByteSequence: return os << ':' << item.as_bytes().bytes.size() << " bytes:";
    }
    return os;
}

} // namespace sfv
