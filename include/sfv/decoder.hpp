#pragma once

/// @file decoder.hpp
/// @brief Decode context: coding-path stack and container dispatch.
///
/// A Decoder drives one decode over an immutable value tree. It owns:
///   - the coding path (keys from the root to the node being decoded)
///   - the element stack (views of the nodes along that path)
///   - the key-decoding strategy applied to declared field names
///
/// Containers descend through PathGuard, which pushes a key on construction
/// and pops it on destruction, so the path is restored on every exit,
/// including a thrown error from a nested decode.

#include "coding_path.hpp"
#include "config.hpp"
#include "decode_options.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sfv {

class BareItemDecoder;
class KeyedDecodingContainer;
class UnkeyedDecoder;

/// Node kinds a decoder can stand on.
enum class ElementKind : uint8_t {
    Dictionary    = 0,
    List          = 1,
    Item          = 2,
    InnerList     = 3,
    BareItem      = 4,
    BareInnerList = 5,
    Parameters    = 6
};

inline const char* element_kind_name(ElementKind k) noexcept {
    switch (k) {
        case ElementKind::Dictionary:    return "dictionary";
        case ElementKind::List:          return "list";
        case ElementKind::Item:          return "item";
        case ElementKind::InnerList:     return "inner list";
        case ElementKind::BareItem:      return "bare item";
        case ElementKind::BareInnerList: return "bare inner list";
        case ElementKind::Parameters:    return "parameters";
    }
    return "unknown";
}

/// @brief Non-owning view of one node in the value tree.
/// The tree must outlive every Element that refers into it.
class Element {
public:
    // Alternative order matches ElementKind.
    using storage_type = std::variant<const Dictionary*, const List*, const Item*,
                                      const InnerList*, const BareItem*,
                                      const BareInnerList*, const Parameters*>;

    template <typename T>
    explicit Element(const T* node) noexcept : v_(node) {}

    /// View of a list or dictionary member.
    static Element member(const ItemOrInnerList& m) noexcept {
        return std::visit([](const auto& node) { return Element(&node); }, m);
    }

    [[nodiscard]] ElementKind kind() const noexcept { return static_cast<ElementKind>(v_.index()); }

    template <typename T>
    [[nodiscard]] const T& as() const { return *std::get<const T*>(v_); }

private:
    storage_type v_;
};

class Decoder {
public:
    explicit Decoder(Element root, DecodeOptions options = {})
        : options_(std::move(options)) {
        elements_.push_back(root);
    }

    // Non-copyable: containers hold a pointer to their decoder.
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    [[nodiscard]] const CodingPath& coding_path() const noexcept { return path_; }
    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

    /// Element the next container request is answered from.
    [[nodiscard]] const Element& current() const noexcept { return elements_.back(); }

    /// Apply the key-decoding strategy to a declared field name.
    [[nodiscard]] CodingKey make_key(std::string_view field) const {
        return CodingKey(options_.transform_key(field));
    }

    /// Descend into @p child under @p key. Pair with pop(); prefer PathGuard.
    void push(CodingKey key, Element child) {
        elements_.push_back(child);
        try {
            path_.push_back(std::move(key));
        } catch (...) {
            elements_.pop_back();
            throw;
        }
    }

    void pop() noexcept {
        path_.pop_back();
        elements_.pop_back();
    }

    /// Decode the current element as T through its from_structured() hook.
    template <typename T>
    T decode() {
        T value{};
        from_structured(*this, value);
        return value;
    }

    // ─── Container dispatch (defined in keyed_container.hpp) ───────────

    /// Bare item, or the bare item of an item (parameters ignored).
    BareItemDecoder single_value_container() const;

    /// Dictionary, parameters, item or inner list.
    KeyedDecodingContainer keyed_container();

    /// List, bare inner list, or the items of an inner list.
    UnkeyedDecoder unkeyed_container();

private:
    friend class PathGuard;

    [[noreturn]] void throw_shape_mismatch(const char* requested) const {
        throw TypeError(std::string("cannot decode ") + requested + " from " +
                        element_kind_name(current().kind()),
                        path_);
    }

    DecodeOptions options_;
    CodingPath path_;
    std::vector<Element> elements_;
};

/// @brief Scoped push/pop of one coding path segment.
///
/// A container returned by nested_container() outlives the push that created
/// it, so its own path can differ from the decoder's when it is used, even at
/// the same depth (a sibling branch). The
/// second constructor swaps the container's path in for the duration of the
/// descent and swaps the decoder's path back afterwards.
class PathGuard {
public:
    PathGuard(Decoder& decoder, CodingKey key, Element child)
        : decoder_(decoder) {
        decoder_.push(std::move(key), child);
    }

    PathGuard(Decoder& decoder, const CodingPath& base, CodingKey key, Element child)
        : decoder_(decoder) {
        if (SFV_UNLIKELY(base != decoder_.path_))
            saved_ = std::exchange(decoder_.path_, base);
        try {
            decoder_.push(std::move(key), child);
        } catch (...) {
            if (saved_) decoder_.path_ = std::move(*saved_);
            throw;
        }
    }

    ~PathGuard() noexcept {
        decoder_.pop();
        if (saved_) decoder_.path_ = std::move(*saved_);
    }

    // Non-copyable
    PathGuard(const PathGuard&) = delete;
    PathGuard& operator=(const PathGuard&) = delete;

private:
    Decoder& decoder_;
    std::optional<CodingPath> saved_;
};

} // namespace sfv
