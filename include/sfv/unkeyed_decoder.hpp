#pragma once

/// @file unkeyed_decoder.hpp
/// @brief Sequence container over a list or the bare items of an inner list.
///
/// Elements are decoded in order; each decode descends under the element's
/// index and advances only when the nested decode succeeds.

#include "coding_path.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "value.hpp"

#include <cstddef>
#include <string>

namespace sfv {

class UnkeyedDecoder {
public:
    UnkeyedDecoder(const List& list, Decoder& decoder)
        : sequence_(&list), count_(list.size()), decoder_(&decoder), path_(decoder.coding_path()) {}

    UnkeyedDecoder(const BareInnerList& items, Decoder& decoder)
        : sequence_(&items), count_(items.size()), decoder_(&decoder), path_(decoder.coding_path()) {}

    [[nodiscard]] const CodingPath& coding_path() const noexcept { return path_; }
    [[nodiscard]] size_t count() const noexcept { return count_; }
    [[nodiscard]] size_t current_index() const noexcept { return index_; }
    [[nodiscard]] bool is_at_end() const noexcept { return index_ >= count_; }

    /// Elements are never null.
    [[nodiscard]] bool decode_nil() const noexcept { return false; }

    template <typename T>
    T decode() {
        PathGuard guard(*decoder_, path_, CodingKey(index_), next_element());
        T value = decoder_->decode<T>();
        ++index_;
        return value;
    }

    // Defined in keyed_container.hpp
    KeyedDecodingContainer nested_container();
    UnkeyedDecoder nested_unkeyed_container();

    Decoder& super_decoder() const {
        throw UnsupportedOperationError("sequence does not support super decoding", path_);
    }

private:
    Element next_element() const {
        if (SFV_UNLIKELY(is_at_end())) {
            CodingPath at = path_;
            at.emplace_back(index_);
            throw ValueNotFoundError("index " + std::to_string(index_) +
                                     " out of range (count=" + std::to_string(count_) + ")",
                                     std::move(at));
        }
        if (sequence_.kind() == ElementKind::List)
            return Element::member(sequence_.as<List>()[index_]);
        return Element(&sequence_.as<BareInnerList>()[index_]);
    }

    Element sequence_;
    size_t count_;
    size_t index_ = 0;
    Decoder* decoder_;
    CodingPath path_;
};

} // namespace sfv
