#pragma once

/// @file structured_field_value_decoder.hpp
/// @brief Top-level entry point: decode a parsed field value into a C++ type.
///
/// @code
///   struct CacheStatus { std::string item; Params parameters; };
///   SFV_DEFINE_DECODABLE(CacheStatus, item, parameters)
///
///   sfv::StructuredFieldValueDecoder decoder;
///   auto status = decoder.decode<CacheStatus>(parsed_item);
///
///   auto [value, ec] = decoder.try_decode<CacheStatus>(parsed_item);
/// @endcode

#include "conversion.hpp"
#include "decode_options.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "value.hpp"

#include <new>
#include <system_error>
#include <utility>

namespace sfv {

class StructuredFieldValueDecoder {
public:
    StructuredFieldValueDecoder() = default;
    explicit StructuredFieldValueDecoder(DecodeOptions options)
        : options_(std::move(options)) {}

    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

    /// @throws DecodingError (or a subclass) on failure.
    template <typename T>
    [[nodiscard]] T decode(const Dictionary& dictionary) const { return decode_root<T>(Element(&dictionary)); }
    template <typename T>
    [[nodiscard]] T decode(const List& list) const { return decode_root<T>(Element(&list)); }
    template <typename T>
    [[nodiscard]] T decode(const Item& item) const { return decode_root<T>(Element(&item)); }
    template <typename T>
    [[nodiscard]] T decode(const InnerList& inner_list) const { return decode_root<T>(Element(&inner_list)); }

    /// Exception-free decoding; the error code is set on failure.
    template <typename T, typename Root>
    [[nodiscard]] result<T> try_decode(const Root& root) const noexcept {
        try {
            return {decode<T>(root), {}};
        } catch (const std::system_error& e) {
            return {T{}, e.code()};
        } catch (const std::bad_alloc&) {
            return {T{}, std::make_error_code(std::errc::not_enough_memory)};
        }
    }

private:
    template <typename T>
    T decode_root(Element root) const {
        Decoder decoder(root, options_);
        return decoder.decode<T>();
    }

    DecodeOptions options_;
};

} // namespace sfv
