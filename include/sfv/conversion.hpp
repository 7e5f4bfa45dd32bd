#pragma once

/// @file conversion.hpp
/// @brief ADL-based conversion system: structured header value -> C++ types.
///
/// Provides:
///   - from_structured() for scalars and STL containers
///   - decode_value<T>() helper wrapper
///   - SFV_DEFINE_DECODABLE() macro for struct mapping
///   - SFV_DEFINE_DECODABLE_INTRUSIVE() macro for friend mapping
///
/// @example
/// @code
///   // Accept: text/html;q=0.9, (en fr);lang-count=2
///   struct Params { double q; };
///   SFV_DEFINE_DECODABLE(Params, q)
///
///   struct Languages { std::vector<std::string> items; Params parameters; };
///   SFV_DEFINE_DECODABLE(Languages, items, parameters)
/// @endcode

#include "bare_item_decoder.hpp"
#include "decoder.hpp"
#include "keyed_container.hpp"
#include "ordered_map.hpp"
#include "unkeyed_decoder.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace sfv {

// =====================================================================
// from_structured: current decoder element -> C++ type
// =====================================================================

template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
void from_structured(Decoder& d, T& v) {
    v = d.single_value_container().decode<T>();
}

inline void from_structured(Decoder& d, std::string& v) {
    v = d.single_value_container().decode<std::string>();
}

/// Raw pass-through of the bare item (parameters of an item are dropped).
inline void from_structured(Decoder& d, BareItem& v) {
    v = d.single_value_container().item();
}

/// Byte sequences are not a decodable target; this always fails with
/// wrong_kind_for_item.
inline void from_structured(Decoder& d, ByteSequence& v) {
    v = d.single_value_container().decode<ByteSequence>();
}

template <typename T>
void from_structured(Decoder& d, std::vector<T>& vec) {
    auto c = d.unkeyed_container();
    vec.clear();
    vec.reserve(c.count());
    while (!c.is_at_end()) {
        vec.push_back(c.decode<T>());
    }
}

/// Map keys are structural keys and are not passed through the key strategy.
template <typename T>
void from_structured(Decoder& d, OrderedMap<std::string, T>& m) {
    auto c = d.keyed_container();
    m = OrderedMap<std::string, T>();
    for (const auto& key : c.all_keys()) {
        m.set(key.string_value(), c.decode<T>(key));
    }
}

template <typename T>
void from_structured(Decoder& d, std::optional<T>& opt) {
    opt = d.decode<T>();
}

// =====================================================================
// Helper wrappers
// =====================================================================

/// Decoder's current element -> C++ value (T must be default-constructible).
template <typename T>
[[nodiscard]] T decode_value(Decoder& d) {
    return d.decode<T>();
}

} // namespace sfv

// =====================================================================
// Preprocessor FOREACH utilities (support up to 20 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SFV_PP_CAT_I(a, b) a##b
#define SFV_PP_CAT(a, b) SFV_PP_CAT_I(a, b)

#define SFV_PP_NARG_I(...) \
    SFV_PP_ARG_N(__VA_ARGS__, \
    20,19,18,17,16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define SFV_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10, \
    _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, N,...) N

#define SFV_PP_FE_1(m,x) m(x)
#define SFV_PP_FE_2(m,x,...) m(x) SFV_PP_FE_1(m,__VA_ARGS__)
#define SFV_PP_FE_3(m,x,...) m(x) SFV_PP_FE_2(m,__VA_ARGS__)
#define SFV_PP_FE_4(m,x,...) m(x) SFV_PP_FE_3(m,__VA_ARGS__)
#define SFV_PP_FE_5(m,x,...) m(x) SFV_PP_FE_4(m,__VA_ARGS__)
#define SFV_PP_FE_6(m,x,...) m(x) SFV_PP_FE_5(m,__VA_ARGS__)
#define SFV_PP_FE_7(m,x,...) m(x) SFV_PP_FE_6(m,__VA_ARGS__)
#define SFV_PP_FE_8(m,x,...) m(x) SFV_PP_FE_7(m,__VA_ARGS__)
#define SFV_PP_FE_9(m,x,...) m(x) SFV_PP_FE_8(m,__VA_ARGS__)
#define SFV_PP_FE_10(m,x,...) m(x) SFV_PP_FE_9(m,__VA_ARGS__)
#define SFV_PP_FE_11(m,x,...) m(x) SFV_PP_FE_10(m,__VA_ARGS__)
#define SFV_PP_FE_12(m,x,...) m(x) SFV_PP_FE_11(m,__VA_ARGS__)
#define SFV_PP_FE_13(m,x,...) m(x) SFV_PP_FE_12(m,__VA_ARGS__)
#define SFV_PP_FE_14(m,x,...) m(x) SFV_PP_FE_13(m,__VA_ARGS__)
#define SFV_PP_FE_15(m,x,...) m(x) SFV_PP_FE_14(m,__VA_ARGS__)
#define SFV_PP_FE_16(m,x,...) m(x) SFV_PP_FE_15(m,__VA_ARGS__)
#define SFV_PP_FE_17(m,x,...) m(x) SFV_PP_FE_16(m,__VA_ARGS__)
#define SFV_PP_FE_18(m,x,...) m(x) SFV_PP_FE_17(m,__VA_ARGS__)
#define SFV_PP_FE_19(m,x,...) m(x) SFV_PP_FE_18(m,__VA_ARGS__)
#define SFV_PP_FE_20(m,x,...) m(x) SFV_PP_FE_19(m,__VA_ARGS__)

#define SFV_PP_FOREACH(m,...) \
    SFV_PP_CAT(SFV_PP_FE_, SFV_PP_NARG_I(__VA_ARGS__))(m, __VA_ARGS__)

// Field-level macro for struct mapping; the field name is the declared key.
#define SFV_DETAIL_DECODE_FIELD(fld) \
    { _sfv_c.decode(#fld, v.fld); }

/// Non-intrusive: use in the same namespace as the type.
#define SFV_DEFINE_DECODABLE(Type, ...) \
    inline void from_structured(::sfv::Decoder& d, Type& v) { \
        const auto _sfv_c = d.keyed_container(); \
        SFV_PP_FOREACH(SFV_DETAIL_DECODE_FIELD, __VA_ARGS__) \
    }

/// Intrusive: use inside the class/struct body.
#define SFV_DEFINE_DECODABLE_INTRUSIVE(Type, ...) \
    friend void from_structured(::sfv::Decoder& d, Type& v) { \
        const auto _sfv_c = d.keyed_container(); \
        SFV_PP_FOREACH(SFV_DETAIL_DECODE_FIELD, __VA_ARGS__) \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
