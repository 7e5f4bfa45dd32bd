/// @file bench_decode.cpp
/// @brief Decode throughput benchmarks for sfv.
///
/// Measures:
///   - Scalar decoding of bare items (integer range check, text, decimal)
///   - Sequence decoding of lists and inner lists
///   - Struct mapping through SFV_DEFINE_DECODABLE
///   - OrderedMap lookup and reassignment
///   - Cost of the error path (exception vs try_decode)

#include <sfv/sfv.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace sfv;

namespace {

struct Quality {
    double q = 0.0;
};
SFV_DEFINE_DECODABLE(Quality, q)

struct MediaRange {
    std::string item;
    Quality parameters;
};
SFV_DEFINE_DECODABLE(MediaRange, item, parameters)

struct Priority {
    int u = 3;
    std::optional<bool> i;
};
SFV_DEFINE_DECODABLE(Priority, u, i)

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// List of N integer items: 0, 1, ..., N-1
static List gen_int_list(int n) {
    List list;
    list.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i)
        list.emplace_back(Item{BareItem(i), {}});
    return list;
}

/// Accept-style list: text/type-i;q=0.NNN
static List gen_media_list(int n) {
    List list;
    list.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        Parameters params{{"q", Decimal::from_thousandths(1000 - (i % 1000))}};
        list.emplace_back(Item{BareItem(Token{"text/type-" + std::to_string(i)}), std::move(params)});
    }
    return list;
}

/// Dictionary with N integer members: key_0=0, key_1=1, ...
static Dictionary gen_dictionary(int n) {
    Dictionary dict;
    for (int i = 0; i < n; ++i)
        dict.set("key_" + std::to_string(i), ItemOrInnerList(Item{BareItem(i), {}}));
    return dict;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeInteger(benchmark::State& state) {
    Item item{BareItem(int64_t{1} << 20), {}};
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<int32_t>(item);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeInteger);

static void BM_DecodeText(benchmark::State& state) {
    Item item{BareItem(Token{"application/structured-field"}), {}};
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<std::string>(item);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeText);

static void BM_DecodeDecimal(benchmark::State& state) {
    Item item{BareItem(Decimal::from_thousandths(123456)), {}};
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<double>(item);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodeDecimal);

// ═══════════════════════════════════════════════════════════════════════════════
// Sequences
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeIntList(benchmark::State& state) {
    auto list = gen_int_list(static_cast<int>(state.range(0)));
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<std::vector<int64_t>>(list);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeIntList)->Arg(10)->Arg(100)->Arg(1000);

static void BM_DecodeInnerList(benchmark::State& state) {
    InnerList list;
    for (int i = 0; i < state.range(0); ++i)
        list.items.emplace_back(Token{"lang-" + std::to_string(i)});
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<std::vector<std::string>>(list);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeInnerList)->Arg(10)->Arg(100);

// ═══════════════════════════════════════════════════════════════════════════════
// Struct mapping
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeMediaRanges(benchmark::State& state) {
    auto list = gen_media_list(static_cast<int>(state.range(0)));
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<std::vector<MediaRange>>(list);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeMediaRanges)->Arg(4)->Arg(64);

static void BM_DecodePriority(benchmark::State& state) {
    Dictionary dict;
    dict.set("u", ItemOrInnerList(Item{BareItem(1), {}}));
    dict.set("i", ItemOrInnerList(Item{BareItem(true), {}}));
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<Priority>(dict);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_DecodePriority);

static void BM_DecodeDictionaryToMap(benchmark::State& state) {
    auto dict = gen_dictionary(static_cast<int>(state.range(0)));
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto v = decoder.decode<OrderedMap<std::string, int>>(dict);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeDictionaryToMap)->Arg(4)->Arg(32)->Arg(256);

// ═══════════════════════════════════════════════════════════════════════════════
// OrderedMap
// ═══════════════════════════════════════════════════════════════════════════════

/// Linear lookup: last key is the worst case.
static void BM_OrderedMapLookupLast(benchmark::State& state) {
    auto dict = gen_dictionary(static_cast<int>(state.range(0)));
    const std::string key = "key_" + std::to_string(state.range(0) - 1);
    for (auto _ : state) {
        auto* v = dict.find(key);
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_OrderedMapLookupLast)->Arg(4)->Arg(32)->Arg(256);

static void BM_OrderedMapReassign(benchmark::State& state) {
    auto dict = gen_dictionary(static_cast<int>(state.range(0)));
    ItemOrInnerList member(Item{BareItem(7), {}});
    for (auto _ : state) {
        dict.set("key_0", member);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_OrderedMapReassign)->Arg(4)->Arg(32)->Arg(256);

// ═══════════════════════════════════════════════════════════════════════════════
// Error path
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ErrorThrow(benchmark::State& state) {
    Item item{BareItem(int64_t{1} << 40), {}};
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        try {
            auto v = decoder.decode<int32_t>(item);
            benchmark::DoNotOptimize(v);
        } catch (const IntegerOutOfRangeError& e) {
            auto ec = e.code();
            benchmark::DoNotOptimize(ec);
        }
    }
}
BENCHMARK(BM_ErrorThrow);

static void BM_ErrorTryDecode(benchmark::State& state) {
    Item item{BareItem(int64_t{1} << 40), {}};
    StructuredFieldValueDecoder decoder;
    for (auto _ : state) {
        auto r = decoder.try_decode<int32_t>(item);
        benchmark::DoNotOptimize(r.ec);
    }
}
BENCHMARK(BM_ErrorTryDecode);
