/// @file test_bare_item_decoder.cpp
/// @brief Unit tests for sfv::BareItemDecoder: integer ranges, kind checks, text, decimals.

#include <sfv/sfv.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

using namespace sfv;

namespace {

template <typename T>
T decode_as(const BareItem& item) {
    return BareItemDecoder(item, {}).decode<T>();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Fixed-width integers: every width, both boundaries
// ═══════════════════════════════════════════════════════════════════════════════

template <typename T>
class IntegerWidth : public ::testing::Test {
protected:
    static constexpr int64_t lowest() {
        return static_cast<int64_t>(std::numeric_limits<T>::min());
    }
    // uint64_t max is not an integer item; the largest item it can see is INT64_MAX.
    static constexpr int64_t highest() {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) == sizeof(int64_t))
            return std::numeric_limits<int64_t>::max();
        else
            return static_cast<int64_t>(std::numeric_limits<T>::max());
    }
};

using IntegerTypes = ::testing::Types<int8_t, uint8_t, int16_t, uint16_t,
                                      int32_t, uint32_t, int64_t, uint64_t>;
TYPED_TEST_SUITE(IntegerWidth, IntegerTypes);

TYPED_TEST(IntegerWidth, MinBoundarySucceeds) {
    using T = TypeParam;
    EXPECT_EQ(decode_as<T>(BareItem(TestFixture::lowest())), std::numeric_limits<T>::min());
}

TYPED_TEST(IntegerWidth, MaxBoundarySucceeds) {
    using T = TypeParam;
    EXPECT_EQ(decode_as<T>(BareItem(TestFixture::highest())),
              static_cast<T>(TestFixture::highest()));
}

TYPED_TEST(IntegerWidth, BelowMinIsOutOfRange) {
    using T = TypeParam;
    const int64_t lo = TestFixture::lowest();
    if (lo == std::numeric_limits<int64_t>::min()) return;  // nothing below int64 min
    EXPECT_THROW(static_cast<void>(decode_as<T>(BareItem(lo - 1))), IntegerOutOfRangeError);
}

TYPED_TEST(IntegerWidth, AboveMaxIsOutOfRange) {
    using T = TypeParam;
    const int64_t hi = TestFixture::highest();
    if (hi == std::numeric_limits<int64_t>::max()) return;  // nothing above int64 max
    EXPECT_THROW(static_cast<void>(decode_as<T>(BareItem(hi + 1))), IntegerOutOfRangeError);
}

TYPED_TEST(IntegerWidth, ZeroSucceeds) {
    EXPECT_EQ(decode_as<TypeParam>(BareItem(0)), TypeParam{0});
}

TYPED_TEST(IntegerWidth, BooleanIsWrongKind) {
    EXPECT_THROW(static_cast<void>(decode_as<TypeParam>(BareItem(true))), TypeError);
}

TYPED_TEST(IntegerWidth, DecimalIsWrongKind) {
    EXPECT_THROW(static_cast<void>(decode_as<TypeParam>(BareItem(Decimal::from_thousandths(1000)))),
                 TypeError);
}

TYPED_TEST(IntegerWidth, TextIsWrongKind) {
    EXPECT_THROW(static_cast<void>(decode_as<TypeParam>(BareItem("1"))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<TypeParam>(BareItem(Token{"one"}))), TypeError);
}

TEST(BareItemDecoder, PlatformIntegerTypes) {
    EXPECT_EQ(decode_as<int>(BareItem(-12)), -12);
    EXPECT_EQ(decode_as<unsigned>(BareItem(12)), 12u);
    EXPECT_EQ(decode_as<long long>(BareItem(int64_t{1} << 40)), int64_t{1} << 40);
    EXPECT_EQ(decode_as<size_t>(BareItem(7)), size_t{7});
}

TEST(BareItemDecoder, OutOfRangeIsDistinctFromWrongKind) {
    try {
        static_cast<void>(decode_as<uint8_t>(BareItem(256)));
        FAIL() << "expected exception";
    } catch (const DecodingError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::integer_out_of_range));
        EXPECT_NE(std::string(e.what()).find("256 out of range for 8-bit unsigned"),
                  std::string::npos);
    }
    try {
        static_cast<void>(decode_as<uint8_t>(BareItem(false)));
        FAIL() << "expected exception";
    } catch (const DecodingError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::wrong_kind_for_item));
    }
}

TEST(BareItemDecoder, NegativeIntoUnsignedIsOutOfRange) {
    EXPECT_THROW(static_cast<void>(decode_as<uint64_t>(BareItem(-1))), IntegerOutOfRangeError);
    EXPECT_THROW(static_cast<void>(decode_as<unsigned>(BareItem(-1))), IntegerOutOfRangeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Floating point
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BareItemDecoder, DecimalToDouble) {
    EXPECT_DOUBLE_EQ(decode_as<double>(BareItem(Decimal::from_thousandths(2500))), 2.5);
    EXPECT_DOUBLE_EQ(decode_as<double>(BareItem(Decimal::from_thousandths(-1))), -0.001);
}

TEST(BareItemDecoder, DecimalToFloat) {
    EXPECT_FLOAT_EQ(decode_as<float>(BareItem(Decimal::from_thousandths(125))), 0.125f);
}

TEST(BareItemDecoder, IntegerIsNotCoercedToFloat) {
    EXPECT_THROW(static_cast<void>(decode_as<double>(BareItem(3))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<float>(BareItem(true))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<double>(BareItem("3.0"))), TypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Text
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BareItemDecoder, StringToText) {
    EXPECT_EQ(decode_as<std::string>(BareItem("hello world")), "hello world");
}

TEST(BareItemDecoder, TokenToText) {
    EXPECT_EQ(decode_as<std::string>(BareItem(Token{"text/html"})), "text/html");
}

TEST(BareItemDecoder, NonTextIsWrongKind) {
    EXPECT_THROW(static_cast<void>(decode_as<std::string>(BareItem(1))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<std::string>(BareItem(true))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<std::string>(BareItem(Decimal::from_thousandths(1)))),
                 TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<std::string>(BareItem(ByteSequence{{0x61}}))),
                 TypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Boolean
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BareItemDecoder, BooleanToBool) {
    EXPECT_TRUE(decode_as<bool>(BareItem(true)));
    EXPECT_FALSE(decode_as<bool>(BareItem(false)));
}

TEST(BareItemDecoder, TextIsNotBoolean) {
    EXPECT_THROW(static_cast<void>(decode_as<bool>(BareItem("true"))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<bool>(BareItem(Token{"true"}))), TypeError);
    EXPECT_THROW(static_cast<void>(decode_as<bool>(BareItem(1))), TypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Unsupported targets, nil, path
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BareItemDecoder, ByteSequenceIsNeverDecodable) {
    BareItem bytes(ByteSequence{{0xde, 0xad}});
    EXPECT_THROW(static_cast<void>(decode_as<ByteSequence>(bytes)), TypeError);
}

TEST(BareItemDecoder, NeverNil) {
    BareItem item(0);
    EXPECT_FALSE(BareItemDecoder(item, {}).decode_nil());
}

TEST(BareItemDecoder, ErrorCarriesCodingPath) {
    BareItem item(true);
    CodingPath path{CodingKey("foo"), CodingKey("items"), CodingKey(size_t{1})};
    BareItemDecoder decoder(item, path);
    EXPECT_EQ(decoder.coding_path(), path);
    try {
        static_cast<void>(decoder.decode<int32_t>());
        FAIL() << "expected exception";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.coding_path(), path);
        EXPECT_NE(std::string(e.what()).find("foo.items[1]"), std::string::npos);
    }
}
