#include "integral_encdec.hpp"

#include <limits>
#include <string>

#include <gtest/gtest.h>

class IntegralEncDec : public ::testing::Test {};

#define string_literal(s) std::string(s, sizeof(s) - 1)
#define TEST_ENCDEC(name, type, value, encoded)                          \
    TEST_F(IntegralEncDec, name) {                                       \
        char buf[::wsdb::priv::MAX_INTEGRAL_ENCODED_SIZE];               \
        type v1 = value, v2;                                             \
        std::size_t size = ::wsdb::priv::encode(buf, v1);                \
        EXPECT_EQ(std::string(buf, size), string_literal(encoded));      \
        EXPECT_EQ(::wsdb::priv::decode(buf, size, v2), size);            \
        EXPECT_EQ(v1, v2);                                               \
    }

TEST_ENCDEC(BoolFalse, bool, false, "\x00")
TEST_ENCDEC(BoolTrue, bool, true, "\x01")
TEST_ENCDEC(Uint8Small, uint8_t, 0x7F, "\x7F")
TEST_ENCDEC(Uint8Large, uint8_t, 0xFF, "\xFF\x01")
TEST_ENCDEC(Uint16, uint16_t, 300, "\xAC\x02")
TEST_ENCDEC(Uint32Max, uint32_t, 0xFFFFFFFFu, "\xFF\xFF\xFF\xFF\x0F")
TEST_ENCDEC(Uint64Max, uint64_t, 0xFFFFFFFFFFFFFFFFull, "\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\x01")
TEST_ENCDEC(Int32Zero, int32_t, 0, "\x00")
TEST_ENCDEC(Int32MinusOne, int32_t, -1, "\x01")
TEST_ENCDEC(Int32One, int32_t, 1, "\x02")
TEST_ENCDEC(Int32MinusSixtyFive, int32_t, -65, "\x81\x01")
TEST_ENCDEC(Int64Min, int64_t, std::numeric_limits<int64_t>::min(), "\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\x01")

TEST_F(IntegralEncDec, Enum) {
    enum class Code : uint32_t { A = 0, B = 10001 };
    char buf[::wsdb::priv::MAX_INTEGRAL_ENCODED_SIZE];
    const std::size_t size = ::wsdb::priv::encode(buf, Code::B);
    EXPECT_EQ(size, 2u);

    Code decoded = Code::A;
    EXPECT_EQ(::wsdb::priv::decode(buf, size, decoded), size);
    EXPECT_EQ(decoded, Code::B);
}

TEST_F(IntegralEncDec, Truncated) {
    const std::string data = string_literal("\xFF\xFF");
    uint64_t value = 0;
    EXPECT_EQ(::wsdb::priv::decode(data.data(), data.size(), value), 0u);
    EXPECT_EQ(::wsdb::priv::decode(data.data(), 0, value), 0u);
}

TEST_F(IntegralEncDec, TooLong) {
    const std::string eleven = string_literal("\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\x01");
    uint64_t value = 0;
    EXPECT_EQ(::wsdb::priv::decode(eleven.data(), eleven.size(), value), 0u);

    const std::string overflow = string_literal("\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\xFF\x02");
    EXPECT_EQ(::wsdb::priv::decode(overflow.data(), overflow.size(), value), 0u);
}

TEST_F(IntegralEncDec, OutOfRange) {
    char buf[::wsdb::priv::MAX_INTEGRAL_ENCODED_SIZE];
    std::size_t size = ::wsdb::priv::encode(buf, uint32_t{256});
    uint8_t narrow = 0;
    EXPECT_EQ(::wsdb::priv::decode(buf, size, narrow), 0u);

    size = ::wsdb::priv::encode(buf, int64_t{-129});
    int8_t signed_narrow = 0;
    EXPECT_EQ(::wsdb::priv::decode(buf, size, signed_narrow), 0u);

    size = ::wsdb::priv::encode(buf, uint8_t{2});
    bool flag = false;
    EXPECT_EQ(::wsdb::priv::decode(buf, size, flag), 0u);
}

TEST_F(IntegralEncDec, SequentialValues) {
    for (uint64_t v = 0; v < 100000; v += 7) {
        char buf[::wsdb::priv::MAX_INTEGRAL_ENCODED_SIZE];
        const std::size_t size = ::wsdb::priv::encode(buf, v);
        uint64_t decoded = v + 1;
        ASSERT_EQ(::wsdb::priv::decode(buf, size, decoded), size);
        ASSERT_EQ(decoded, v);
    }
}
