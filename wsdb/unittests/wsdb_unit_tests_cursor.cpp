#include <wsdb/cursor.hpp>

#include <cctype>

#include <gtest/gtest.h>

using namespace wsdb;

class CursorCodecTest : public ::testing::Test {
protected:
    CursorCodecTest() {
        cursor_.address = "wallet:w1";
        cursor_.value = std::string("idx\0key", 7);
        cursor_.timestamp = 1600000000000ull;
    }

    Cursor cursor_;
    CursorCodec codec_{1};
};

TEST_F(CursorCodecTest, Printable) {
    const std::string token = codec_.encode(cursor_);
    ASSERT_FALSE(token.empty());
    EXPECT_EQ(token.size() % 2, 0u);
    EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(token.substr(0, 2), "01");
}

TEST_F(CursorCodecTest, Decode) {
    Cursor decoded;
    ASSERT_TRUE(codec_.decode(codec_.encode(cursor_), &decoded));
    EXPECT_EQ(codec_.last_error(), NoError);
    EXPECT_EQ(decoded, cursor_);
}

TEST_F(CursorCodecTest, UppercaseHexAccepted) {
    std::string token = codec_.encode(cursor_);
    for (auto& c : token) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_TRUE(codec_.decode(token, nullptr));
}

TEST_F(CursorCodecTest, NotHex) {
    EXPECT_FALSE(codec_.decode("not a cursor", nullptr));
    EXPECT_EQ(codec_.last_error(), MalformedCursor);

    std::string odd = codec_.encode(cursor_);
    odd.pop_back();
    EXPECT_FALSE(codec_.decode(odd, nullptr));
    EXPECT_EQ(codec_.last_error(), MalformedCursor);
}

TEST_F(CursorCodecTest, Truncated) {
    const std::string token = codec_.encode(cursor_);
    EXPECT_FALSE(codec_.decode(token.substr(0, 8), nullptr));
    EXPECT_EQ(codec_.last_error(), MalformedCursor);

    EXPECT_FALSE(codec_.decode(token.substr(0, token.size() - 2), nullptr));
    EXPECT_EQ(codec_.last_error(), MalformedCursor);

    EXPECT_FALSE(codec_.decode("", nullptr));
    EXPECT_EQ(codec_.last_error(), MalformedCursor);
}

TEST_F(CursorCodecTest, Tampered) {
    std::string token = codec_.encode(cursor_);
    // flip one nibble inside the record
    char& c = token[token.size() / 2];
    c = (c == '0') ? '1' : '0';

    EXPECT_FALSE(codec_.decode(token, nullptr));
    EXPECT_EQ(codec_.last_error(), MalformedCursor);
}

TEST_F(CursorCodecTest, OtherGeneration) {
    CursorCodec next(2);
    const std::string token = codec_.encode(cursor_);

    EXPECT_FALSE(next.decode(token, nullptr));
    EXPECT_EQ(next.last_error(), StaleCursor);
    EXPECT_TRUE(codec_.decode(token, nullptr));
}

TEST_F(CursorCodecTest, ErrorsArePerObject) {
    CursorCodec other(1);
    EXPECT_FALSE(other.decode("zz", nullptr));
    EXPECT_TRUE(codec_.decode(codec_.encode(cursor_), nullptr));

    EXPECT_EQ(other.last_error(), MalformedCursor);
    EXPECT_EQ(codec_.last_error(), NoError);
}

TEST_F(CursorCodecTest, RecordBinary) {
    Cursor decoded;
    ASSERT_TRUE(Cursor::from_binary(cursor_.to_binary(), decoded));
    EXPECT_EQ(decoded, cursor_);

    ws::Bytes damaged = cursor_.to_binary();
    damaged.resize(damaged.size() / 2);
    EXPECT_FALSE(Cursor::from_binary(damaged, decoded));
}
