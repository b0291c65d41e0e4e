#include "record_fields.hpp"

#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace ::wsdb::priv;

class RecordFields : public ::testing::Test {
protected:
    struct Inner {
        uint32_t code = 0;
        std::string name;

        void put(obstream& os) const {
            field_writer writer(os);
            writer.put(1, code);
            writer.put(2, name);
        }

        bool get(ibstream& is) {
            field_reader reader(is);
            field_id_t id;
            while (reader.next(id)) {
                bool ok = (id == 1) ? reader.get(code) : (id == 2) ? reader.get(name) : reader.skip();
                if (!ok) {
                    return false;
                }
            }
            return !reader.failed();
        }
    };

    struct Record {
        int64_t number = 0;
        std::string text;
        ws::Bytes blob;
        std::optional<Inner> inner;
        std::vector<Inner> items;
        std::optional<bool> flag;

        void put(obstream& os) const {
            field_writer writer(os);
            writer.put(1, number);
            writer.put(2, text);
            writer.put(3, blob);
            writer.put(4, inner);
            writer.put(5, items);
            writer.put(6, flag);
        }

        bool get(ibstream& is) {
            field_reader reader(is);
            field_id_t id;
            while (reader.next(id)) {
                bool ok = false;
                switch (id) {
                    case 1:
                        ok = reader.get(number);
                        break;
                    case 2:
                        ok = reader.get(text);
                        break;
                    case 3:
                        ok = reader.get(blob);
                        break;
                    case 4:
                        ok = reader.get(inner);
                        break;
                    case 5:
                        ok = reader.get(items);
                        break;
                    case 6:
                        ok = reader.get(flag);
                        break;
                    default:
                        ok = reader.skip();
                        break;
                }
                if (!ok) {
                    return false;
                }
            }
            return !reader.failed();
        }
    };

    // only the first two fields of Record
    struct OldRecord {
        int64_t number = 0;
        std::string text;

        bool get(ibstream& is) {
            field_reader reader(is);
            field_id_t id;
            while (reader.next(id)) {
                bool ok = (id == 1) ? reader.get(number) : (id == 2) ? reader.get(text) : reader.skip();
                if (!ok) {
                    return false;
                }
            }
            return !reader.failed();
        }
    };
};

TEST_F(RecordFields, PlainValues) {
    obstream os;
    os.put(uint32_t{12345});
    os.put(std::string("wallet"));
    os.put(ws::Bytes{0x00, 0x01, 0xFF});
    os.put(int16_t{-3});

    ibstream is(os.buffer());
    uint32_t u = 0;
    std::string s;
    ws::Bytes b;
    int16_t i = 0;
    EXPECT_TRUE(is.get(u));
    EXPECT_TRUE(is.get(s));
    EXPECT_TRUE(is.get(b));
    EXPECT_TRUE(is.get(i));
    EXPECT_TRUE(is.empty());

    EXPECT_EQ(u, 12345u);
    EXPECT_EQ(s, "wallet");
    EXPECT_EQ(b, (ws::Bytes{0x00, 0x01, 0xFF}));
    EXPECT_EQ(i, -3);

    EXPECT_FALSE(is.get(u));
}

TEST_F(RecordFields, StringLongerThanData) {
    obstream os;
    os.put(uint64_t{10});
    os.put("abc", 3);

    ibstream is(os.buffer());
    std::string s;
    EXPECT_FALSE(is.get(s));

    // nothing is consumed by a failed read
    EXPECT_EQ(is.size(), os.buffer().size());
    uint64_t length = 0;
    EXPECT_TRUE(is.get(length));
    EXPECT_EQ(length, 10u);
}

TEST_F(RecordFields, RawBytes) {
    obstream os;
    os.put("\x01\x02\x03", 3);
    os.put(nullptr, 0);

    ibstream is(os.buffer());
    uint8_t head[2] = {};
    EXPECT_TRUE(is.get(head, sizeof(head)));
    EXPECT_EQ(head[0], 1);
    EXPECT_EQ(head[1], 2);
    EXPECT_TRUE(is.get(nullptr, 0));
    EXPECT_EQ(is.size(), 1u);

    uint8_t tail[2] = {};
    EXPECT_FALSE(is.get(tail, sizeof(tail)));
    EXPECT_EQ(is.size(), 1u);
}

TEST_F(RecordFields, RecordWithAllFields) {
    Record r;
    r.number = -42;
    r.text = "text";
    r.blob = {1, 2, 3};
    r.inner = Inner{7, "seven"};
    r.items = {Inner{1, "one"}, Inner{2, "two"}};
    r.flag = false;

    obstream os;
    os.put(r);

    Record d;
    ibstream is(os.buffer());
    ASSERT_TRUE(is.get(d));
    EXPECT_EQ(d.number, -42);
    EXPECT_EQ(d.text, "text");
    EXPECT_EQ(d.blob, (ws::Bytes{1, 2, 3}));
    ASSERT_TRUE(d.inner.has_value());
    EXPECT_EQ(d.inner->code, 7u);
    EXPECT_EQ(d.inner->name, "seven");
    ASSERT_EQ(d.items.size(), 2u);
    EXPECT_EQ(d.items[1].name, "two");
    ASSERT_TRUE(d.flag.has_value());
    EXPECT_FALSE(*d.flag);
}

TEST_F(RecordFields, AbsentOptionalIsNotWritten) {
    Record r;
    r.number = 1;

    obstream os;
    os.put(r);

    Record d;
    d.flag = true;
    ibstream is(os.buffer());
    ASSERT_TRUE(is.get(d));
    EXPECT_FALSE(d.inner.has_value());
    EXPECT_TRUE(d.items.empty());
    // untouched by the reader
    EXPECT_TRUE(d.flag.has_value());
}

TEST_F(RecordFields, UnknownFieldsAreSkipped) {
    Record r;
    r.number = 99;
    r.text = "kept";
    r.inner = Inner{3, "skipped"};
    r.items = {Inner{4, "skipped too"}};

    obstream os;
    os.put(r);

    OldRecord d;
    ibstream is(os.buffer());
    ASSERT_TRUE(is.get(d));
    EXPECT_EQ(d.number, 99);
    EXPECT_EQ(d.text, "kept");
}

TEST_F(RecordFields, WrongWireType) {
    obstream os;
    field_writer writer(os);
    writer.put(1, std::string("not a number"));

    OldRecord d;
    ibstream is(os.buffer());
    EXPECT_FALSE(is.get(d));
}

TEST_F(RecordFields, BrokenHeader) {
    // wire type 5 is not used
    const ws::Bytes data{(1 << 3) | 5, 0};
    OldRecord d;
    ibstream is(data);
    EXPECT_FALSE(is.get(d));
}

TEST_F(RecordFields, TruncatedRecord) {
    Record r;
    r.text = "truncated";

    obstream os;
    os.put(r);
    ws::Bytes data = os.buffer();
    data.pop_back();

    Record d;
    ibstream is(data);
    EXPECT_FALSE(is.get(d));
}
