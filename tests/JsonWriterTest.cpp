#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "Serialization/Json/JsonWriter.hpp"

using namespace kirikae::serialization;

TEST(JsonWriterTest, SimpleObject) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startObject();
    writer.key("x");
    writer.writeObject(42);
    writer.key("s");
    writer.writeObject(std::string_view("hi"));
    writer.endObject();
    EXPECT_EQ(oss.str(), "{x:42,s:\"hi\"}");
}

TEST(JsonWriterTest, KeyQuoting) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startObject();
    writer.key("$id");
    writer.writeObject(1);
    writer.key("1st");
    writer.writeObject(2);
    writer.key("two words");
    writer.writeObject(3);
    writer.key("");
    writer.null();
    writer.endObject();
    EXPECT_EQ(oss.str(), "{$id:1,\"1st\":2,\"two words\":3,\"\":null}");
}

TEST(JsonWriterTest, QuoteAllKeys) {
    std::ostringstream oss;
    WriteOptions options;
    options.quoteAllKeys = true;
    JsonWriter writer(oss, options);
    writer.startObject();
    writer.key("x");
    writer.writeObject(true);
    writer.endObject();
    EXPECT_EQ(oss.str(), "{\"x\":true}");
}

TEST(JsonWriterTest, EscapesStrings) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.writeObject("quote\" back\\ nl\n tab\t \x01");
    EXPECT_EQ(oss.str(), "\"quote\\\" back\\\\ nl\\n tab\\t \\u0001\"");
}

TEST(JsonWriterTest, NestedContainers) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startArray();
    writer.writeObject(1);
    writer.startArray();
    writer.writeObject(2);
    writer.writeObject(3);
    writer.endArray();
    writer.startObject();
    writer.endObject();
    writer.null();
    writer.endArray();
    EXPECT_EQ(oss.str(), "[1,[2,3],{},null]");
}

TEST(JsonWriterTest, FloatingPointValues) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startArray();
    writer.writeObject(1.5);
    writer.writeObject(0.1);
    writer.writeObject(1.0);
    writer.writeObject(0.5f);
    writer.writeObject(std::numeric_limits<double>::quiet_NaN());
    writer.writeObject(std::numeric_limits<double>::infinity());
    writer.writeObject(-std::numeric_limits<double>::infinity());
    writer.endArray();
    EXPECT_EQ(oss.str(), "[1.5,0.1,1,0.5,NaN,Infinity,-Infinity]");
}

TEST(JsonWriterTest, SmallIntegersAndCharacters) {
    std::ostringstream oss;
    JsonWriter writer(oss);
    writer.startArray();
    writer.writeObject(static_cast<std::int8_t>(-5));
    writer.writeObject(static_cast<std::uint8_t>(200));
    writer.writeObject('c');
    writer.writeObject(std::numeric_limits<std::int64_t>::min());
    writer.endArray();
    EXPECT_EQ(oss.str(), "[-5,200,\"c\",-9223372036854775808]");
}
