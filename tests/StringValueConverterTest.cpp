#include <gtest/gtest.h>

#include <charconv>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "TestHelper.hpp"
#include "Serialization/FieldSerializer.hpp"
#include "Serialization/Json/JsonIO.hpp"
#include "Serialization/ObjectSerializer.hpp"
#include "Serialization/SerializationError.hpp"
#include "Serialization/StringValueConverter.hpp"

using namespace kirikae::serialization;
using namespace kirikae::serialization::test;

namespace {

// ******************************************************************************** 値ラッパー型

// @brief ポート番号（JSON上は文字列）
struct Port {
    int value = 0;

    static std::string_view jsonTypeName() { return "Port"; }

    std::string toString() const { return std::to_string(value); }

    bool operator==(const Port& other) const = default;
};

struct PortParser {
    Port parse(std::string_view text) const {
        int value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            throw std::invalid_argument("invalid port: " + std::string(text));
        }
        return Port{ value };
    }
};

using PortConverter = StringValueConverter<Port, PortParser>;
using NullablePortConverter = NullableStringValueConverter<Port, PortParser>;

const PortConverter& portConverter() {
    static const PortConverter converter;
    return converter;
}

const NullablePortConverter& nullablePortConverter() {
    static const NullablePortConverter converter;
    return converter;
}

struct Endpoint {
    std::string host;
    std::optional<Port> port;

    const ObjectSerializer& serializer() const {
        static const auto fields = getFieldSet(
            getRequiredField(&Endpoint::host, "host"),
            getOptionalField(&Endpoint::port, "port", nullablePortConverter()));
        return fields;
    }

    bool operator==(const Endpoint& other) const = default;
};

struct Listener {
    Port port;
    std::vector<Port> fallbacks;

    const ObjectSerializer& serializer() const {
        static const auto fallbacksConverter = getContainerConverter<std::vector<Port>>(portConverter());
        static const auto fields = getFieldSet(
            getRequiredField(&Listener::port, "port", portConverter()),
            getDefaultField(&Listener::fallbacks, "fallbacks", {}, fallbacksConverter));
        return fields;
    }

    bool operator==(const Listener& other) const = default;
};

}  // namespace

// ******************************************************************************** 読み込み

TEST(StringValueConverterTest, ReadsStringToken) {
    EXPECT_EQ(readJsonWith("\"5\"", portConverter()), Port{ 5 });
    EXPECT_EQ(readJsonWith("'8080'", portConverter()), Port{ 8080 });
}

TEST(StringValueConverterTest, RejectsNonStringTokens) {
    const std::pair<std::string_view, std::string_view> cases[] = {
        { "5", "Integer" },
        { "null", "Null" },
        { "{}", "StartObject" },
        { "[]", "StartArray" },
        { "true", "Boolean" },
    };
    for (const auto& [json, tokenName] : cases) {
        const std::string_view text = json;
        auto error = captureSerializationError([&] { readJsonWith(text, portConverter()); });
        ASSERT_TRUE(error.has_value()) << json;
        EXPECT_EQ(error->kind(), SerializationErrorKind::UnexpectedToken) << json;
        EXPECT_EQ(std::string(error->what()),
            "Unexpected token or value when parsing Port. Token: " + std::string(tokenName));
    }
}

TEST(StringValueConverterTest, ParserErrorsPropagate) {
    EXPECT_THROW(readJsonWith("\"eighty\"", portConverter()), std::invalid_argument);
}

TEST(StringValueConverterTest, NullableReadsNull) {
    EXPECT_FALSE(readJsonWith("null", nullablePortConverter()).has_value());
    EXPECT_EQ(readJsonWith("\"7\"", nullablePortConverter()), std::optional<Port>(Port{ 7 }));

    auto error = captureSerializationError([] { readJsonWith("7", nullablePortConverter()); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), SerializationErrorKind::UnexpectedToken);
}

// ******************************************************************************** 書き出し

TEST(StringValueConverterTest, WritesAsString) {
    EXPECT_EQ(getJsonContent(Port{ 5 }, portConverter()), "\"5\"");
    EXPECT_EQ(getJsonContent(std::optional<Port>{}, nullablePortConverter()), "null");
    EXPECT_EQ(getJsonContent(std::optional<Port>(Port{ 443 }), nullablePortConverter()), "\"443\"");

    // 算術型は to_string で文字列化する
    EXPECT_EQ(toValueText(42), "42");
}

// ******************************************************************************** フィールドとして使う

TEST(StringValueConverterTest, FieldRoundTrip) {
    Endpoint endpoint;
    endpoint.host = "localhost";
    endpoint.port = Port{ 8080 };
    testJsonRoundTrip(endpoint, "{host:\"localhost\",port:\"8080\"}");

    Endpoint noPort;
    noPort.host = "localhost";
    testJsonRoundTrip(noPort, "{host:\"localhost\",port:null}");
}

TEST(StringValueConverterTest, NullFieldCanBeSkipped) {
    Endpoint endpoint;
    endpoint.host = "example";

    WriteOptions options;
    options.skipNullValues = true;
    EXPECT_EQ(getJsonContent(endpoint, options), "{host:\"example\"}");

    // キーが無くても読み込める
    Endpoint parsed;
    readJsonString("{host:\"example\"}", parsed);
    EXPECT_EQ(parsed, endpoint);
}

TEST(StringValueConverterTest, FieldRejectsNumber) {
    Endpoint parsed;
    EXPECT_THROW(readJsonString("{host:\"a\",port:80}", parsed), SerializationError);
}

TEST(StringValueConverterTest, ArrayOfWrappedValues) {
    Listener listener;
    listener.port = Port{ 80 };
    listener.fallbacks = { Port{ 8080 }, Port{ 8081 } };
    testJsonRoundTrip(listener, "{port:\"80\",fallbacks:[\"8080\",\"8081\"]}");

    Listener parsed;
    readJsonString("{port:\"1\"}", parsed);
    EXPECT_EQ(parsed.port, Port{ 1 });
    EXPECT_TRUE(parsed.fallbacks.empty());
}
