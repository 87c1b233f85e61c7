#include <gtest/gtest.h>

#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestHelper.hpp"
#include "Serialization/FieldSerializer.hpp"
#include "Serialization/Json/JsonIO.hpp"
#include "Serialization/ObjectConverter.hpp"
#include "Serialization/ObjectSerializer.hpp"

using namespace kirikae::serialization;
using namespace kirikae::serialization::test;

namespace {

enum class Color { Red, Green, Blue };

constexpr EnumEntry<Color> colorEntries[] = {
    { Color::Red,   "red" },
    { Color::Green, "green" },
    { Color::Blue,  "blue" }
};

// 名前で書き出す
struct Palette {
    Color color = Color::Red;
    std::vector<Color> accents;

    const ObjectSerializer& serializer() const {
        static const auto colorConverter = getEnumConverter(colorEntries);
        static const auto accentsConverter = getContainerConverter<std::vector<Color>>(colorConverter);
        static const auto fields = getFieldSet(
            getRequiredField(&Palette::color, "color", colorConverter),
            getDefaultField(&Palette::accents, "accents", {}, accentsConverter));
        return fields;
    }

    bool operator==(const Palette& other) const = default;
};

// 初期化子リストから変換表を作る
struct Light {
    Color color = Color::Red;

    const ObjectSerializer& serializer() const {
        static const auto colorConverter = getEnumConverter<Color>({
            { Color::Red,   "stop" },
            { Color::Green, "go" },
            { Color::Blue,  "blue" }
        });
        static const auto fields = getFieldSet(
            getRequiredField(&Light::color, "color", colorConverter));
        return fields;
    }

    bool operator==(const Light& other) const = default;
};

// 既定のコンバータは整数値で書き出す
struct Pixel {
    Color color = Color::Red;

    const ObjectSerializer& serializer() const {
        static const auto fields = getFieldSet(getRequiredField(&Pixel::color, "color"));
        return fields;
    }

    bool operator==(const Pixel& other) const = default;
};

}  // namespace

TEST(EnumConverterTest, RoundTripByName) {
    Palette palette;
    palette.color = Color::Green;
    palette.accents = { Color::Blue, Color::Red };
    testJsonRoundTrip(palette, "{color:\"green\",accents:[\"blue\",\"red\"]}");
}

TEST(EnumConverterTest, ReadUnknownNameThrows) {
    // 変換表に無い名前は読み込めない
    Palette out{};
    EXPECT_THROW(readJsonString("{color:\"purple\"}", out), std::runtime_error);
    EXPECT_THROW(readJsonString("{color:1}", out), std::runtime_error);
}

TEST(EnumConverterTest, RoundTripWithInitializerList) {
    Light light;
    light.color = Color::Green;
    testJsonRoundTrip(light, "{color:\"go\"}");
}

TEST(EnumConverterTest, WriteUnmappedValueThrows) {
    const EnumEntry<Color> partial[] = { { Color::Red, "red" } };
    const auto converter = getEnumConverter(partial);

    EXPECT_EQ(getJsonContent(Color::Red, converter), "\"red\"");
    EXPECT_THROW(getJsonContent(Color::Blue, converter), std::runtime_error);
}

TEST(EnumConverterTest, BuildFromArrayAndSpan) {
    const std::array<EnumEntry<Color>, 2> entries{ {
        { Color::Red, "r" },
        { Color::Blue, "b" },
    } };
    const auto fromArray = getEnumConverter(entries);
    const auto fromSpan = getEnumConverter(std::span<const EnumEntry<Color>, 2>(entries));

    EXPECT_EQ(readJsonWith("\"b\"", fromArray), Color::Blue);
    EXPECT_EQ(getJsonContent(Color::Red, fromSpan), "\"r\"");
}

TEST(EnumConverterTest, TextMapSizeMismatchThrows) {
    EXPECT_THROW((EnumTextMap<Color, 2>(std::span<const EnumEntry<Color>>(colorEntries))), std::invalid_argument);
}

TEST(EnumConverterTest, DefaultConverterUsesUnderlyingValue) {
    Pixel pixel;
    pixel.color = Color::Blue;
    testJsonRoundTrip(pixel, "{color:2}");
}
