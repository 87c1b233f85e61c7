#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <typeindex>
#include <typeinfo>
#include <vector>

#include "TestHelper.hpp"
#include "Serialization/DispatchConverter.hpp"
#include "Serialization/DispatchSuppression.hpp"
#include "Serialization/FieldSerializer.hpp"
#include "Serialization/Json/JsonIO.hpp"
#include "Serialization/ObjectSerializer.hpp"
#include "Serialization/SerializationError.hpp"

using namespace kirikae::serialization;
using namespace kirikae::serialization::test;

namespace {

// ******************************************************************************** 入れ子になる型階層

struct Shape;
using ShapeConverter = DispatchConverter<std::unique_ptr<Shape>, std::string>;

// @brief 図形の基底型。type が判別子。
struct Shape {
    std::string type;

    virtual ~Shape() = default;
    virtual const ObjectSerializer& serializer() const = 0;

    static std::string_view jsonTypeName() { return "Shape"; }
    static const ShapeConverter& jsonConverter();
};

struct Circle : Shape {
    double radius = 0.0;

    Circle() { type = "circle"; }

    const ObjectSerializer& serializer() const override {
        static const auto fields = getFieldSet(
            getRequiredField(&Shape::type, "type"),
            getRequiredField(&Circle::radius, "radius"));
        return fields;
    }
};

// 同じ基底型の値をフィールドに持つ
struct Group : Shape {
    std::unique_ptr<Shape> primary;
    std::vector<std::unique_ptr<Shape>> members;

    Group() { type = "group"; }

    const ObjectSerializer& serializer() const override {
        static const auto fields = getFieldSet(
            getRequiredField(&Shape::type, "type"),
            getOptionalField(&Group::primary, "primary"),
            getOptionalField(&Group::members, "members"));
        return fields;
    }
};

const ShapeConverter& Shape::jsonConverter() {
    static const ShapeConverter converter("type", {
        ShapeConverter::when<Circle>("circle"),
        ShapeConverter::when<Group>("group"),
    });
    return converter;
}

double radiusOf(const std::unique_ptr<Shape>& shape) {
    const auto* circle = dynamic_cast<const Circle*>(shape.get());
    return circle != nullptr ? circle->radius : -1.0;
}

constexpr std::string_view nestedJson =
    "{type:\"group\",primary:{type:\"circle\",radius:2},"
    "members:[{type:\"circle\",radius:1},{type:\"group\",members:[]}]}";

}  // namespace

// ******************************************************************************** 抑止セット

TEST(DispatchSuppressionTest, ScopeAddsAndRemovesEntry) {
    DispatchSuppressionSet set;
    const std::type_index shapeType(typeid(Shape));
    {
        DispatchSuppressionScope outer(set, shapeType, 0);
        EXPECT_TRUE(set.contains(shapeType, 0));
        EXPECT_FALSE(set.contains(shapeType, 1));
        EXPECT_FALSE(set.contains(std::type_index(typeid(Circle)), 0));
        {
            DispatchSuppressionScope inner(set, shapeType, 2);
            EXPECT_EQ(set.size(), 2u);
            EXPECT_TRUE(set.contains(shapeType, 2));
        }
        EXPECT_FALSE(set.contains(shapeType, 2));
    }
    EXPECT_TRUE(set.empty());
}

TEST(DispatchSuppressionTest, ScopeIsReleasedOnException) {
    DispatchSuppressionSet set;
    EXPECT_THROW({
        DispatchSuppressionScope scope(set, std::type_index(typeid(Shape)), 0);
        throw std::runtime_error("decoder failed");
    }, std::runtime_error);
    EXPECT_TRUE(set.empty());
}

// ******************************************************************************** 入れ子の振り分け

TEST(DispatchSuppressionTest, NestedValuesOfSameBaseAreDispatched) {
    // JSONから読み込む
    auto shape = readJsonString<std::unique_ptr<Shape>>(nestedJson);

    auto* group = dynamic_cast<Group*>(shape.get());
    ASSERT_NE(group, nullptr);
    EXPECT_DOUBLE_EQ(radiusOf(group->primary), 2.0);
    ASSERT_EQ(group->members.size(), 2u);
    EXPECT_DOUBLE_EQ(radiusOf(group->members[0]), 1.0);

    auto* inner = dynamic_cast<Group*>(group->members[1].get());
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->primary, nullptr);
    EXPECT_TRUE(inner->members.empty());
}

TEST(DispatchSuppressionTest, WriteThenReadNestedValues) {
    auto group = std::make_unique<Group>();
    auto circle = std::make_unique<Circle>();
    circle->radius = 0.5;
    group->primary = std::move(circle);
    group->members.push_back(std::make_unique<Group>());
    std::unique_ptr<Shape> original = std::move(group);

    // JSON形式で書き出す
    auto json = getJsonContent(original);

    // JSONの内容が正しいか確認（全体比較）
    EXPECT_EQ(json,
        "{type:\"group\",primary:{type:\"circle\",radius:0.5},"
        "members:[{type:\"group\",primary:null,members:[]}]}");

    // null のフィールドは省略できる
    WriteOptions options;
    options.skipNullValues = true;
    EXPECT_EQ(getJsonContent(original, options),
        "{type:\"group\",primary:{type:\"circle\",radius:0.5},"
        "members:[{type:\"group\",members:[]}]}");

    // JSONから読み込む
    auto parsed = readJsonString<std::unique_ptr<Shape>>(json);
    EXPECT_EQ(getJsonContent(parsed), json);
}

TEST(DispatchSuppressionTest, SuppressionIsClearedAfterSuccess) {
    TokenizedInput input(nestedJson);

    auto shape = getConverter<std::unique_ptr<Shape>>().read(input.parser);

    EXPECT_NE(shape, nullptr);
    EXPECT_TRUE(input.parser.dispatchSuppression().empty());
    EXPECT_EQ(input.parser.depth(), 0u);
    EXPECT_NO_THROW(input.parser.expectEndOfStream());
}

TEST(DispatchSuppressionTest, SuppressionIsClearedAfterFailure) {
    // 入れ子の2段目で未登録の判別子
    TokenizedInput input("{type:\"group\",members:[{type:\"group\",members:[{type:\"square\"}]}]}");

    EXPECT_THROW(getConverter<std::unique_ptr<Shape>>().read(input.parser), UnhandledCaseError);
    EXPECT_TRUE(input.parser.dispatchSuppression().empty());
}

TEST(DispatchSuppressionTest, FailureDoesNotAffectLaterReads) {
    EXPECT_THROW(readJsonString<std::unique_ptr<Shape>>("{type:\"group\",primary:{radius:1}}"),
        SerializationError);

    auto shape = readJsonString<std::unique_ptr<Shape>>("{type:\"circle\",radius:4}");
    EXPECT_DOUBLE_EQ(radiusOf(shape), 4.0);
}

TEST(DispatchSuppressionTest, DeeplyNestedGroups) {
    constexpr int levels = 32;
    std::string json;
    for (int i = 0; i < levels; ++i) {
        json += "{type:\"group\",primary:";
    }
    json += "{type:\"circle\",radius:7}";
    for (int i = 0; i < levels; ++i) {
        json += "}";
    }

    auto shape = readJsonString<std::unique_ptr<Shape>>(json);
    const Shape* current = shape.get();
    for (int i = 0; i < levels; ++i) {
        const auto* group = dynamic_cast<const Group*>(current);
        ASSERT_NE(group, nullptr) << i;
        current = group->primary.get();
    }
    const auto* circle = dynamic_cast<const Circle*>(current);
    ASSERT_NE(circle, nullptr);
    EXPECT_DOUBLE_EQ(circle->radius, 7.0);
}

// ******************************************************************************** 並行読み込み

TEST(DispatchSuppressionTest, ConcurrentReadsShareConverter) {
    constexpr int threadCount = 8;
    constexpr int iterations = 200;
    std::atomic<int> succeeded{ 0 };
    std::atomic<int> failed{ 0 };

    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < iterations; ++i) {
                const std::string json = "{type:\"group\",members:[{type:\"circle\",radius:"
                    + std::to_string(t * iterations + i) + "}]}";
                try {
                    auto shape = readJsonString<std::unique_ptr<Shape>>(json);
                    const auto* group = dynamic_cast<const Group*>(shape.get());
                    if (group != nullptr && group->members.size() == 1
                        && radiusOf(group->members[0]) == static_cast<double>(t * iterations + i)) {
                        ++succeeded;
                    } else {
                        ++failed;
                    }
                } catch (const std::exception&) {
                    ++failed;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), threadCount * iterations);
    EXPECT_EQ(failed.load(), 0);
}
