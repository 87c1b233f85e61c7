#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "Serialization/CaseRegistry.hpp"

using namespace kirikae::serialization;

TEST(CaseRegistryTest, FindsRegisteredDecoder) {
    const CaseRegistry<int, std::string> registry({
        { 0, "success" },
        { 1, "failure" },
    });
    EXPECT_EQ(registry.size(), 2u);
    ASSERT_NE(registry.find(1), nullptr);
    EXPECT_EQ(*registry.find(1), "failure");
    EXPECT_EQ(registry.find(2), nullptr);
}

TEST(CaseRegistryTest, LaterRegistrationWins) {
    const CaseRegistry<int, std::string> registry({
        { 7, "first" },
        { 7, "second" },
    });
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(*registry.find(7), "second");
}

TEST(CaseRegistryTest, EmptyRegistry) {
    const CaseRegistry<std::string, int> registry(std::vector<std::pair<std::string, int>>{});
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.find("anything"), nullptr);
}

TEST(CaseRegistryTest, StringCasesAreCaseSensitive) {
    const CaseRegistry<std::string, int> registry({
        { "dog", 1 },
        { "Dog", 2 },
    });
    EXPECT_EQ(*registry.find("dog"), 1);
    EXPECT_EQ(*registry.find("Dog"), 2);
    EXPECT_EQ(registry.find("DOG"), nullptr);
}
