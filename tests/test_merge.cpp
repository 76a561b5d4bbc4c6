/**
 * @file test_merge.cpp
 * @brief Tests for configuration layer merging
 */

#include <gtest/gtest.h>
#include "locsync/Config.hpp"
#include "locsync/Merge.hpp"

using namespace locsync;

// ============================================================================
// Object merges
// ============================================================================

TEST(DeepMerge, BothEmpty) {
    auto result = deep_merge(Value::object(), Value::object());
    EXPECT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}

TEST(DeepMerge, NestedSectionsCombine) {
    Value base = {{"output", {{"indent", 2}, {"color", true}}}};
    Value over = {{"output", {{"indent", 4}}}, {"locales", {{"dir", "lang"}}}};
    auto result = deep_merge(base, over);

    EXPECT_EQ(result["output"]["indent"], 4);
    EXPECT_EQ(result["output"]["color"], true);
    EXPECT_EQ(result["locales"]["dir"], "lang");
}

TEST(DeepMerge, KeepsBaseOrderAndAppendsNewKeys) {
    Value base = {{"b", 1}, {"a", 2}};
    Value over = {{"c", 3}, {"a", 4}};
    auto result = deep_merge(base, over);

    EXPECT_EQ(result.dump(), R"({"b":1,"a":4,"c":3})");
}

// ============================================================================
// Replacement
// ============================================================================

TEST(DeepMerge, ScalarReplacesObject) {
    Value base = {{"locales", {{"dir", "i18n"}}}};
    Value over = {{"locales", "flat"}};
    EXPECT_EQ(deep_merge(base, over)["locales"], "flat");
}

TEST(DeepMerge, ObjectReplacesScalar) {
    Value base = {{"placeholder", "X"}};
    Value over = {{"placeholder", {{"prefix", "TODO: "}}}};
    auto result = deep_merge(base, over);
    EXPECT_TRUE(result["placeholder"].is_object());
    EXPECT_EQ(result["placeholder"]["prefix"], "TODO: ");
}

TEST(DeepMerge, ArrayReplacesArray) {
    Value base = {{"list", {1, 2, 3}}};
    Value over = {{"list", {9, 8}}};
    EXPECT_EQ(deep_merge(base, over)["list"], Value::array({9, 8}));
}

TEST(DeepMerge, NullLayerIsIgnored) {
    Value base = {{"a", 1}};
    EXPECT_EQ(deep_merge(base, nullptr), base);
}

// ============================================================================
// deep_merge_all
// ============================================================================

TEST(DeepMergeAll, LaterLayersWin) {
    Value defaults = default_config();
    Value file = {{"locales", {{"reference", "de.json"}}}};
    Value cli = {{"output", {{"indent", 4}}}, {"locales", {{"dir", "lang"}}}};

    auto result = deep_merge_all({defaults, file, cli});

    EXPECT_EQ(result["locales"]["dir"], "lang");
    EXPECT_EQ(result["locales"]["reference"], "de.json");
    EXPECT_EQ(result["locales"]["extension"], ".json");
    EXPECT_EQ(result["output"]["indent"], 4);
    EXPECT_EQ(result["output"]["color"], true);
}

TEST(DeepMergeAll, EmptySources) {
    auto result = deep_merge_all({});
    EXPECT_TRUE(result.is_object());
    EXPECT_TRUE(result.empty());
}
