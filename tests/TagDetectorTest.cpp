#include "sampleconv/model/TagDetector.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace sampleconv::model {
namespace {

std::vector<common::CategoryRule> testCategories() {
    return {common::CategoryRule{"Bass", {"bass", "sub"}},
            common::CategoryRule{"Strings", {"cello", "violin"}},
            common::CategoryRule{"Winds", {"bassoon", "flute"}}};
}

}  // namespace

TEST(TagDetectorTest, CreatorTagMatchesCaseInsensitively) {
    const std::vector<std::string> parts = {"Warm Piano", "ACME Sounds"};
    const std::vector<std::string> tags = {"Orbit", "Acme"};

    EXPECT_EQ(detectCreator(parts, tags, "Nobody"), "Acme");
}

TEST(TagDetectorTest, CreatorFallsBackToDefault) {
    const std::vector<std::string> parts = {"Warm Piano"};
    const std::vector<std::string> tags = {"", "Orbit"};

    EXPECT_EQ(detectCreator(parts, tags, "Nobody"), "Nobody");
    EXPECT_EQ(detectCreator(parts, {}, ""), "");
}

TEST(TagDetectorTest, CategoryPrefersEarliestPathPart) {
    const std::vector<std::string> parts = {"Cello Solo", "Bass Library"};
    EXPECT_EQ(detectCategory(parts, testCategories()), "Strings");
}

TEST(TagDetectorTest, CategoryMatchesWholeWordsOnly) {
    const std::vector<std::string> parts = {"Bassoon_legato", "Misc"};
    EXPECT_EQ(detectCategory(parts, testCategories()), "Winds");

    const std::vector<std::string> noMatch = {"Subtle", "Misc"};
    EXPECT_TRUE(detectCategory(noMatch, testCategories()).empty());
}

TEST(TagDetectorTest, KeywordsFollowVocabularyOrder) {
    const std::vector<std::string> parts = {"Warm-Soft Pad", "Soft Collection"};
    const std::vector<std::string> vocabulary = {"dark", "soft", "warm"};

    const std::vector<std::string> expected = {"soft", "warm"};
    EXPECT_EQ(detectKeywords(parts, vocabulary), expected);
}

}  // namespace sampleconv::model
