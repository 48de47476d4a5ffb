#include <gtest/gtest.h>

#include "utils/utf8.hpp"

namespace codebox::utils {
namespace {

const std::string kReplacement = "\xEF\xBF\xBD";

TEST(Utf8Test, AcceptsWellFormedText) {
    EXPECT_TRUE(IsValidUtf8(""));
    EXPECT_TRUE(IsValidUtf8("plain ascii"));
    EXPECT_TRUE(IsValidUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
}

TEST(Utf8Test, RejectsMalformedSequences) {
    EXPECT_FALSE(IsValidUtf8("\xFF"));
    EXPECT_FALSE(IsValidUtf8("\xC3"));
    EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));
    EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));
    EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));
}

TEST(Utf8Test, SanitizeLeavesValidTextAlone) {
    const std::string text = "h\xC3\xA9llo\n";
    EXPECT_EQ(SanitizeUtf8(text), text);
}

TEST(Utf8Test, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(SanitizeUtf8("a\xFF" "b"), "a" + kReplacement + "b");
    EXPECT_EQ(SanitizeUtf8("\xE2\x82"), kReplacement);
    EXPECT_EQ(SanitizeUtf8("\xE2\x82x"), kReplacement + "x");
    EXPECT_EQ(SanitizeUtf8("\xFF\xFE"), kReplacement + kReplacement);
}

}  // namespace
}  // namespace codebox::utils
