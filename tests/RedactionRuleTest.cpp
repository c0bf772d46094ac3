#include "RedactionRule.hpp"

#include <gtest/gtest.h>

namespace {

TEST(RedactionRuleTest, DefaultRuleOrder) {
    const RuleSet rules = default_rule_set();
    ASSERT_EQ(rules.size(), 4u);
    EXPECT_EQ(rules[0].label, "EMAIL");
    EXPECT_EQ(rules[1].label, "IPV4");
    EXPECT_EQ(rules[2].label, "API_KEY");
    EXPECT_EQ(rules[3].label, "DB_URI");
}

TEST(RedactionRuleTest, OnlyApiKeyIsCaseInsensitive) {
    for (const auto& r : default_rule_set()) {
        EXPECT_EQ(r.case_insensitive, r.label == "API_KEY") << r.label;
    }
}

TEST(RedactionRuleTest, Placeholder) {
    EXPECT_EQ(placeholder_for("EMAIL"), "<EMAIL_REDACTED>");
    EXPECT_EQ(placeholder_for("API_KEY"), "<API_KEY_REDACTED>");
}

TEST(RedactionRuleTest, LabelShape) {
    EXPECT_TRUE(is_valid_label("EMAIL"));
    EXPECT_TRUE(is_valid_label("DB_URI"));
    EXPECT_TRUE(is_valid_label("IPV4"));
    EXPECT_FALSE(is_valid_label(""));
    EXPECT_FALSE(is_valid_label("email"));
    EXPECT_FALSE(is_valid_label("4IP"));
    EXPECT_FALSE(is_valid_label("_X"));
    EXPECT_FALSE(is_valid_label("A-B"));
    EXPECT_FALSE(is_valid_label("A B"));
}

}  // namespace
