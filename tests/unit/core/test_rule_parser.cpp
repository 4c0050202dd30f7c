#include <gtest/gtest.h>

#include "ironclad/core/masker.hpp"
#include "ironclad/core/rule_parser.hpp"
#include "test_helpers.hpp"

using namespace ironclad::core;
using namespace ironclad::test;
using ironclad::ErrorCode;

TEST(RuleParserTest, ParsesRulesInDocumentOrder) {
  auto rules = parseRules(R"({
    "zeta": {"visibleStart": 4, "visibleEnd": 4},
    "alpha": {"sensitivity": "high", "maskChar": "#"},
    "mid": {}
  })");
  ASSERT_OK(rules);
  ASSERT_EQ(rules->size(), 3u);

  auto it = rules->begin();
  EXPECT_EQ(it->pattern, "zeta");
  EXPECT_EQ(it->config.visible_start, 4u);
  EXPECT_EQ(it->config.visible_end, 4u);
  EXPECT_EQ(it->config.sensitivity, Sensitivity::kMedium);

  ++it;
  EXPECT_EQ(it->pattern, "alpha");
  EXPECT_EQ(it->config.sensitivity, Sensitivity::kHigh);
  EXPECT_EQ(it->config.mask->generate(2), "##");

  ++it;
  EXPECT_EQ(it->pattern, "mid");
  EXPECT_EQ(it->config.visible_start, kDefaultVisibleStart);
}

TEST(RuleParserTest, InvalidJsonIsParseError) {
  EXPECT_ERROR(parseRules("{not json"), ErrorCode::kParseError);
}

TEST(RuleParserTest, NonObjectTopLevelIsParseError) {
  EXPECT_ERROR(parseRules("[1, 2, 3]"), ErrorCode::kParseError);
  EXPECT_ERROR(parseRules("\"pattern\""), ErrorCode::kParseError);
}

TEST(RuleParserTest, MalformedFieldsFallBackToDefaults) {
  auto rules = parseRules(R"({
    "a": {"visibleStart": -3, "visibleEnd": "two", "maskChar": 5},
    "b": 42,
    "c": {"sensitivity": 7},
    "d": {"sensitivity": "extreme"}
  })");
  ASSERT_OK(rules);

  const auto* a = rules->find("a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->config.visible_start, kDefaultVisibleStart);
  EXPECT_EQ(a->config.visible_end, kDefaultVisibleEnd);
  EXPECT_EQ(a->config.mask->generate(1), "*");

  const auto* b = rules->find("b");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->config.visible_start, kDefaultVisibleStart);

  EXPECT_EQ(rules->find("c")->config.sensitivity, Sensitivity::kMedium);
  EXPECT_EQ(rules->find("d")->config.sensitivity, Sensitivity::kMedium);
}

TEST(RuleParserTest, BaseConfigSuppliesMissingFields) {
  MaskConfig base;
  base.withVisibleStart(1).withVisibleEnd(0).withMaskChar("x");

  auto rules = parseRules(R"({"\\d+": {"visibleEnd": 3}})", base);
  ASSERT_OK(rules);
  const auto& rule = *rules->begin();
  EXPECT_EQ(rule.pattern, "\\d+");
  EXPECT_EQ(rule.config.visible_start, 1u);
  EXPECT_EQ(rule.config.visible_end, 3u);
  EXPECT_EQ(rule.config.mask->generate(2), "xx");
}

TEST(RuleParserTest, RulesToJsonKeepsOrderAndFields) {
  auto rules = parseRules(R"({"b": {"visibleStart": 1}, "a": {"maskChar": "-"}})");
  ASSERT_OK(rules);

  auto json = rulesToJson(*rules);
  ASSERT_EQ(json.size(), 2u);
  EXPECT_EQ(json.begin().key(), "b");
  EXPECT_EQ(json["b"]["visibleStart"], 1);
  EXPECT_EQ(json["a"]["maskChar"], "-");
  EXPECT_EQ(json["a"]["sensitivity"], "medium");
}

TEST(RuleParserTest, MaskJsonValue) {
  EXPECT_EQ(maskJsonValue(nlohmann::json("secret1234")), "se****34");
  EXPECT_EQ(maskJsonValue(nlohmann::json(12345)), "");
  EXPECT_EQ(maskJsonValue(nlohmann::json(nullptr)), "");
  EXPECT_EQ(maskJsonValue(nlohmann::json::array()), "");
}

class RulesFileTest : public TempDirTest {};

TEST_F(RulesFileTest, LoadsRulesFromFile) {
  auto path = temp_dir_ / "rules.json";
  writeFile(path, R"({"[0-9]{3}-[0-9]{2}-[0-9]{4}": {"visibleStart": 0, "visibleEnd": 4}})");

  auto rules = loadRulesFile(path);
  ASSERT_OK(rules);
  ASSERT_EQ(rules->size(), 1u);
  EXPECT_EQ(rules->begin()->config.visible_end, 4u);
}

TEST_F(RulesFileTest, MissingFileIsFileNotFound) {
  EXPECT_ERROR(loadRulesFile(temp_dir_ / "nope.json"), ErrorCode::kFileNotFound);
}
