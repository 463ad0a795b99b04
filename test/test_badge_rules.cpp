// ============= test/test_badge_rules.cpp =============
/*
 * Tests de BadgeRules: fuerza por prefijo, unidad, rango
 */

#include "rollcall/reconcile/badge_rules.hpp"
#include <gtest/gtest.h>

using namespace rollcall;

namespace {

class BadgeRulesTest : public ::testing::Test {
protected:
    BadgeRules rules;
};

bool has_indicator(const RuleOpinion& opinion, const std::string& needle) {
    for (const auto& i : opinion.indicators) {
        if (i.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

// ==================== PARSING ====================

TEST_F(BadgeRulesTest, NormalizeStripsSpacesAndDashes) {
    EXPECT_EQ(BadgeRules::normalize("  u-12 34 "), "U1234");
}

TEST_F(BadgeRulesTest, ExtractsPrefixAndNumber) {
    auto parts = rules.extract_badge_prefix("bx 5678");
    ASSERT_TRUE(parts.prefix && parts.number);
    EXPECT_EQ(*parts.prefix, "BX");
    EXPECT_EQ(*parts.number, "5678");

    auto numeric = rules.extract_badge_prefix("123456");
    EXPECT_FALSE(numeric.prefix.has_value());
    EXPECT_EQ(numeric.number, "123456");

    EXPECT_TRUE(rules.extract_badge_prefix("POLICE").empty());
    EXPECT_TRUE(rules.extract_badge_prefix("").empty());
}

// ==================== FORCE ====================

TEST_F(BadgeRulesTest, SingleLetterIsMetWithLowConfidence) {
    auto force = rules.detect_force("U1234");
    ASSERT_TRUE(force.value.has_value());
    EXPECT_EQ(*force.value, "Metropolitan Police Service");
    EXPECT_FLOAT_EQ(force.confidence, 0.65f);
}

TEST_F(BadgeRulesTest, SingleLetterNeedsThreeDigits) {
    EXPECT_FALSE(rules.detect_force("U12").value.has_value());
}

TEST_F(BadgeRulesTest, TwoLetterPrefix) {
    auto force = rules.detect_force("BX5678");
    EXPECT_EQ(force.value, "British Transport Police");
    EXPECT_FLOAT_EQ(force.confidence, 0.85f);
    EXPECT_TRUE(has_indicator(force, "Full prefix match"));
}

TEST_F(BadgeRulesTest, ThreeLetterPrefix) {
    auto force = rules.detect_force("GMP1234");
    EXPECT_EQ(force.value, "Greater Manchester Police");
    EXPECT_FLOAT_EQ(force.confidence, 0.9f);
}

TEST_F(BadgeRulesTest, PartialPrefixFallsBackToShorter) {
    auto force = rules.detect_force("GMX123");
    EXPECT_EQ(force.value, "Greater Manchester Police");
    EXPECT_FLOAT_EQ(force.confidence, 0.85f);
    EXPECT_TRUE(has_indicator(force, "Partial prefix match: GMX"));
}

TEST_F(BadgeRulesTest, RankPrefixIsNeverAForce) {
    // PS es Sergeant, no Police Scotland
    EXPECT_FALSE(rules.detect_force("PS1234").value.has_value());
    EXPECT_FALSE(rules.detect_force("PC4567").value.has_value());
    EXPECT_EQ(rules.detect_force("SC1234").value, "Police Scotland");
    EXPECT_TRUE(BadgeRules::is_rank_prefix("PCSO"));
    EXPECT_FALSE(BadgeRules::is_rank_prefix("BX"));
}

TEST_F(BadgeRulesTest, LongerPrefixStartingWithRankIsNeverAForce) {
    // Acortar PCS -> PC -> P no debe acabar en la Met
    for (const char* badge : {"PCS1234", "PSA1234", "CIX1234", "INSX123"}) {
        auto force = rules.detect_force(badge);
        EXPECT_FALSE(force.value.has_value()) << badge;
        EXPECT_EQ(force.confidence, 0.0f) << badge;
    }
    // Un codigo de fuerza completo sigue ganando
    EXPECT_EQ(rules.detect_force("PSNI1234").value, "Police Service of Northern Ireland");
    EXPECT_EQ(rules.detect_force("P1234").value, "Metropolitan Police Service");
}

TEST_F(BadgeRulesTest, UnknownPrefixHasNoForce) {
    auto force = rules.detect_force("1234");
    EXPECT_FALSE(force.value.has_value());
    EXPECT_EQ(force.confidence, 0.0f);
}

// ==================== RANK ====================

TEST_F(BadgeRulesTest, SergeantFromPrefix) {
    RankInsigniaHint hint;
    auto rank = rules.detect_rank("PS1234", &hint);
    EXPECT_EQ(rank.value, "Sergeant");
    EXPECT_FLOAT_EQ(rank.confidence, 0.85f);
    EXPECT_EQ(hint.chevrons, 3);
    EXPECT_TRUE(has_indicator(rank, "3 chevrons expected"));
}

TEST_F(BadgeRulesTest, RankToleratesSpaces) {
    EXPECT_EQ(rules.detect_rank("insp 204").value, "Inspector");
    EXPECT_EQ(rules.detect_rank("PCSO 9912").value, "PCSO");
}

TEST_F(BadgeRulesTest, SingleLetterInfersConstable) {
    RankInsigniaHint hint;
    auto rank = rules.detect_rank("U1234", &hint);
    EXPECT_EQ(rank.value, "Police Constable");
    EXPECT_FLOAT_EQ(rank.confidence, 0.5f);
    EXPECT_TRUE(hint.inferred);
}

TEST_F(BadgeRulesTest, NoRankForPlainNumber) {
    EXPECT_FALSE(rules.detect_rank("123456").value.has_value());
    EXPECT_FALSE(rules.detect_rank("").value.has_value());
}

// ==================== UNIT ====================

TEST_F(BadgeRulesTest, TsgFromBadgePattern) {
    auto unit = rules.detect_unit(std::string("U1234"), {}, std::nullopt);
    EXPECT_EQ(unit.value, "TSG");
    EXPECT_FLOAT_EQ(unit.confidence, 0.4f);
}

TEST_F(BadgeRulesTest, EquipmentAndUniformAccumulate) {
    auto unit = rules.detect_unit(std::nullopt,
                                  {"Video Camera", "blue tabard"},
                                  std::string("officer wearing a Blue Tabard"));
    EXPECT_EQ(unit.value, "FIT");
    // camera + video camera + tabard + uniforme
    EXPECT_FLOAT_EQ(unit.confidence, 0.9f);
}

TEST_F(BadgeRulesTest, UnitPatternsMatchRepeatedly) {
    for (int i = 0; i < 3; ++i) {
        auto unit = rules.detect_unit(std::string("SCO19 armed"), {"rifle"}, std::nullopt);
        EXPECT_EQ(unit.value, "SCO19");
        EXPECT_FLOAT_EQ(unit.confidence, 0.6f);
    }
}

TEST_F(BadgeRulesTest, DefaultsToStandard) {
    auto unit = rules.detect_unit(std::nullopt, {}, std::nullopt);
    EXPECT_EQ(unit.value, "Standard");
    EXPECT_FLOAT_EQ(unit.confidence, 0.3f);
    EXPECT_TRUE(has_indicator(unit, "Default to standard patrol"));
}

// ==================== ANALYZE ====================

TEST_F(BadgeRulesTest, AnalyzeSergeantBadge) {
    auto r = rules.analyze(std::string("PS1234"), {}, {}, std::nullopt);
    EXPECT_FALSE(r.force.value.has_value());
    EXPECT_EQ(r.rank.value, "Sergeant");
    EXPECT_EQ(r.shoulder_number.value, "PS1234");
    EXPECT_FLOAT_EQ(r.shoulder_number.confidence, 0.8f);
    EXPECT_EQ(r.method, DetectionMethod::PatternMatch);
}

TEST_F(BadgeRulesTest, AnalyzeCombined) {
    auto r = rules.analyze(std::string("U1234"), {}, {"riot shield"}, std::nullopt);
    EXPECT_EQ(r.force.value, "Metropolitan Police Service");
    EXPECT_EQ(r.unit.value, "TSG");
    EXPECT_EQ(r.method, DetectionMethod::Combined);
    EXPECT_STREQ(to_string(r.method), "combined");
}

TEST_F(BadgeRulesTest, AnalyzeFallsBackToOcrTexts) {
    auto r = rules.analyze(std::nullopt, {"POLICE", "BX 5678"}, {}, std::nullopt);
    EXPECT_EQ(r.force.value, "British Transport Police");
    EXPECT_EQ(r.shoulder_number.value, "BX5678");
    EXPECT_FLOAT_EQ(r.shoulder_number.confidence, 0.6f);
    EXPECT_FALSE(r.rank.value.has_value());
}

TEST_F(BadgeRulesTest, AnalyzeNothing) {
    auto r = rules.analyze(std::nullopt, {}, {}, std::nullopt);
    EXPECT_EQ(r.method, DetectionMethod::None);
    EXPECT_FALSE(r.shoulder_number.value.has_value());
}
