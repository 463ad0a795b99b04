// ============= test/test_reconciler.cpp =============
/*
 * Tests de DetectionReconciler
 *
 * PRECEDENCIA: override manual > vision (>= umbral) > reglas > nada
 * Conflictos vision/reglas quedan como nota en los indicadores.
 */

#include "rollcall/reconcile/confidence_scorer.hpp"
#include "rollcall/reconcile/detection_reconciler.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace rollcall;

namespace {

bool has_indicator(const FieldResult& r, const std::string& needle) {
    for (const auto& i : r.indicators) {
        if (i.find(needle) != std::string::npos) return true;
    }
    return false;
}

VisionOpinion vision_says(const std::string& value, float confidence) {
    VisionOpinion op;
    op.value = value;
    op.confidence = confidence;
    op.indicators = {"visual cue"};
    return op;
}

RuleOpinion rule_says(const std::string& value, float confidence) {
    RuleOpinion op;
    op.value = value;
    op.confidence = confidence;
    op.indicators = {"Badge prefix"};
    return op;
}

class ReconcilerTest : public ::testing::Test {
protected:
    BadgeRules rules;
    DetectionReconciler reconciler{rules, DetectionReconciler::Options{0.6f, 0.3f}};
};

} // namespace

// ==================== RESOLVE ====================

TEST_F(ReconcilerTest, ConfidentVisionBeatsConflictingRule) {
    auto r = reconciler.resolve(vision_says("City of London Police", 0.9f),
                                rule_says("Metropolitan Police Service", 0.65f));
    EXPECT_EQ(r.value, "City of London Police");
    EXPECT_EQ(r.source, FieldSource::Vision);
    EXPECT_FLOAT_EQ(r.confidence, 0.9f);
    EXPECT_TRUE(has_indicator(r, "Note: Vision detected 'City of London Police' but badge suggests "
                                 "'Metropolitan Police Service'"));
}

TEST_F(ReconcilerTest, RuleWinsWhenVisionBelowThreshold) {
    auto r = reconciler.resolve(vision_says("City of London Police", 0.4f),
                                rule_says("Metropolitan Police Service", 0.65f));
    EXPECT_EQ(r.value, "Metropolitan Police Service");
    EXPECT_EQ(r.source, FieldSource::RuleBased);
    EXPECT_TRUE(has_indicator(r, "Vision confidence 0.40 below threshold"));
    EXPECT_TRUE(has_indicator(r, "Note: Vision detected"));
}

TEST_F(ReconcilerTest, ThresholdIsInclusive) {
    auto r = reconciler.resolve(vision_says("TSG", 0.6f), rule_says("Standard", 0.3f));
    EXPECT_EQ(r.source, FieldSource::Vision);
}

TEST_F(ReconcilerTest, AgreementHasNoConflictNote) {
    auto r = reconciler.resolve(vision_says("sergeant", 0.8f), rule_says("Sergeant", 0.85f));
    EXPECT_EQ(r.source, FieldSource::Vision);
    EXPECT_FALSE(has_indicator(r, "Note:"));
}

TEST_F(ReconcilerTest, WeakVisionAloneYieldsNoValue) {
    auto r = reconciler.resolve(vision_says("Inspector", 0.3f), RuleOpinion{});
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.source, FieldSource::None);
    EXPECT_TRUE(has_indicator(r, "Vision suggested 'Inspector' below threshold"));
}

TEST_F(ReconcilerTest, NothingYieldsEmpty) {
    auto r = reconciler.resolve(VisionOpinion{}, RuleOpinion{});
    EXPECT_FALSE(r.has_value());
    EXPECT_TRUE(r.indicators.empty());
}

TEST_F(ReconcilerTest, ManualOverrideBeatsEverything) {
    auto detected = reconciler.resolve(vision_says("Kent Police", 0.95f), RuleOpinion{});

    OverrideMap overrides{{Field::Force, "Essex Police"}};
    auto effective = effective_value(Field::Force, overrides, detected);
    EXPECT_EQ(effective.value, "Essex Police");
    EXPECT_EQ(effective.source, FieldSource::Manual);
    EXPECT_FLOAT_EQ(effective.confidence, 1.0f);

    // Override vacio = sin override
    OverrideMap cleared{{Field::Force, ""}};
    EXPECT_EQ(effective_value(Field::Force, cleared, detected).value, "Kent Police");
}

// ==================== RECONCILE ====================

TEST_F(ReconcilerTest, OcrOnlySignals) {
    DetectionSignals signals;
    signals.ocr = {{"U 1234", 0.9f}, {"John Smith", 0.8f}, {"blurry", 0.1f}};

    auto record = reconciler.reconcile(signals);

    EXPECT_EQ(record.get(Field::Badge).value, "U1234");
    EXPECT_EQ(record.get(Field::Badge).source, FieldSource::Ocr);
    EXPECT_EQ(record.get(Field::Name).value, "John Smith");
    EXPECT_EQ(record.get(Field::Name).source, FieldSource::Ocr);
    EXPECT_EQ(record.get(Field::Force).value, "Metropolitan Police Service");
    EXPECT_EQ(record.get(Field::Force).source, FieldSource::RuleBased);
    EXPECT_EQ(record.get(Field::Unit).value, "TSG");
    EXPECT_EQ(record.get(Field::Rank).value, "Police Constable");
    EXPECT_EQ(record.get(Field::ShoulderNumber).value, "U1234");
    EXPECT_EQ(record.rules.method, DetectionMethod::Combined);
}

TEST_F(ReconcilerTest, VisionOverridesRulesPerField) {
    DetectionSignals signals;
    signals.ocr = {{"PS1234", 0.9f}};

    VisionAnalysis vision;
    vision.force = vision_says("City of London Police", 0.9f);
    vision.rank = vision_says("Inspector", 0.5f);
    vision.equipment.push_back({"riot shield", 0.8f, "protective"});
    signals.vision = vision;

    auto record = reconciler.reconcile(signals);

    EXPECT_EQ(record.get(Field::Force).source, FieldSource::Vision);
    // Vision bajo umbral: el rango sale del prefijo PS
    EXPECT_EQ(record.get(Field::Rank).value, "Sergeant");
    EXPECT_EQ(record.get(Field::Rank).source, FieldSource::RuleBased);
    EXPECT_TRUE(has_indicator(record.get(Field::Rank), "Note: Vision detected 'Inspector'"));
    // El equipo de vision alimenta las reglas de unidad
    EXPECT_EQ(record.get(Field::Unit).value, "TSG");
}

TEST_F(ReconcilerTest, VisionShoulderNumberFillsMissingBadge) {
    DetectionSignals signals;
    VisionAnalysis vision;
    vision.shoulder_number = vision_says("bx 5678", 0.7f);
    vision.name = vision_says("Jane Doe", 0.8f);
    signals.vision = vision;

    auto record = reconciler.reconcile(signals);
    EXPECT_EQ(record.get(Field::Badge).value, "BX5678");
    EXPECT_EQ(record.get(Field::Badge).source, FieldSource::Vision);
    EXPECT_EQ(record.get(Field::ShoulderNumber).value, "bx 5678");
    EXPECT_EQ(record.get(Field::Name).value, "Jane Doe");
}

TEST_F(ReconcilerTest, EmptySignals) {
    auto record = reconciler.reconcile(DetectionSignals{});
    EXPECT_FALSE(record.get(Field::Force).has_value());
    EXPECT_FALSE(record.get(Field::Badge).has_value());
    EXPECT_EQ(record.get(Field::Unit).value, "Standard");

    auto json = record.to_json();
    EXPECT_TRUE(json["force"]["value"].isNull());
    EXPECT_EQ(json["unit"]["source"].asString(), "rule_based");
    EXPECT_EQ(json["method"].asString(), "none");
}

TEST_F(ReconcilerTest, AttributionIsMeanOfFilledFields) {
    ReconciledRecord record;
    record.fields[Field::Force] = FieldResult::of("A", 0.8f, FieldSource::Vision);
    record.fields[Field::Rank] = FieldResult::of("B", 0.4f, FieldSource::RuleBased);
    record.fields[Field::Name] = FieldResult{};
    EXPECT_FLOAT_EQ(record.attribution_confidence(), 0.6f);
    EXPECT_EQ(ReconciledRecord{}.attribution_confidence(), 0.0f);
}

// ==================== OCR ====================

TEST(OcrCandidates, BadgeNeedsDigitsAndShortText) {
    std::vector<OcrReading> readings = {
        {"POLICE", 0.99f},
        {"A1", 0.95f},
        {"U1234", 0.7f},
        {"ABCDEFG12", 0.9f},
    };
    auto badge = badge_candidate(readings);
    ASSERT_TRUE(badge.has_value());
    EXPECT_EQ(badge->text, "U1234");
}

TEST(OcrCandidates, NameIsTwoOrThreeWords) {
    EXPECT_FALSE(name_candidate({{"smith", 0.9f}}).has_value());
    EXPECT_FALSE(name_candidate({{"PC 1234", 0.9f}}).has_value());

    auto name = name_candidate({{"Mary  O'Neil", 0.8f}});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name->text, "Mary O'Neil");
}

TEST(OcrCandidates, FilterDropsLowConfidenceAndEmpty) {
    auto kept = filter_readings({{"a", 0.5f}, {"b", 0.2f}, {"", 0.9f}}, 0.3f);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].text, "a");
}

// ==================== CONFIDENCE ====================

TEST(ConfidenceScorer, MeanOfClampedFactors) {
    ConfidenceInputs in;
    in.face_detection = 0.9f;
    in.blur_score = 250.0;            // face_quality 1.0
    in.match_distance = 0.4f;         // identity_match 0.5
    in.match_threshold = 0.8f;
    in.attribution = 0.6f;

    auto s = score_confidence(in);
    EXPECT_EQ(s.score, 75);
    EXPECT_EQ(s.factors["factor_count"].asInt(), 4);
    EXPECT_DOUBLE_EQ(s.factors["face_quality"].asDouble(), 1.0);
}

TEST(ConfidenceScorer, NoFactorsScoresZero) {
    auto s = score_confidence(ConfidenceInputs{});
    EXPECT_EQ(s.score, 0);
    EXPECT_EQ(s.factors["factor_count"].asInt(), 0);
    EXPECT_NE(s.factors_json().find("factor_count"), std::string::npos);
}

TEST(ConfidenceScorer, InfiniteDistanceIsIgnored) {
    ConfidenceInputs in;
    in.face_detection = 1.0f;
    in.match_distance = std::numeric_limits<float>::infinity();
    auto s = score_confidence(in);
    EXPECT_EQ(s.score, 100);
    EXPECT_FALSE(s.factors.isMember("identity_match"));
}
