// ============= test/test_matching.cpp =============
/*
 * Tests de FaceEmbeddingMatcher, indices y calibracion de umbrales
 */

#include "rollcall/matching/face_matcher.hpp"
#include "rollcall/matching/hnsw_index.hpp"
#include "rollcall/matching/threshold_calibrator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>

using namespace rollcall;
using rollcall::test::unit_embedding;

namespace {

constexpr int DIM = 8;

FaceEmbeddingMatcher make_matcher(float threshold = 0.8f, bool enabled = true) {
    FaceEmbeddingMatcher::Options options;
    options.enabled = enabled;
    options.threshold = threshold;
    options.dim = DIM;
    return FaceEmbeddingMatcher(std::make_unique<LinearEmbeddingIndex>(), options);
}

std::vector<Embedding> random_unit_vectors(int count, int dim, uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);

    std::vector<Embedding> out;
    for (int i = 0; i < count; ++i) {
        Embedding e(dim);
        for (auto& v : e) v = dist(gen);
        l2_normalize(e);
        out.push_back(e);
    }
    return out;
}

} // namespace

// ==================== EMBEDDING ====================

TEST(Embedding, DistanceAndCosine) {
    auto a = unit_embedding(DIM, 0);
    auto b = unit_embedding(DIM, 1);
    EXPECT_NEAR(euclidean_distance(a, b), std::sqrt(2.0f), 1e-5);
    EXPECT_NEAR(cosine_similarity(a, a), 1.0f, 1e-6);
    EXPECT_NEAR(cosine_similarity(a, b), 0.0f, 1e-6);
    EXPECT_EQ(cosine_similarity(a, Embedding(DIM, 0.0f)), 0.0f);
}

TEST(Embedding, ValidityChecks) {
    EXPECT_TRUE(is_valid_embedding(unit_embedding(DIM, 2), DIM));
    EXPECT_FALSE(is_valid_embedding(Embedding{}, DIM));
    EXPECT_FALSE(is_valid_embedding(unit_embedding(4, 0), DIM));

    auto bad = unit_embedding(DIM, 0);
    bad[3] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(is_valid_embedding(bad, DIM));
}

TEST(Embedding, BlobRoundTripAndMalformedBlob) {
    auto e = unit_embedding(DIM, 5, 0.25f, 1);
    auto blob = serialize_embedding(e);
    EXPECT_EQ(deserialize_embedding(blob.data(), static_cast<int>(blob.size())), e);
    EXPECT_TRUE(deserialize_embedding(blob.data(), 7).empty());
}

// ==================== MATCHER ====================

TEST(FaceMatcher, CloseEmbeddingMatches) {
    auto matcher = make_matcher();
    matcher.load({{1, unit_embedding(DIM, 0)}});

    auto result = matcher.match(unit_embedding(DIM, 0, 0.3f, 1));
    ASSERT_TRUE(result.matched());
    EXPECT_EQ(result.officer_id, 1);
    EXPECT_NEAR(result.distance, 0.3f, 1e-5);
}

TEST(FaceMatcher, FarEmbeddingIsNewIdentity) {
    auto matcher = make_matcher();
    matcher.load({{1, unit_embedding(DIM, 0)}});

    auto result = matcher.match(unit_embedding(DIM, 0, 1.5f, 1));
    EXPECT_EQ(result.status, MatchStatus::NewIdentity);
    EXPECT_FALSE(result.officer_id.has_value());
    EXPECT_EQ(result.nearest_id, 1);
    EXPECT_NEAR(result.distance, 1.5f, 1e-5);
}

TEST(FaceMatcher, ThresholdIsInclusive) {
    auto matcher = make_matcher(0.5f);
    matcher.load({{1, unit_embedding(DIM, 0)}});
    EXPECT_TRUE(matcher.match(unit_embedding(DIM, 0, 0.5f, 1)).matched());
}

TEST(FaceMatcher, PicksNearestOfficer) {
    auto matcher = make_matcher();
    matcher.load({
        {1, unit_embedding(DIM, 0)},
        {2, unit_embedding(DIM, 0, 0.2f, 1)},
        {3, unit_embedding(DIM, 2)},
    });

    auto result = matcher.match(unit_embedding(DIM, 0, 0.25f, 1));
    ASSERT_TRUE(result.matched());
    EXPECT_EQ(result.officer_id, 2);
}

TEST(FaceMatcher, MissingEmbeddingNeverMatches) {
    auto matcher = make_matcher();
    matcher.load({{1, unit_embedding(DIM, 0)}});

    auto result = matcher.match(std::nullopt);
    EXPECT_EQ(result.status, MatchStatus::Unavailable);
    EXPECT_TRUE(std::isinf(result.distance));
}

TEST(FaceMatcher, DisabledMatcherNeverMatches) {
    auto matcher = make_matcher(0.8f, false);
    matcher.load({{1, unit_embedding(DIM, 0)}});
    EXPECT_EQ(matcher.match(unit_embedding(DIM, 0)).status, MatchStatus::Unavailable);
    EXPECT_FALSE(matcher.add(2, unit_embedding(DIM, 1)));
}

TEST(FaceMatcher, WrongDimensionIsInvalid) {
    auto matcher = make_matcher();
    matcher.load({{1, unit_embedding(DIM, 0)}});
    EXPECT_EQ(matcher.match(unit_embedding(4, 0)).status, MatchStatus::InvalidEmbedding);
}

TEST(FaceMatcher, MalformedStoredEmbeddingsAreSkipped) {
    auto matcher = make_matcher();
    Embedding nan_embedding = unit_embedding(DIM, 0);
    nan_embedding[1] = std::numeric_limits<float>::infinity();

    size_t loaded = matcher.load({
        {1, unit_embedding(DIM, 0)},
        {2, Embedding{}},
        {3, unit_embedding(3, 0)},
        {4, nan_embedding},
    });
    EXPECT_EQ(loaded, 1u);
    EXPECT_EQ(matcher.size(), 1u);
}

TEST(FaceMatcher, EmptyPoolIsNewIdentity) {
    auto matcher = make_matcher();
    auto result = matcher.match(unit_embedding(DIM, 0));
    EXPECT_EQ(result.status, MatchStatus::NewIdentity);
    EXPECT_FALSE(result.nearest_id.has_value());
}

TEST(FaceMatcher, AddAndRemoveUpdatePool) {
    auto matcher = make_matcher();
    EXPECT_TRUE(matcher.add(9, unit_embedding(DIM, 3)));
    EXPECT_TRUE(matcher.match(unit_embedding(DIM, 3)).matched());

    EXPECT_TRUE(matcher.remove(9));
    EXPECT_FALSE(matcher.remove(9));
    EXPECT_FALSE(matcher.match(unit_embedding(DIM, 3)).matched());
}

TEST(FaceMatcher, MatchAgainstExplicitCandidates) {
    auto matcher = make_matcher();
    auto result = matcher.match_against(unit_embedding(DIM, 4),
                                        {{5, unit_embedding(DIM, 4, 0.1f, 0)}, {6, Embedding{}}});
    ASSERT_TRUE(result.matched());
    EXPECT_EQ(result.officer_id, 5);
}

// ==================== HNSW ====================

TEST(HnswIndex, AgreesWithLinearScan) {
    const int dim = 32;
    auto vectors = random_unit_vectors(150, dim, 7);
    auto queries = random_unit_vectors(20, dim, 11);

    std::vector<std::pair<int64_t, Embedding>> entries;
    for (size_t i = 0; i < vectors.size(); ++i) {
        entries.emplace_back(static_cast<int64_t>(i + 1), vectors[i]);
    }

    LinearEmbeddingIndex linear;
    HnswEmbeddingIndex hnsw(dim);
    linear.rebuild(entries);
    hnsw.rebuild(entries);
    ASSERT_EQ(hnsw.size(), linear.size());

    int agree = 0;
    for (const auto& q : queries) {
        auto a = linear.find_nearest(q);
        auto b = hnsw.find_nearest(q);
        ASSERT_TRUE(a && b);
        if (a->officer_id == b->officer_id) agree++;
    }
    EXPECT_GE(agree, 19);
}

TEST(HnswIndex, RemovedOfficerIsNeverReturned) {
    const int dim = 16;
    auto vectors = random_unit_vectors(40, dim, 3);

    HnswEmbeddingIndex hnsw(dim);
    for (size_t i = 0; i < vectors.size(); ++i) {
        hnsw.add(static_cast<int64_t>(i + 1), vectors[i]);
    }

    ASSERT_TRUE(hnsw.remove(1));
    auto nearest = hnsw.find_nearest(vectors[0]);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_NE(nearest->officer_id, 1);
    EXPECT_EQ(hnsw.size(), 39u);

    auto top = hnsw.search(vectors[5], 3);
    ASSERT_FALSE(top.empty());
    EXPECT_EQ(top.front().officer_id, 6);
    for (size_t i = 1; i < top.size(); ++i) {
        EXPECT_LE(top[i - 1].distance, top[i].distance);
    }
}

TEST(HnswIndex, MatcherFactory) {
    auto index = FaceEmbeddingMatcher::make_index(IndexKind::Hnsw, DIM);
    ASSERT_NE(dynamic_cast<HnswEmbeddingIndex*>(index.get()), nullptr);
    auto linear = FaceEmbeddingMatcher::make_index(IndexKind::Linear, DIM);
    ASSERT_NE(dynamic_cast<LinearEmbeddingIndex*>(linear.get()), nullptr);
}

// ==================== CALIBRATION ====================

TEST(ThresholdCalibrator, ConfusionCounts) {
    ThresholdCalibrator calibrator;
    calibrator.add_pair(0.2, true);
    calibrator.add_pair(0.5, true);
    calibrator.add_pair(0.9, true);
    calibrator.add_pair(0.7, false);
    calibrator.add_pair(1.4, false);

    auto m = calibrator.evaluate(0.6);
    EXPECT_EQ(m.tp, 2);
    EXPECT_EQ(m.fn, 1);
    EXPECT_EQ(m.fp, 0);
    EXPECT_EQ(m.tn, 2);
    EXPECT_DOUBLE_EQ(m.precision, 1.0);
    EXPECT_NEAR(m.recall, 2.0 / 3.0, 1e-9);
}

TEST(ThresholdCalibrator, SweepPicksBestF1) {
    ThresholdCalibrator calibrator;
    calibrator.add_pair(0.3, true);
    calibrator.add_pair(0.4, true);
    calibrator.add_pair(1.2, false);
    calibrator.add_pair(1.3, false);

    auto report = calibrator.sweep(0.0, 1.5, 0.1);
    EXPECT_EQ(report.sweep.size(), 16u);
    EXPECT_DOUBLE_EQ(report.best.f1, 1.0);
    EXPECT_GE(report.best.threshold, 0.4 - 1e-9);
    EXPECT_LT(report.best.threshold, 1.2);
}

TEST(ThresholdCalibrator, InvalidInputsAreDropped) {
    ThresholdCalibrator calibrator;
    calibrator.add_pair(std::numeric_limits<double>::infinity(), true);
    EXPECT_FALSE(calibrator.add_hash_pair("ff", "fff", true));
    EXPECT_TRUE(calibrator.add_hash_pair("ff", "fe", true));
    EXPECT_EQ(calibrator.size(), 1u);

    EXPECT_TRUE(calibrator.sweep(1.0, 0.0, 0.1).sweep.empty());
}
