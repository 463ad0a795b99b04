// ============= test/test_merge_manager.cpp =============
/*
 * Tests de MergeManager
 *
 * - merge + unmerge conservan la fila de auditoria original
 * - errores de consistencia: self-merge, doble unmerge, auto bajo umbral
 * - sugerencias ordenadas por similitud con conflictos de placa/fuerza
 * - el matcher sigue el estado de los merges
 */

#include "rollcall/core/errors.hpp"
#include "rollcall/registry/merge_manager.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace rollcall;
using rollcall::test::unit_embedding;

namespace {

constexpr int DIM = 8;

FaceEmbeddingMatcher::Options matcher_options() {
    FaceEmbeddingMatcher::Options o;
    o.threshold = 0.8f;
    o.dim = DIM;
    return o;
}

class MergeManagerTest : public ::testing::Test {
protected:
    RegistryDatabase db{":memory:"};
    FaceEmbeddingMatcher matcher{std::make_unique<LinearEmbeddingIndex>(), matcher_options()};
    MergeManager manager{db, MergeManager::Options{0.95f, 0.85f}, &matcher};

    int64_t add_officer(const Embedding& embedding,
                        const std::string& badge = "",
                        const std::string& force = "") {
        OfficerRecord o;
        if (!badge.empty()) o.detected[Field::Badge] = FieldResult::of(badge, 0.9f, FieldSource::Ocr);
        if (!force.empty()) o.detected[Field::Force] = FieldResult::of(force, 0.8f, FieldSource::Vision);
        o.face_embedding = embedding;
        o.embedding_quality = 0.5f;
        auto id = db.insert_officer(o).value();
        matcher.add(id, embedding);
        return id;
    }
};

} // namespace

// ==================== MERGE / UNMERGE ====================

TEST_F(MergeManagerTest, MergeAndUnmergeKeepAuditRow) {
    auto a = add_officer(unit_embedding(DIM, 0));
    auto b = add_officer(unit_embedding(DIM, 0, 0.1f, 1));
    ASSERT_EQ(matcher.size(), 2u);

    auto merge_id = manager.merge(a, b, 0.93f, false, "analyst");
    ASSERT_TRUE(merge_id.has_value());

    auto merged = db.get_officer(b);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->merged_into_id, a);
    EXPECT_EQ(db.count_officers(true), 1);
    EXPECT_EQ(matcher.size(), 1u);

    auto before = db.get_merge(*merge_id).value();
    EXPECT_FALSE(before.auto_merged);
    EXPECT_EQ(before.merged_by, "analyst");

    ASSERT_TRUE(manager.unmerge(*merge_id, "supervisor"));

    auto restored = db.get_officer(b);
    ASSERT_TRUE(restored.has_value());
    EXPECT_FALSE(restored->is_merged());
    EXPECT_EQ(matcher.size(), 2u);

    auto after = db.get_merge(*merge_id).value();
    EXPECT_TRUE(after.unmerged);
    EXPECT_EQ(after.unmerged_by, "supervisor");
    EXPECT_FLOAT_EQ(after.merge_confidence, 0.93f);
    EXPECT_EQ(after.merged_at, before.merged_at);

    auto history = manager.history(a);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, *merge_id);
}

TEST_F(MergeManagerTest, SelfMergeIsRejected) {
    auto a = add_officer(unit_embedding(DIM, 0));
    EXPECT_THROW(manager.merge(a, a, 0.99f, false, "analyst"), ConsistencyError);
    EXPECT_TRUE(db.list_merges().empty());
}

TEST_F(MergeManagerTest, SecondUnmergeIsRejected) {
    auto a = add_officer(unit_embedding(DIM, 0));
    auto b = add_officer(unit_embedding(DIM, 1));
    auto merge_id = manager.merge(a, b, 0.5f, false, "analyst");
    ASSERT_TRUE(merge_id.has_value());

    ASSERT_TRUE(manager.unmerge(*merge_id, "analyst"));
    EXPECT_THROW(manager.unmerge(*merge_id, "analyst"), ConsistencyError);
    EXPECT_THROW(manager.unmerge(999, "analyst"), ConsistencyError);
}

TEST_F(MergeManagerTest, AutoMergeNeedsConfidenceAboveThreshold) {
    auto a = add_officer(unit_embedding(DIM, 0));
    auto b = add_officer(unit_embedding(DIM, 1));
    EXPECT_THROW(manager.merge(a, b, 0.95f, true, "auto"), ConsistencyError);
    EXPECT_THROW(manager.merge(a, b, 1.5f, false, "analyst"), ConsistencyError);
    EXPECT_FALSE(db.get_officer(b)->is_merged());

    auto merge_id = manager.merge(a, b, 0.96f, true, "auto");
    ASSERT_TRUE(merge_id.has_value());
    EXPECT_TRUE(db.get_merge(*merge_id)->auto_merged);
}

TEST_F(MergeManagerTest, UnknownOrMergedOfficersAreRejected) {
    auto a = add_officer(unit_embedding(DIM, 0));
    auto b = add_officer(unit_embedding(DIM, 1));
    auto c = add_officer(unit_embedding(DIM, 2));

    EXPECT_THROW(manager.merge(a, 404, 0.9f, false, "analyst"), ConsistencyError);

    ASSERT_TRUE(manager.merge(a, b, 0.9f, false, "analyst").has_value());
    // b ya esta fusionado: no puede ser primario ni candidato
    EXPECT_THROW(manager.merge(c, b, 0.9f, false, "analyst"), ConsistencyError);
    EXPECT_THROW(manager.merge(b, c, 0.9f, false, "analyst"), ConsistencyError);
    EXPECT_EQ(db.list_merges().size(), 1u);
}

// ==================== SUGGESTIONS ====================

TEST_F(MergeManagerTest, SuggestionsSortedWithConflicts) {
    auto a = add_officer(unit_embedding(DIM, 0), "U1234", "Metropolitan Police Service");
    auto b = add_officer(unit_embedding(DIM, 0, 0.1f, 1), "u 1234", "metropolitan police service");
    auto c = add_officer(unit_embedding(DIM, 0, 0.5f, 2), "BX5678", "British Transport Police");
    add_officer(unit_embedding(DIM, 5));

    auto suggestions = manager.suggest_merges();
    ASSERT_EQ(suggestions.size(), 3u);

    // cos(a,b) ~ 0.995, cos(a,c) ~ 0.894, cos(b,c) ~ 0.890
    EXPECT_EQ(suggestions[0].primary_id, a);
    EXPECT_EQ(suggestions[0].candidate_id, b);
    EXPECT_FALSE(suggestions[0].has_conflict());

    EXPECT_EQ(suggestions[1].primary_id, a);
    EXPECT_EQ(suggestions[1].candidate_id, c);
    ASSERT_EQ(suggestions[1].conflicts.size(), 2u);
    EXPECT_EQ(suggestions[1].conflicts[0].rfind("Badge mismatch", 0), 0u);
    EXPECT_EQ(suggestions[1].conflicts[1].rfind("Force mismatch", 0), 0u);

    EXPECT_EQ(suggestions[2].primary_id, b);
    EXPECT_EQ(suggestions[2].candidate_id, c);
    EXPECT_GE(suggestions[0].similarity, suggestions[1].similarity);
    EXPECT_GE(suggestions[1].similarity, suggestions[2].similarity);

    EXPECT_EQ(manager.suggest_merges(0.99f).size(), 1u);
}

TEST_F(MergeManagerTest, SuggestionsIgnoreMergedOfficers) {
    auto a = add_officer(unit_embedding(DIM, 0));
    auto b = add_officer(unit_embedding(DIM, 0, 0.1f, 1));
    ASSERT_TRUE(manager.merge(a, b, 0.9f, false, "analyst").has_value());
    EXPECT_TRUE(manager.suggest_merges().empty());
}

// ==================== AUTO MERGE ====================

TEST_F(MergeManagerTest, AutoPassMergesOnlyConfidentCleanPairs) {
    auto a = add_officer(unit_embedding(DIM, 0), "U1234");
    auto b = add_officer(unit_embedding(DIM, 0, 0.1f, 1), "U1234");
    auto c = add_officer(unit_embedding(DIM, 3), "PS77");
    auto d = add_officer(unit_embedding(DIM, 3, 0.1f, 4), "BX5678");
    auto e = add_officer(unit_embedding(DIM, 0, 0.5f, 2));

    auto stats = manager.run_auto_merge_pass();
    EXPECT_EQ(stats.considered, 2);
    EXPECT_EQ(stats.merged, 1);
    EXPECT_EQ(stats.skipped_conflict, 1);
    EXPECT_EQ(stats.failed, 0);

    EXPECT_EQ(db.get_officer(b)->merged_into_id, a);
    EXPECT_FALSE(db.get_officer(d)->is_merged());
    EXPECT_FALSE(db.get_officer(e)->is_merged());
    EXPECT_FALSE(db.get_officer(c)->is_merged());

    auto merges = db.list_merges();
    ASSERT_EQ(merges.size(), 1u);
    EXPECT_TRUE(merges[0].auto_merged);
    EXPECT_EQ(merges[0].merged_by, "auto");

    // Una segunda pasada no encuentra nada nuevo
    auto again = manager.run_auto_merge_pass();
    EXPECT_EQ(again.merged, 0);
}
