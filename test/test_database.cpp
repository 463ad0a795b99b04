// ============= test/test_database.cpp =============
/*
 * Tests de RegistryDatabase
 *
 * - transacciones (commit / rollback en destructor)
 * - aparicion sin oficial -> ConsistencyError
 * - filas de officer_merges inmutables
 * - overrides y verificacion
 */

#include "rollcall/core/errors.hpp"
#include "rollcall/database/registry_database.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace rollcall;
using rollcall::test::TempDir;
using rollcall::test::unit_embedding;

namespace {

class DatabaseTest : public ::testing::Test {
protected:
    RegistryDatabase db{":memory:"};

    int64_t add_media(const std::string& path = "clip.mp4") {
        MediaRecord m;
        m.path = path;
        m.type = MediaType::Video;
        return db.insert_media(m).value();
    }

    int64_t add_officer(const std::string& badge = "U1234") {
        OfficerRecord o;
        o.detected[Field::Badge] = FieldResult::of(badge, 0.9f, FieldSource::Ocr, {"OCR text"});
        o.detected[Field::Force] = FieldResult::of("Metropolitan Police Service", 0.65f, FieldSource::RuleBased);
        o.face_embedding = unit_embedding(8, 1);
        o.embedding_quality = 0.7f;
        return db.insert_officer(o).value();
    }

    int64_t add_appearance(int64_t officer_id, int64_t media_id, int frame = 0) {
        AppearanceRecord a;
        a.officer_id = officer_id;
        a.media_id = media_id;
        a.frame_number = frame;
        a.bbox = cv::Rect(10, 20, 30, 40);
        a.fields[Field::Rank] = FieldResult::of("Sergeant", 0.85f, FieldSource::RuleBased,
                                                {"Badge prefix pattern: Sergeant"});
        a.confidence = 72;
        return db.insert_appearance(a).value();
    }

    bool raw_exec(const char* sql) {
        return sqlite3_exec(db.handle(), sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }
};

} // namespace

// ==================== OPEN ====================

TEST(RegistryDatabaseOpen, CreatesParentDirectory) {
    TempDir dir;
    auto path = dir.file("nested/deeper/registry.db");
    {
        RegistryDatabase db(path);
        EXPECT_EQ(db.count_media(), 0);
    }
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(RegistryDatabaseOpen, UnopenablePathThrows) {
    TempDir dir;
    // Un directorio no es una base de datos
    EXPECT_THROW(RegistryDatabase db(dir.path.string()), RegistryError);
}

// ==================== TRANSACTIONS ====================

TEST_F(DatabaseTest, CommitPersists) {
    {
        RegistryDatabase::Transaction tx(db);
        add_media("a.jpg");
        EXPECT_TRUE(tx.commit());
        EXPECT_FALSE(tx.commit());
    }
    EXPECT_EQ(db.count_media(), 1);
}

TEST_F(DatabaseTest, DestructorRollsBack) {
    {
        RegistryDatabase::Transaction tx(db);
        add_media("a.jpg");
        add_officer();
    }
    EXPECT_EQ(db.count_media(), 0);
    EXPECT_EQ(db.count_officers(false), 0);
}

TEST_F(DatabaseTest, RollbackOnException) {
    auto media = add_media();
    try {
        RegistryDatabase::Transaction tx(db);
        add_officer();
        AppearanceRecord orphan;
        orphan.officer_id = 999;
        orphan.media_id = media;
        db.insert_appearance(orphan);
        tx.commit();
        FAIL() << "expected ConsistencyError";
    } catch (const ConsistencyError&) {
    }
    EXPECT_EQ(db.count_officers(false), 0);
}

// ==================== OFFICERS ====================

TEST_F(DatabaseTest, OfficerRoundTrip) {
    auto id = add_officer("BX5678");
    auto o = db.get_officer(id);
    ASSERT_TRUE(o.has_value());

    EXPECT_EQ(o->detected[Field::Badge].value, "BX5678");
    EXPECT_EQ(o->detected[Field::Badge].source, FieldSource::Ocr);
    EXPECT_FLOAT_EQ(o->detected[Field::Force].confidence, 0.65f);
    EXPECT_EQ(o->face_embedding, unit_embedding(8, 1));
    EXPECT_FALSE(o->is_merged());
    EXPECT_FALSE(o->created_at.empty());
}

TEST_F(DatabaseTest, OverrideSetAndClear) {
    auto id = add_officer();
    ASSERT_TRUE(db.set_officer_override(id, Field::Force, std::string("City of London Police")));

    auto o = db.get_officer(id);
    ASSERT_TRUE(o.has_value());
    auto eff = effective_value(*o, Field::Force);
    EXPECT_EQ(eff.value, "City of London Police");
    EXPECT_EQ(eff.source, FieldSource::Manual);
    // La deteccion original se conserva
    EXPECT_EQ(o->detected[Field::Force].value, "Metropolitan Police Service");

    ASSERT_TRUE(db.set_officer_override(id, Field::Force, std::nullopt));
    o = db.get_officer(id);
    EXPECT_EQ(effective_value(*o, Field::Force).source, FieldSource::RuleBased);

    EXPECT_FALSE(db.set_officer_override(id, Field::ShoulderNumber, std::string("x")));
    EXPECT_FALSE(db.set_officer_override(999, Field::Force, std::string("x")));
}

TEST_F(DatabaseTest, ActiveEmbeddingsExcludeMerged) {
    auto a = add_officer("A1111");
    auto b = add_officer("B2222");
    ASSERT_TRUE(db.set_merge_state(b, a, 0.97f, std::string("2024-01-01 00:00:00")));

    auto active = db.active_officer_embeddings();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].first, a);
    EXPECT_EQ(db.count_officers(true), 1);
    EXPECT_EQ(db.count_officers(false), 2);
    EXPECT_EQ(db.officers_merged_into(a), std::vector<int64_t>{b});
}

TEST_F(DatabaseTest, OfficersCannotBeDeleted) {
    add_officer();
    EXPECT_FALSE(raw_exec("DELETE FROM officers"));
    EXPECT_EQ(db.count_officers(false), 1);
}

// ==================== APPEARANCES ====================

TEST_F(DatabaseTest, AppearanceWithoutOfficerIsConsistencyError) {
    auto media = add_media();
    AppearanceRecord a;
    a.officer_id = 42;
    a.media_id = media;
    EXPECT_THROW(db.insert_appearance(a), ConsistencyError);
    EXPECT_EQ(db.count_appearances(42), 0);
}

TEST_F(DatabaseTest, AppearanceFieldsAndOrder) {
    auto officer = add_officer();
    auto m1 = add_media("one.mp4");
    auto m2 = add_media("two.mp4");
    auto late = add_appearance(officer, m2, 5);
    auto second = add_appearance(officer, m1, 9);
    auto first = add_appearance(officer, m1, 3);

    auto list = db.appearances_for_officers({officer});
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].id, first);
    EXPECT_EQ(list[1].id, second);
    EXPECT_EQ(list[2].id, late);

    const auto& rank = list[0].fields.at(Field::Rank);
    EXPECT_EQ(rank.value, "Sergeant");
    EXPECT_EQ(rank.source, FieldSource::RuleBased);
    ASSERT_EQ(rank.indicators.size(), 1u);
    EXPECT_EQ(list[0].bbox, cv::Rect(10, 20, 30, 40));
    EXPECT_EQ(list[0].confidence, 72);
}

TEST_F(DatabaseTest, AppearanceOverrideAndVerify) {
    auto officer = add_officer();
    auto app = add_appearance(officer, add_media());

    ASSERT_TRUE(db.set_appearance_override(app, Field::Role, std::string("Evidence gatherer")));
    ASSERT_TRUE(db.verify_appearance(app, "reviewer"));

    auto a = db.get_appearance(app);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(effective_value(*a, Field::Role).value, "Evidence gatherer");
    EXPECT_EQ(effective_value(*a, Field::Rank).value, "Sergeant");
    EXPECT_TRUE(a->verified);
    EXPECT_EQ(a->verified_by, "reviewer");
    EXPECT_TRUE(a->verified_at.has_value());

    EXPECT_FALSE(db.set_appearance_override(app, Field::Unit, std::string("TSG")));
    EXPECT_FALSE(db.verify_appearance(999, "reviewer"));
}

TEST_F(DatabaseTest, RecentAppearancesNewestFirstWithEffectiveBadge) {
    auto officer = add_officer();
    auto media = add_media();
    auto older = add_appearance(officer, media, 1);

    AppearanceRecord a;
    a.officer_id = officer;
    a.media_id = media;
    a.frame_number = 2;
    a.fields[Field::Badge] = FieldResult::of("BX5678", 0.8f, FieldSource::Vision);
    auto newer = db.insert_appearance(a).value();

    auto recent = db.recent_appearances(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].id, newer);
    EXPECT_EQ(recent[1].id, older);
    // Sin lectura OCR: el badge sale de los campos reconciliados
    EXPECT_FALSE(recent[0].ocr_badge_text.has_value());
    EXPECT_EQ(effective_value(recent[0], Field::Badge).value, "BX5678");

    ASSERT_TRUE(db.set_appearance_override(newer, Field::Badge, std::string("BX5679")));
    EXPECT_EQ(effective_value(db.recent_appearances(1).at(0), Field::Badge).value, "BX5679");
}

TEST_F(DatabaseTest, ForceDistributionIgnoresEmptyOverride) {
    add_officer();
    auto cleared = add_officer();
    auto moved = add_officer();
    OfficerRecord unknown;
    ASSERT_TRUE(db.insert_officer(unknown).has_value());

    ASSERT_TRUE(db.set_officer_override(cleared, Field::Force, std::string("")));
    ASSERT_TRUE(db.set_officer_override(moved, Field::Force, std::string("Kent Police")));

    auto dist = force_distribution(db.list_officers(true));
    ASSERT_EQ(dist.size(), 3u);
    EXPECT_EQ(dist[0], (std::pair<std::string, int>{"Metropolitan Police Service", 2}));
    EXPECT_EQ(dist[1], (std::pair<std::string, int>{"Kent Police", 1}));
    EXPECT_EQ(dist[2], (std::pair<std::string, int>{"Unknown", 1}));
}

// ==================== MERGES ====================

TEST_F(DatabaseTest, MergeRowsAreImmutable) {
    auto a = add_officer();
    auto b = add_officer();

    MergeRecord m;
    m.primary_officer_id = a;
    m.merged_officer_id = b;
    m.merge_confidence = 0.91f;
    m.merged_at = "2024-03-01 12:00:00";
    m.merged_by = std::string("analyst");
    auto id = db.insert_merge(m);
    ASSERT_TRUE(id.has_value());

    EXPECT_FALSE(raw_exec("UPDATE officer_merges SET merge_confidence = 0.1"));
    EXPECT_FALSE(raw_exec("UPDATE officer_merges SET merged_at = 'now'"));
    EXPECT_FALSE(raw_exec("DELETE FROM officer_merges"));

    // El unmerge si puede marcarse
    ASSERT_TRUE(db.mark_unmerged(*id, "analyst", "2024-03-02 09:00:00"));

    auto stored = db.get_merge(*id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FLOAT_EQ(stored->merge_confidence, 0.91f);
    EXPECT_EQ(stored->merged_at, "2024-03-01 12:00:00");
    EXPECT_TRUE(stored->unmerged);
    EXPECT_EQ(stored->unmerged_by, "analyst");
    EXPECT_EQ(db.merges_for_officer(b).size(), 1u);
    EXPECT_EQ(db.list_merges().size(), 1u);
}
