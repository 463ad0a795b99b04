// ============= include/rollcall/database/registry_database.hpp =============
/*
 * Registry Database - SQLite Backend
 *
 * CARACTERÍSTICAS:
 * - Una conexion por instancia (un worker = una conexion)
 * - WAL + synchronous=NORMAL + foreign_keys=ON
 * - Embeddings como BLOB de floats
 * - Transaction: BEGIN IMMEDIATE / COMMIT, rollback en el destructor
 *
 * ERRORES:
 * - No se puede abrir / crear esquema -> RegistryError (constructor)
 * - Fallo de SQL en runtime           -> false / nullopt + spdlog::error
 * - Aparicion sin oficial persistido  -> ConsistencyError
 */

#pragma once
#include "rollcall/database/records.hpp"
#include "rollcall/dedup/fingerprint_store.hpp"
#include <sqlite3.h>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rollcall {

class RegistryDatabase : public FingerprintStore {
public:
    explicit RegistryDatabase(const std::string& db_path, int busy_timeout_ms = 5000);
    ~RegistryDatabase() override;

    RegistryDatabase(const RegistryDatabase&) = delete;
    RegistryDatabase& operator=(const RegistryDatabase&) = delete;

    // RAII transaction. Nested use is not supported.
    class Transaction {
    public:
        explicit Transaction(RegistryDatabase& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        bool commit();

    private:
        RegistryDatabase& db;
        bool active;
    };

    // ===== MEDIA =====
    std::optional<int64_t> insert_media(const MediaRecord& media);
    std::optional<MediaRecord> get_media(int64_t media_id);
    bool update_media_fingerprint(int64_t media_id, const MediaFingerprint& fp);
    bool mark_media_processed(int64_t media_id);
    std::vector<MediaRecord> media_missing_hashes(int64_t after_id, int limit);
    // content_hash -> media ids (ascending) for hashes shared by >1 media
    std::vector<std::pair<std::string, std::vector<int64_t>>> shared_content_hashes();
    int count_media();

    // ===== FINGERPRINT STORE =====
    std::optional<int64_t> find_original_by_content_hash(const std::string& content_hash) override;
    std::vector<HashCandidate> image_hash_batch(int64_t after_id, int limit) override;

    // ===== OFFICERS =====
    std::optional<int64_t> insert_officer(const OfficerRecord& officer);
    bool update_officer(const OfficerRecord& officer);
    std::optional<OfficerRecord> get_officer(int64_t officer_id);
    std::vector<OfficerRecord> list_officers(bool active_only);
    // Active officers with a stored embedding blob (may be malformed)
    std::vector<std::pair<int64_t, Embedding>> active_officer_embeddings();
    bool officer_exists(int64_t officer_id);
    bool set_officer_override(int64_t officer_id, Field field, const std::optional<std::string>& value);
    bool set_merge_state(int64_t officer_id,
                         std::optional<int64_t> merged_into_id,
                         std::optional<float> merge_confidence,
                         std::optional<std::string> merged_at);
    std::vector<int64_t> officers_merged_into(int64_t primary_id);
    int count_officers(bool active_only);

    // ===== APPEARANCES =====
    std::optional<int64_t> insert_appearance(const AppearanceRecord& appearance);
    std::optional<AppearanceRecord> get_appearance(int64_t appearance_id);
    std::vector<AppearanceRecord> appearances_for_officers(const std::vector<int64_t>& officer_ids);
    // Newest first
    std::vector<AppearanceRecord> recent_appearances(int limit);
    int count_appearances(int64_t officer_id);
    bool set_appearance_override(int64_t appearance_id, Field field, const std::optional<std::string>& value);
    bool verify_appearance(int64_t appearance_id, const std::string& actor);

    // ===== MERGES =====
    std::optional<int64_t> insert_merge(const MergeRecord& merge);
    std::optional<MergeRecord> get_merge(int64_t merge_id);
    bool mark_unmerged(int64_t merge_id, const std::string& actor, const std::string& at);
    std::vector<MergeRecord> merges_for_officer(int64_t officer_id);
    std::vector<MergeRecord> list_merges();

    sqlite3* handle() { return db; }
    const std::string& path() const { return db_path; }

private:
    sqlite3* db;
    std::string db_path;

    bool init_database(int busy_timeout_ms);
    bool create_tables();
    bool exec(const char* sql);

    FieldMap load_appearance_fields(int64_t appearance_id);
    bool insert_appearance_fields(int64_t appearance_id, const FieldMap& fields);
};

} // namespace rollcall
