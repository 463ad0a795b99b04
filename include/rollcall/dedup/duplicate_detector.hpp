// ============= include/rollcall/dedup/duplicate_detector.hpp =============
/*
 * Duplicate Detector
 *
 * OPERACIONES:
 * - check_for_duplicate(): huellas + SimilarityIndex, sin escribir nada
 * - register_upload():     check + INSERT en una transaccion
 *     exact   -> se guarda (con sus hashes) pero NO se procesa
 *     similar -> se marca como duplicado y se procesa igual
 * - find_all_duplicates(): grupos por content_hash (original = id menor)
 * - backfill_hashes():     calcula hashes de media antigua sin hash
 */

#pragma once
#include "rollcall/database/registry_database.hpp"
#include "rollcall/dedup/similarity_index.hpp"
#include "rollcall/hashing/content_hasher.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct DuplicateCheckResult {
    bool is_duplicate = false;
    std::optional<DuplicateType> duplicate_type;
    std::optional<int64_t> original_id;
    MediaFingerprint fingerprint;
    std::optional<int> similarity_score;   // distancia Hamming (similar)
    MediaType type = MediaType::Other;

    Json::Value to_json() const;
};

struct UploadRegistration {
    int64_t media_id = -1;
    DuplicateCheckResult check;
    bool should_process = false;
};

struct DuplicateGroup {
    std::string content_hash;
    int64_t original_id = -1;
    std::vector<int64_t> duplicate_ids;

    Json::Value to_json() const;
};

struct BackfillStats {
    int processed = 0;
    int updated = 0;
    int failed = 0;
};

class DuplicateDetector {
public:
    DuplicateDetector(RegistryDatabase& db, const ContentHasher& hasher,
                      const SimilarityIndex::Options& options);

    DuplicateCheckResult check_for_duplicate(const std::string& path, MediaType type);
    DuplicateCheckResult check_for_duplicate(const std::string& path);

    // nullopt when the file is unreadable or the insert fails.
    std::optional<UploadRegistration> register_upload(const std::string& path, MediaType type);

    std::vector<DuplicateGroup> find_all_duplicates();

    bool compute_and_store_hashes(int64_t media_id);
    BackfillStats backfill_hashes(int batch_size = 100);

private:
    RegistryDatabase& db;
    ContentHasher hasher;
    SimilarityIndex index;

    DuplicateCheckResult classify(const MediaFingerprint& fp, MediaType type);
};

} // namespace rollcall
