// ============= src/dedup/duplicate_detector.cpp =============
#include "rollcall/dedup/duplicate_detector.hpp"
#include "rollcall/core/utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace rollcall {

// ==================== JSON ====================

Json::Value DuplicateCheckResult::to_json() const {
    Json::Value root;
    root["is_duplicate"] = is_duplicate;
    root["duplicate_type"] = duplicate_type ? Json::Value(to_string(*duplicate_type)) : Json::Value();
    root["original_id"] = original_id ? Json::Value(static_cast<Json::Int64>(*original_id)) : Json::Value();
    root["content_hash"] = fingerprint.content_hash ? Json::Value(*fingerprint.content_hash) : Json::Value();
    root["perceptual_hash"] = fingerprint.perceptual_hash ? Json::Value(*fingerprint.perceptual_hash) : Json::Value();
    root["file_size"] = fingerprint.readable()
        ? Json::Value(static_cast<Json::Int64>(fingerprint.file_size)) : Json::Value();
    root["similarity_score"] = similarity_score ? Json::Value(*similarity_score) : Json::Value();
    return root;
}

Json::Value DuplicateGroup::to_json() const {
    Json::Value root;
    root["type"] = "exact";
    root["hash"] = content_hash;
    root["original_id"] = static_cast<Json::Int64>(original_id);

    Json::Value ids(Json::arrayValue);
    for (int64_t id : duplicate_ids) ids.append(static_cast<Json::Int64>(id));
    root["duplicate_ids"] = ids;
    return root;
}

// ==================== DETECTOR ====================

DuplicateDetector::DuplicateDetector(RegistryDatabase& db, const ContentHasher& hasher,
                                     const SimilarityIndex::Options& options)
    : db(db), hasher(hasher), index(db, options)
{
    spdlog::info("Duplicate detector: pHash threshold={} bits, batch={}, cap={}",
                 options.threshold, options.batch_size, options.max_candidates);
}

DuplicateCheckResult DuplicateDetector::classify(const MediaFingerprint& fp, MediaType type) {
    DuplicateCheckResult result;
    result.fingerprint = fp;
    result.type = type;

    auto match = index.find_duplicate(fp.content_hash, fp.perceptual_hash, type);
    if (match.kind == MatchKind::Exact) {
        result.is_duplicate = true;
        result.duplicate_type = DuplicateType::Exact;
        result.original_id = match.original_id;
    } else if (match.kind == MatchKind::Similar) {
        result.is_duplicate = true;
        result.duplicate_type = DuplicateType::Similar;
        result.original_id = match.original_id;
        result.similarity_score = match.distance;
    }
    return result;
}

DuplicateCheckResult DuplicateDetector::check_for_duplicate(const std::string& path, MediaType type) {
    auto fp = hasher.hash_file(path, type);
    if (!fp.readable()) {
        DuplicateCheckResult result;
        result.type = type;
        return result;
    }
    return classify(fp, type);
}

DuplicateCheckResult DuplicateDetector::check_for_duplicate(const std::string& path) {
    return check_for_duplicate(path, media_type_from_path(path));
}

std::optional<UploadRegistration> DuplicateDetector::register_upload(const std::string& path, MediaType type) {
    // Hash fuera de la transaccion: es la parte cara
    auto fp = hasher.hash_file(path, type);
    if (!fp.readable()) {
        spdlog::warn("Upload ignorado, archivo ilegible: {}", path);
        return std::nullopt;
    }

    RegistryDatabase::Transaction tx(db);

    UploadRegistration reg;
    reg.check = classify(fp, type);

    MediaRecord media;
    media.path = path;
    media.type = type;
    media.content_hash = fp.content_hash;
    media.perceptual_hash = fp.perceptual_hash;
    media.file_size = fp.file_size;
    media.is_duplicate = reg.check.is_duplicate;
    media.duplicate_of_id = reg.check.original_id;
    media.duplicate_type = reg.check.duplicate_type;
    media.similarity_distance = reg.check.similarity_score;

    auto id = db.insert_media(media);
    if (!id || !tx.commit()) {
        spdlog::error("No se pudo registrar media {}", path);
        return std::nullopt;
    }

    reg.media_id = *id;
    reg.should_process = reg.check.duplicate_type != DuplicateType::Exact;

    if (reg.check.is_duplicate) {
        spdlog::info("Media {} es duplicado {} de {}", reg.media_id,
                     to_string(*reg.check.duplicate_type), *reg.check.original_id);
    } else {
        spdlog::info("✓ Media {} registrada ({})", reg.media_id, path);
    }
    return reg;
}

std::vector<DuplicateGroup> DuplicateDetector::find_all_duplicates() {
    std::vector<DuplicateGroup> groups;

    for (const auto& [hash, ids] : db.shared_content_hashes()) {
        DuplicateGroup group;
        group.content_hash = hash;
        group.original_id = ids.front();
        group.duplicate_ids.assign(ids.begin() + 1, ids.end());
        groups.push_back(group);
    }
    return groups;
}

bool DuplicateDetector::compute_and_store_hashes(int64_t media_id) {
    auto media = db.get_media(media_id);
    if (!media || media->path.empty()) {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(media->path, ec)) {
        spdlog::warn("Backfill: archivo no existe {}", media->path);
        return false;
    }

    auto fp = hasher.hash_file(media->path, media->type);
    if (!fp.readable()) {
        return false;
    }
    return db.update_media_fingerprint(media_id, fp);
}

BackfillStats DuplicateDetector::backfill_hashes(int batch_size) {
    BackfillStats stats;

    for (const auto& media : db.media_missing_hashes(0, batch_size)) {
        stats.processed++;
        if (compute_and_store_hashes(media.id)) {
            stats.updated++;
        } else {
            stats.failed++;
        }
    }

    spdlog::info("Backfill: {} procesados, {} actualizados, {} fallidos",
                 stats.processed, stats.updated, stats.failed);
    return stats;
}

} // namespace rollcall
