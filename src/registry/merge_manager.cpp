// ============= src/registry/merge_manager.cpp =============
#include "rollcall/registry/merge_manager.hpp"
#include "rollcall/core/errors.hpp"
#include "rollcall/core/utils.hpp"
#include "rollcall/reconcile/badge_rules.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace rollcall {

MergeManager::MergeManager(RegistryDatabase& db, Options options, FaceEmbeddingMatcher* matcher)
    : db(db), options(options), matcher(matcher) {}

// ==================== MERGE ====================

std::optional<int64_t> MergeManager::merge(int64_t primary_id, int64_t candidate_id, float confidence,
                                           bool auto_merge, const std::string& actor) {
    if (primary_id == candidate_id) {
        throw ConsistencyError("cannot merge officer " + std::to_string(primary_id) + " into itself");
    }
    if (confidence < 0.0f || confidence > 1.0f) {
        throw ConsistencyError("merge confidence out of range: " + std::to_string(confidence));
    }
    if (auto_merge && confidence <= options.auto_threshold) {
        throw ConsistencyError("automatic merge requires confidence above " +
                               std::to_string(options.auto_threshold));
    }

    auto primary = db.get_officer(primary_id);
    auto candidate = db.get_officer(candidate_id);
    if (!primary || !candidate) {
        throw ConsistencyError("merge references unknown officer");
    }
    if (primary->is_merged()) {
        throw ConsistencyError("primary officer " + std::to_string(primary_id) + " is already merged");
    }
    if (candidate->is_merged()) {
        throw ConsistencyError("officer " + std::to_string(candidate_id) + " is already merged");
    }

    std::string now = now_timestamp();

    RegistryDatabase::Transaction tx(db);
    if (!db.set_merge_state(candidate_id, primary_id, confidence, now)) {
        spdlog::error("Merge {} -> {}: no se pudo actualizar el oficial", candidate_id, primary_id);
        return std::nullopt;
    }

    MergeRecord record;
    record.primary_officer_id = primary_id;
    record.merged_officer_id = candidate_id;
    record.merge_confidence = confidence;
    record.auto_merged = auto_merge;
    record.merged_at = now;
    record.merged_by = actor;

    auto merge_id = db.insert_merge(record);
    if (!merge_id || !tx.commit()) {
        spdlog::error("Merge {} -> {}: no se pudo registrar la auditoria", candidate_id, primary_id);
        return std::nullopt;
    }

    if (matcher) matcher->remove(candidate_id);

    spdlog::info("✓ Merge #{}: oficial {} -> {} (conf {:.3f}, {}, por {})",
                 *merge_id, candidate_id, primary_id, confidence, auto_merge ? "auto" : "manual", actor);
    return merge_id;
}

bool MergeManager::unmerge(int64_t merge_id, const std::string& actor) {
    auto record = db.get_merge(merge_id);
    if (!record) {
        throw ConsistencyError("unknown merge record " + std::to_string(merge_id));
    }
    if (record->unmerged) {
        throw ConsistencyError("merge " + std::to_string(merge_id) + " was already reversed");
    }

    RegistryDatabase::Transaction tx(db);
    if (!db.mark_unmerged(merge_id, actor, now_timestamp())) {
        spdlog::error("Unmerge #{}: no se pudo marcar la auditoria", merge_id);
        return false;
    }

    auto officer = db.get_officer(record->merged_officer_id);
    if (officer && officer->merged_into_id == record->primary_officer_id) {
        if (!db.set_merge_state(officer->id, std::nullopt, std::nullopt, std::nullopt)) {
            spdlog::error("Unmerge #{}: no se pudo restaurar el oficial {}", merge_id, officer->id);
            return false;
        }
    }
    if (!tx.commit()) return false;

    if (matcher && officer && !officer->face_embedding.empty()) {
        matcher->add(officer->id, officer->face_embedding);
    }

    spdlog::info("✓ Unmerge #{}: oficial {} vuelve a ser independiente (por {})",
                 merge_id, record->merged_officer_id, actor);
    return true;
}

std::vector<MergeRecord> MergeManager::history(int64_t officer_id) {
    return db.merges_for_officer(officer_id);
}

// ==================== SUGERENCIAS ====================

std::vector<std::string> MergeManager::find_conflicts(const OfficerRecord& a, const OfficerRecord& b) {
    std::vector<std::string> conflicts;

    auto badge_a = effective_value(a, Field::Badge);
    auto badge_b = effective_value(b, Field::Badge);
    if (badge_a.has_value() && badge_b.has_value() &&
        BadgeRules::normalize(*badge_a.value) != BadgeRules::normalize(*badge_b.value)) {
        conflicts.push_back("Badge mismatch: '" + *badge_a.value + "' vs '" + *badge_b.value + "'");
    }

    auto force_a = effective_value(a, Field::Force);
    auto force_b = effective_value(b, Field::Force);
    if (force_a.has_value() && force_b.has_value() &&
        to_lower(*force_a.value) != to_lower(*force_b.value)) {
        conflicts.push_back("Force mismatch: '" + *force_a.value + "' vs '" + *force_b.value + "'");
    }
    return conflicts;
}

std::vector<MergeSuggestion> MergeManager::suggest_merges(std::optional<float> threshold) {
    float min_similarity = threshold.value_or(options.suggest_threshold);

    std::vector<OfficerRecord> officers;
    for (auto& o : db.list_officers(true)) {
        if (!o.face_embedding.empty()) officers.push_back(std::move(o));
    }
    std::sort(officers.begin(), officers.end(),
              [](const OfficerRecord& a, const OfficerRecord& b) { return a.id < b.id; });

    std::vector<MergeSuggestion> suggestions;
    for (size_t i = 0; i < officers.size(); ++i) {
        for (size_t j = i + 1; j < officers.size(); ++j) {
            if (officers[i].face_embedding.size() != officers[j].face_embedding.size()) continue;

            float sim = cosine_similarity(officers[i].face_embedding, officers[j].face_embedding);
            if (sim < min_similarity) continue;

            MergeSuggestion s;
            s.primary_id = officers[i].id;
            s.candidate_id = officers[j].id;
            s.similarity = sim;
            s.conflicts = find_conflicts(officers[i], officers[j]);
            suggestions.push_back(std::move(s));
        }
    }

    std::stable_sort(suggestions.begin(), suggestions.end(),
                     [](const MergeSuggestion& a, const MergeSuggestion& b) { return a.similarity > b.similarity; });

    spdlog::info("Sugerencias de merge: {} pares >= {:.2f} entre {} oficiales",
                 suggestions.size(), min_similarity, officers.size());
    return suggestions;
}

AutoMergeStats MergeManager::run_auto_merge_pass(const std::string& actor) {
    AutoMergeStats stats;
    std::set<int64_t> touched;

    for (const auto& s : suggest_merges(options.auto_threshold)) {
        if (s.similarity <= options.auto_threshold) continue;
        stats.considered++;

        if (s.has_conflict()) {
            stats.skipped_conflict++;
            spdlog::info("Auto merge {} -> {} omitido: {}", s.candidate_id, s.primary_id, s.conflicts.front());
            continue;
        }
        // Un oficial ya fusionado en esta pasada no puede volver a participar
        if (touched.count(s.candidate_id) || touched.count(s.primary_id)) continue;

        try {
            if (merge(s.primary_id, s.candidate_id, s.similarity, true, actor)) {
                stats.merged++;
                touched.insert(s.candidate_id);
            } else {
                stats.failed++;
            }
        } catch (const ConsistencyError& e) {
            stats.failed++;
            spdlog::warn("Auto merge {} -> {} rechazado: {}", s.candidate_id, s.primary_id, e.what());
        }
    }

    spdlog::info("Auto merge: {} considerados, {} fusionados, {} con conflicto, {} fallidos",
                 stats.considered, stats.merged, stats.skipped_conflict, stats.failed);
    return stats;
}

} // namespace rollcall
