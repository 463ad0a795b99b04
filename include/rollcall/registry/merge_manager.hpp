// ============= include/rollcall/registry/merge_manager.hpp =============
/*
 * Merge Manager - fusion y reversion de identidades
 *
 * - merge: candidate.merged_into_id = primary + fila de auditoria inmutable
 * - unmerge: marca unmerged/unmerged_at en la MISMA fila y limpia el oficial
 * - las apariciones nunca se mueven ni se borran
 * - auto merge solo con confianza > auto_threshold y sin conflictos
 *
 * ERRORES (ConsistencyError):
 *   self-merge, oficial inexistente, oficial ya fusionado,
 *   auto merge bajo umbral, unmerge de un merge ya revertido
 */

#pragma once
#include "rollcall/database/registry_database.hpp"
#include "rollcall/matching/face_matcher.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct MergeSuggestion {
    int64_t primary_id = -1;     // el mas antiguo
    int64_t candidate_id = -1;   // el mas nuevo
    float similarity = 0.0f;     // coseno
    std::vector<std::string> conflicts;

    bool has_conflict() const { return !conflicts.empty(); }
};

struct AutoMergeStats {
    int considered = 0;
    int merged = 0;
    int skipped_conflict = 0;
    int failed = 0;
};

class MergeManager {
public:
    struct Options {
        float auto_threshold = 0.95f;
        float suggest_threshold = 0.85f;

        static Options from_config(const RegistryConfig& config);
    };

    MergeManager(RegistryDatabase& db, Options options, FaceEmbeddingMatcher* matcher = nullptr);

    std::optional<int64_t> merge(int64_t primary_id, int64_t candidate_id, float confidence,
                                 bool auto_merge, const std::string& actor);

    bool unmerge(int64_t merge_id, const std::string& actor);

    std::vector<MergeRecord> history(int64_t officer_id);

    std::vector<MergeSuggestion> suggest_merges(std::optional<float> threshold = std::nullopt);

    AutoMergeStats run_auto_merge_pass(const std::string& actor = "auto");

    const Options& get_options() const { return options; }

private:
    RegistryDatabase& db;
    Options options;
    FaceEmbeddingMatcher* matcher;

    static std::vector<std::string> find_conflicts(const OfficerRecord& a, const OfficerRecord& b);
};

} // namespace rollcall
