// ============= include/rollcall/registry/identity_registry.hpp =============
/*
 * Identity Registry - un rostro detectado -> oficial + aparicion
 *
 * ESTADOS por avistamiento:
 *   Detected -> Embedded -> Matched | Created -> Reconciled -> Persisted
 *
 *   - Detected requiere bbox no vacia
 *   - sin embedding se salta Embedded y va directo a Created
 *   - oficial (nuevo o actualizado) + aparicion se escriben en UNA transaccion
 *   - los oficiales creados se agregan al indice tras el commit, asi el
 *     siguiente rostro del mismo run ya los ve
 *
 * Dentro de un media: frames en orden, rostros en orden.
 */

#pragma once
#include "rollcall/analysis/frame_analyzer.hpp"
#include "rollcall/analysis/sighting.hpp"
#include "rollcall/database/registry_database.hpp"
#include "rollcall/matching/face_matcher.hpp"
#include "rollcall/reconcile/detection_reconciler.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

enum class SightingStage { Detected, Embedded, Matched, Created, Reconciled, Persisted };

const char* to_string(SightingStage stage);

struct SightingOutcome {
    SightingStage stage = SightingStage::Detected;
    bool rejected = false;
    std::string error;

    MatchResult match;
    bool new_officer = false;
    std::optional<int64_t> officer_id;
    std::optional<int64_t> appearance_id;
    int confidence = 0;

    bool persisted() const { return stage == SightingStage::Persisted; }
};

struct MediaOutcome {
    int sightings = 0;
    int persisted = 0;
    int matched = 0;
    int new_officers = 0;
    int rejected = 0;
    int failed = 0;
};

struct OfficerProfile {
    OfficerRecord officer;
    FieldMap effective;                     // override > detectado
    std::vector<int64_t> merged_officer_ids; // recursivo
    int appearance_count = 0;
    std::vector<AppearanceRecord> timeline;
};

class IdentityRegistry {
public:
    IdentityRegistry(RegistryDatabase& db, FaceEmbeddingMatcher& matcher,
                     const DetectionReconciler& reconciler);

    // Carga el pool de oficiales activos con embedding en el matcher
    size_t load_officers();

    SightingOutcome process_sighting(int64_t media_id, const Sighting& sighting);

    MediaOutcome process_media(int64_t media_id, const std::vector<Sighting>& sightings);
    MediaOutcome process_frames(int64_t media_id, const std::vector<FrameInput>& frames,
                                const FrameAnalyzer& analyzer);

    // ===== OPERADOR =====
    bool set_officer_override(int64_t officer_id, Field field, const std::optional<std::string>& value);
    bool set_appearance_override(int64_t appearance_id, Field field, const std::optional<std::string>& value);
    bool verify_appearance(int64_t appearance_id, const std::string& actor);

    std::optional<OfficerProfile> profile(int64_t officer_id);
    std::vector<int64_t> merged_into_recursive(int64_t officer_id);

private:
    RegistryDatabase& db;
    FaceEmbeddingMatcher& matcher;
    const DetectionReconciler& reconciler;

    OfficerRecord new_officer_from(const ReconciledRecord& record, const Sighting& sighting) const;
    bool absorb(OfficerRecord& officer, const ReconciledRecord& record, const Sighting& sighting) const;
};

// Calidad de rostro en [0,1] a partir del blur
float face_quality(const Sighting& sighting);

} // namespace rollcall
