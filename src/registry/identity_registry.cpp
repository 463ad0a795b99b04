// ============= src/registry/identity_registry.cpp =============
#include "rollcall/registry/identity_registry.hpp"
#include "rollcall/core/errors.hpp"
#include "rollcall/reconcile/confidence_scorer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace rollcall {

const char* to_string(SightingStage stage) {
    switch (stage) {
        case SightingStage::Detected:   return "detected";
        case SightingStage::Embedded:   return "embedded";
        case SightingStage::Matched:    return "matched";
        case SightingStage::Created:    return "created";
        case SightingStage::Reconciled: return "reconciled";
        case SightingStage::Persisted:  return "persisted";
    }
    return "detected";
}

float face_quality(const Sighting& sighting) {
    if (!sighting.blur_score) return 0.0f;
    return static_cast<float>(std::clamp(*sighting.blur_score / 100.0, 0.0, 1.0));
}

IdentityRegistry::IdentityRegistry(RegistryDatabase& db, FaceEmbeddingMatcher& matcher,
                                   const DetectionReconciler& reconciler)
    : db(db), matcher(matcher), reconciler(reconciler) {}

size_t IdentityRegistry::load_officers() {
    auto candidates = db.active_officer_embeddings();
    size_t loaded = matcher.load(candidates);
    spdlog::info("Registry: {} oficiales activos con embedding ({} en BD)", loaded, candidates.size());
    return loaded;
}

// ==================== OFICIALES ====================

OfficerRecord IdentityRegistry::new_officer_from(const ReconciledRecord& record,
                                                 const Sighting& sighting) const {
    OfficerRecord officer;
    for (Field f : officer_fields()) {
        const FieldResult& r = record.get(f);
        if (r.has_value()) officer.detected[f] = r;
    }
    if (sighting.embedding && is_valid_embedding(*sighting.embedding, static_cast<int>(sighting.embedding->size()))) {
        officer.face_embedding = *sighting.embedding;
        officer.embedding_quality = face_quality(sighting);
    }
    officer.primary_crop_path = sighting.crop_path;
    return officer;
}

// Devuelve true si el oficial cambio
bool IdentityRegistry::absorb(OfficerRecord& officer, const ReconciledRecord& record,
                              const Sighting& sighting) const {
    bool changed = false;

    for (Field f : officer_fields()) {
        const FieldResult& incoming = record.get(f);
        if (!incoming.has_value()) continue;

        auto it = officer.detected.find(f);
        if (it == officer.detected.end() || !it->second.has_value() ||
            incoming.confidence > it->second.confidence) {
            officer.detected[f] = incoming;
            changed = true;
        }
    }

    // Embedding: se reemplaza (no se promedia) si el rostro nuevo es mejor
    if (sighting.embedding && !sighting.embedding->empty()) {
        float quality = face_quality(sighting);
        if (officer.face_embedding.empty() || quality > officer.embedding_quality) {
            officer.face_embedding = *sighting.embedding;
            officer.embedding_quality = quality;
            if (sighting.crop_path) officer.primary_crop_path = sighting.crop_path;
            changed = true;
        }
    }
    return changed;
}

// ==================== AVISTAMIENTO ====================

SightingOutcome IdentityRegistry::process_sighting(int64_t media_id, const Sighting& sighting) {
    SightingOutcome out;

    // Detected
    if (sighting.bbox.empty()) {
        out.rejected = true;
        out.error = "empty bounding box";
        spdlog::debug("Avistamiento rechazado en media {}: bbox vacia", media_id);
        return out;
    }

    // Embedded
    std::optional<Embedding> embedding;
    if (sighting.embedding && !sighting.embedding->empty()) {
        embedding = sighting.embedding;
        out.stage = SightingStage::Embedded;
    }

    // Matched | Created
    out.match = matcher.match(embedding);
    std::optional<OfficerRecord> officer;

    if (out.match.matched()) {
        officer = db.get_officer(*out.match.officer_id);
        if (!officer || officer->is_merged()) {
            spdlog::warn("Oficial {} del indice ya no esta activo, se crea uno nuevo", *out.match.officer_id);
            matcher.remove(*out.match.officer_id);
            officer.reset();
        }
    }
    if (out.match.status == MatchStatus::InvalidEmbedding) {
        spdlog::warn("Embedding invalido en media {}, se trata como no emparejable", media_id);
        embedding.reset();
    }

    out.new_officer = !officer.has_value();
    out.stage = out.new_officer ? SightingStage::Created : SightingStage::Matched;

    // Reconciled
    ReconciledRecord record = reconciler.reconcile(sighting.signals);

    ConfidenceInputs inputs;
    inputs.face_detection = sighting.detection_confidence;
    inputs.blur_score = sighting.blur_score;
    if (!out.new_officer) inputs.match_distance = out.match.distance;
    inputs.match_threshold = matcher.get_threshold();
    inputs.attribution = record.attribution_confidence();
    ConfidenceScore score = score_confidence(inputs);
    out.confidence = score.score;

    Sighting effective = sighting;
    effective.embedding = embedding;

    out.stage = SightingStage::Reconciled;

    // Persisted
    try {
        RegistryDatabase::Transaction tx(db);

        int64_t officer_id;
        bool embedding_changed = false;
        if (out.new_officer) {
            OfficerRecord created = new_officer_from(record, effective);
            auto id = db.insert_officer(created);
            if (!id) {
                out.error = "officer insert failed";
                return out;
            }
            officer_id = *id;
            embedding_changed = !created.face_embedding.empty();
            officer = created;
            officer->id = officer_id;
        } else {
            officer_id = officer->id;
            Embedding before = officer->face_embedding;
            if (absorb(*officer, record, effective)) {
                if (!db.update_officer(*officer)) {
                    out.error = "officer update failed";
                    return out;
                }
            }
            embedding_changed = officer->face_embedding != before;
        }

        AppearanceRecord appearance;
        appearance.officer_id = officer_id;
        appearance.media_id = media_id;
        appearance.frame_number = sighting.frame_number;
        appearance.timestamp_seconds = sighting.timestamp_seconds;
        appearance.bbox = sighting.bbox;
        appearance.image_crop_path = sighting.crop_path;
        if (embedding) appearance.face_embedding = *embedding;
        if (record.ocr_badge) {
            appearance.ocr_badge_text = record.ocr_badge->text;
            appearance.ocr_badge_confidence = record.ocr_badge->confidence;
        }
        if (record.ocr_name) {
            appearance.ocr_name_text = record.ocr_name->text;
            appearance.ocr_name_confidence = record.ocr_name->confidence;
        }
        appearance.fields = record.fields;
        appearance.confidence = score.score;
        appearance.confidence_factors = score.factors_json();

        auto appearance_id = db.insert_appearance(appearance);
        if (!appearance_id) {
            out.error = "appearance insert failed";
            return out;
        }

        if (!tx.commit()) {
            out.error = "commit failed";
            return out;
        }

        out.officer_id = officer_id;
        out.appearance_id = *appearance_id;
        out.stage = SightingStage::Persisted;

        // El indice solo refleja lo que ya esta confirmado en BD
        if (embedding_changed && !officer->face_embedding.empty()) {
            matcher.add(officer_id, officer->face_embedding);
        }
    } catch (const RegistryError& e) {
        out.error = e.what();
    }

    if (!out.persisted()) {
        spdlog::error("Avistamiento no persistido (media {}): {}", media_id, out.error);
    } else {
        spdlog::debug("Avistamiento -> oficial {} ({}, d={:.3f}, conf={})", *out.officer_id,
                      out.new_officer ? "nuevo" : "match", out.match.distance, out.confidence);
    }
    return out;
}

// ==================== MEDIA ====================

MediaOutcome IdentityRegistry::process_media(int64_t media_id, const std::vector<Sighting>& sightings) {
    MediaOutcome summary;

    for (const auto& s : sightings) {
        summary.sightings++;
        auto out = process_sighting(media_id, s);
        if (out.rejected) {
            summary.rejected++;
        } else if (!out.persisted()) {
            summary.failed++;
        } else {
            summary.persisted++;
            if (out.new_officer) summary.new_officers++;
            else summary.matched++;
        }
    }

    if (!db.mark_media_processed(media_id)) {
        spdlog::warn("No se pudo marcar media {} como procesado", media_id);
    }

    spdlog::info("Media {}: {} rostros, {} nuevos, {} match, {} rechazados, {} fallidos",
                 media_id, summary.sightings, summary.new_officers, summary.matched,
                 summary.rejected, summary.failed);
    return summary;
}

MediaOutcome IdentityRegistry::process_frames(int64_t media_id, const std::vector<FrameInput>& frames,
                                              const FrameAnalyzer& analyzer) {
    std::vector<Sighting> sightings;
    for (const auto& frame : frames) {
        auto found = analyzer.analyze_frame(frame);
        sightings.insert(sightings.end(),
                         std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    return process_media(media_id, sightings);
}

// ==================== OPERADOR ====================

bool IdentityRegistry::set_officer_override(int64_t officer_id, Field field,
                                            const std::optional<std::string>& value) {
    if (!db.set_officer_override(officer_id, field, value)) {
        spdlog::error("Override {} del oficial {} fallido", to_string(field), officer_id);
        return false;
    }
    spdlog::info("Oficial {}: override {} = {}", officer_id, to_string(field), value.value_or("(borrado)"));
    return true;
}

bool IdentityRegistry::set_appearance_override(int64_t appearance_id, Field field,
                                               const std::optional<std::string>& value) {
    if (!db.set_appearance_override(appearance_id, field, value)) {
        spdlog::error("Override {} de la aparicion {} fallido", to_string(field), appearance_id);
        return false;
    }
    return true;
}

bool IdentityRegistry::verify_appearance(int64_t appearance_id, const std::string& actor) {
    return db.verify_appearance(appearance_id, actor);
}

// ==================== PERFIL ====================

std::vector<int64_t> IdentityRegistry::merged_into_recursive(int64_t officer_id) {
    std::vector<int64_t> result;
    std::set<int64_t> seen{officer_id};
    std::vector<int64_t> pending{officer_id};

    while (!pending.empty()) {
        int64_t current = pending.back();
        pending.pop_back();
        for (int64_t child : db.officers_merged_into(current)) {
            if (!seen.insert(child).second) continue;
            result.push_back(child);
            pending.push_back(child);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::optional<OfficerProfile> IdentityRegistry::profile(int64_t officer_id) {
    auto officer = db.get_officer(officer_id);
    if (!officer) return std::nullopt;

    OfficerProfile p;
    p.officer = *officer;
    for (Field f : officer_fields()) {
        p.effective[f] = effective_value(*officer, f);
    }

    p.merged_officer_ids = merged_into_recursive(officer_id);

    std::vector<int64_t> ids{officer_id};
    ids.insert(ids.end(), p.merged_officer_ids.begin(), p.merged_officer_ids.end());
    p.timeline = db.appearances_for_officers(ids);
    p.appearance_count = static_cast<int>(p.timeline.size());
    return p;
}

} // namespace rollcall
