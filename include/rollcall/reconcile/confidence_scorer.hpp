// ============= include/rollcall/reconcile/confidence_scorer.hpp =============
/*
 * Confianza compuesta de un avistamiento (0-100)
 *
 * FACTORES (cada uno en [0,1], solo los disponibles):
 *   face_detection   confianza del detector
 *   face_quality     min(1, blur / 100)
 *   identity_match   1 - distancia / umbral   (solo si hubo match)
 *   attribution      media de confianza de los campos reconciliados
 *
 * score = round(100 * media(factores)); 0 si no hay factores
 */

#pragma once
#include <json/json.h>
#include <optional>
#include <string>

namespace rollcall {

struct ConfidenceInputs {
    std::optional<float> face_detection;
    std::optional<double> blur_score;
    std::optional<float> match_distance;
    float match_threshold = 0.8f;
    std::optional<float> attribution;
};

struct ConfidenceScore {
    int score = 0;
    Json::Value factors{Json::objectValue};

    std::string factors_json() const;
};

ConfidenceScore score_confidence(const ConfidenceInputs& inputs);

} // namespace rollcall
