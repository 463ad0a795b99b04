// ============= include/rollcall/reconcile/detection_reconciler.hpp =============
/*
 * Detection Reconciler - un registro por avistamiento
 *
 * ENTRADAS (todas opcionales):
 *   - lecturas OCR (texto + confianza)
 *   - analisis de vision (JSON tipado)
 *   - equipo / uniforme observados
 *
 * POLITICA por campo (force, unit, rank):
 *   1. vision con confianza >= vision_threshold
 *   2. reglas (BadgeRules) con confianza > 0
 *   3. null
 *   Si ambas fuentes tienen valor y difieren, el conflicto queda en indicators.
 *
 *   name:            vision >= umbral, luego OCR (2-3 palabras)
 *   badge:           OCR, luego shoulder_number de vision >= umbral
 *   shoulder_number: reglas, luego vision
 *
 * Los overrides manuales NO se aplican aqui: se consultan con effective_value().
 */

#pragma once
#include "rollcall/core/config.hpp"
#include "rollcall/reconcile/badge_rules.hpp"
#include "rollcall/reconcile/field_result.hpp"
#include "rollcall/reconcile/ocr.hpp"
#include "rollcall/reconcile/vision_analysis.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct DetectionSignals {
    std::vector<OcrReading> ocr;
    std::optional<VisionAnalysis> vision;
    std::vector<std::string> equipment;          // detector de objetos
    std::optional<std::string> uniform_description;
};

struct ReconciledRecord {
    FieldMap fields;
    std::optional<OcrReading> ocr_badge;
    std::optional<OcrReading> ocr_name;
    RuleDetection rules;

    const FieldResult& get(Field field) const;

    // Media de las confianzas de los campos con valor (0 si no hay ninguno)
    float attribution_confidence() const;

    Json::Value to_json() const;
};

class DetectionReconciler {
public:
    struct Options {
        float vision_threshold = 0.6f;
        float ocr_min_confidence = 0.3f;

        static Options from_config(const RegistryConfig& config);
    };

    explicit DetectionReconciler(const BadgeRules& rules);
    DetectionReconciler(const BadgeRules& rules, Options options);

    ReconciledRecord reconcile(const DetectionSignals& signals) const;

    // Politica vision > reglas con nota de conflicto
    FieldResult resolve(const VisionOpinion& vision, const RuleOpinion& rule) const;

    float get_vision_threshold() const { return options.vision_threshold; }

private:
    const BadgeRules& rules;
    Options options;

    FieldResult resolve_name(const std::optional<VisionAnalysis>& vision,
                             const std::optional<OcrReading>& ocr_name) const;
    FieldResult resolve_badge(const std::optional<VisionAnalysis>& vision,
                              const std::optional<OcrReading>& ocr_badge) const;
    FieldResult resolve_shoulder_number(const std::optional<VisionAnalysis>& vision,
                                        const RuleOpinion& rule) const;
};

} // namespace rollcall
