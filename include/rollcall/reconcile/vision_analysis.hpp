// ============= include/rollcall/reconcile/vision_analysis.hpp =============
/*
 * Vision Analysis - respuesta del modelo de vision, tipada
 *
 * FORMATO (JSON del servicio externo):
 *   force{name, confidence, indicators[]}
 *   unit{type, confidence, indicators[]}
 *   rank{name, confidence, indicators{chevrons, pips, crown, other}}
 *   uniform_type{type, description}
 *   equipment[{name, confidence, category}]
 *   shoulder_number{text, confidence}
 *   name{text, confidence}          (opcional)
 *   overall_notes
 *
 * ERRORES: campos ausentes o mal formados -> nullopt / confianza 0.
 * Nunca lanza.
 */

#pragma once
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct VisionOpinion {
    std::optional<std::string> value;
    float confidence = 0.0f;
    std::vector<std::string> indicators;
};

struct VisionEquipment {
    std::string name;
    float confidence = 0.0f;
    std::string category;
};

struct VisionInsignia {
    std::optional<int> chevrons;
    std::optional<int> pips;
    bool crown = false;
    std::optional<std::string> other;
};

struct VisionAnalysis {
    VisionOpinion force;
    VisionOpinion unit;
    VisionOpinion rank;
    VisionInsignia insignia;
    std::optional<std::string> uniform_type;
    std::optional<std::string> uniform_description;
    std::vector<VisionEquipment> equipment;
    VisionOpinion shoulder_number;
    VisionOpinion name;
    std::optional<std::string> overall_notes;

    std::vector<std::string> equipment_names() const;

    // Descripcion + tipo, para las reglas de unidad
    std::optional<std::string> uniform_text() const;

    static VisionAnalysis from_json(const Json::Value& root);

    // Texto crudo del modelo: toma desde el primer '{' hasta el ultimo '}'
    static std::optional<Json::Value> extract_json(const std::string& raw);
    static std::optional<VisionAnalysis> parse(const std::string& raw);

    Json::Value to_json() const;
};

} // namespace rollcall
