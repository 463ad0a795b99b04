// ============= include/rollcall/analysis/sighting_manifest.hpp =============
/*
 * Manifiesto de avistamientos (JSON)
 *
 * Describe un archivo y los rostros ya detectados por herramientas externas,
 * para que el motor corra sin modelos de deteccion:
 *
 * {
 *   "media": "clips/march_01.jpg",        relativo al manifiesto
 *   "type": "image",                      opcional (por extension)
 *   "sightings": [{
 *       "frame": 0, "timestamp": 1.5,
 *       "bbox": [x, y, w, h],
 *       "detection_confidence": 0.97,
 *       "blur_score": 140.2,
 *       "embedding": [ ...512 floats... ],
 *       "crop_path": "crops/0001.jpg",
 *       "ocr": [{"text": "U1234", "confidence": 0.91}],
 *       "vision": { ... } | "vision_raw": "texto del modelo",
 *       "equipment": ["riot shield"],
 *       "uniform": "dark operational"
 *   }]
 * }
 */

#pragma once
#include "rollcall/analysis/sighting.hpp"
#include "rollcall/hashing/content_hasher.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct SightingManifest {
    std::string source;          // ruta del manifiesto
    std::string media_path;
    MediaType type = MediaType::Other;
    std::vector<Sighting> sightings;

    static std::optional<SightingManifest> load(const std::string& path);
    static std::optional<SightingManifest> from_json(const Json::Value& root, const std::string& base_dir);
};

Sighting sighting_from_json(const Json::Value& obj);

} // namespace rollcall
