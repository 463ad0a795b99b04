// ============= src/analysis/sighting_manifest.cpp =============
#include "rollcall/analysis/sighting_manifest.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace rollcall {

Sighting sighting_from_json(const Json::Value& obj) {
    Sighting s;

    const Json::Value& bbox = obj["bbox"];
    if (bbox.isArray() && bbox.size() == 4) {
        bool numeric = true;
        for (const auto& v : bbox) numeric = numeric && v.isNumeric();
        if (numeric) {
            s.bbox = cv::Rect(bbox[0].asInt(), bbox[1].asInt(), bbox[2].asInt(), bbox[3].asInt());
        }
    }

    if (obj["frame"].isNumeric()) s.frame_number = obj["frame"].asInt();
    if (obj["timestamp"].isNumeric()) s.timestamp_seconds = obj["timestamp"].asDouble();
    if (obj["detection_confidence"].isNumeric()) s.detection_confidence = obj["detection_confidence"].asFloat();
    if (obj["blur_score"].isNumeric()) s.blur_score = obj["blur_score"].asDouble();
    if (obj["crop_path"].isString()) s.crop_path = obj["crop_path"].asString();

    const Json::Value& emb = obj["embedding"];
    if (emb.isArray() && !emb.empty()) {
        Embedding e;
        e.reserve(emb.size());
        bool ok = true;
        for (const auto& v : emb) {
            if (!v.isNumeric()) { ok = false; break; }
            e.push_back(v.asFloat());
        }
        if (ok) s.embedding = std::move(e);
        else spdlog::warn("Manifiesto: embedding con valores no numericos, ignorado");
    }

    const Json::Value& ocr = obj["ocr"];
    if (ocr.isArray()) {
        for (const auto& r : ocr) {
            if (!r.isObject() || !r["text"].isString()) continue;
            OcrReading reading;
            reading.text = r["text"].asString();
            reading.confidence = r["confidence"].isNumeric() ? r["confidence"].asFloat() : 0.0f;
            s.signals.ocr.push_back(reading);
        }
    }

    if (obj["vision"].isObject()) {
        s.signals.vision = VisionAnalysis::from_json(obj["vision"]);
    } else if (obj["vision_raw"].isString()) {
        s.signals.vision = VisionAnalysis::parse(obj["vision_raw"].asString());
    }

    const Json::Value& equipment = obj["equipment"];
    if (equipment.isArray()) {
        for (const auto& e : equipment) {
            if (e.isString()) s.signals.equipment.push_back(e.asString());
        }
    }
    if (obj["uniform"].isString()) s.signals.uniform_description = obj["uniform"].asString();

    return s;
}

std::optional<SightingManifest> SightingManifest::from_json(const Json::Value& root, const std::string& base_dir) {
    if (!root.isObject() || !root["media"].isString()) {
        spdlog::error("Manifiesto sin campo 'media'");
        return std::nullopt;
    }

    SightingManifest m;
    fs::path media(root["media"].asString());
    if (media.is_relative() && !base_dir.empty()) media = fs::path(base_dir) / media;
    m.media_path = media.string();

    if (root["type"].isString()) {
        m.type = media_type_from_string(root["type"].asString());
    } else {
        m.type = media_type_from_path(m.media_path);
    }

    const Json::Value& sightings = root["sightings"];
    if (sightings.isArray()) {
        for (const auto& s : sightings) {
            if (!s.isObject()) continue;
            m.sightings.push_back(sighting_from_json(s));
        }
    }
    return m;
}

std::optional<SightingManifest> SightingManifest::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        spdlog::error("No se pudo abrir el manifiesto {}", path);
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    if (!Json::parseFromStream(reader, in, &root, &errs)) {
        spdlog::error("Manifiesto {} invalido: {}", path, errs);
        return std::nullopt;
    }

    auto m = from_json(root, fs::path(path).parent_path().string());
    if (m) m->source = path;
    return m;
}

} // namespace rollcall
