// ============= src/reconcile/vision_analysis.cpp =============
#include "rollcall/reconcile/vision_analysis.hpp"
#include "rollcall/core/utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace rollcall {

namespace {

float read_confidence(const Json::Value& obj) {
    const Json::Value& c = obj["confidence"];
    if (!c.isNumeric()) return 0.0f;
    return std::clamp(c.asFloat(), 0.0f, 1.0f);
}

std::optional<std::string> read_text(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (!v.isString()) return std::nullopt;
    std::string s = trim(v.asString());
    if (s.empty()) return std::nullopt;
    return s;
}

std::vector<std::string> read_strings(const Json::Value& arr) {
    std::vector<std::string> out;
    if (!arr.isArray()) return out;
    for (const auto& v : arr) {
        if (v.isString()) out.push_back(v.asString());
    }
    return out;
}

VisionOpinion read_opinion(const Json::Value& root, const char* section, const char* value_key) {
    VisionOpinion op;
    const Json::Value& obj = root[section];
    if (!obj.isObject()) return op;

    op.value = read_text(obj, value_key);
    op.confidence = op.value ? read_confidence(obj) : 0.0f;
    op.indicators = read_strings(obj["indicators"]);
    return op;
}

std::optional<int> read_count(const Json::Value& v) {
    if (!v.isNumeric()) return std::nullopt;
    int n = v.asInt();
    if (n < 0) return std::nullopt;
    return n;
}

Json::Value opinion_json(const VisionOpinion& op, const char* value_key) {
    Json::Value obj(Json::objectValue);
    obj[value_key] = op.value ? Json::Value(*op.value) : Json::Value();
    obj["confidence"] = op.confidence;
    Json::Value ind(Json::arrayValue);
    for (const auto& i : op.indicators) ind.append(i);
    obj["indicators"] = ind;
    return obj;
}

} // namespace

std::vector<std::string> VisionAnalysis::equipment_names() const {
    std::vector<std::string> names;
    for (const auto& e : equipment) names.push_back(e.name);
    return names;
}

std::optional<std::string> VisionAnalysis::uniform_text() const {
    if (uniform_description && uniform_type) return *uniform_type + " " + *uniform_description;
    if (uniform_description) return uniform_description;
    return uniform_type;
}

VisionAnalysis VisionAnalysis::from_json(const Json::Value& root) {
    VisionAnalysis a;
    if (!root.isObject()) return a;

    a.force = read_opinion(root, "force", "name");
    a.unit = read_opinion(root, "unit", "type");

    // rank.indicators es un objeto, no una lista
    const Json::Value& rank = root["rank"];
    if (rank.isObject()) {
        a.rank.value = read_text(rank, "name");
        a.rank.confidence = a.rank.value ? read_confidence(rank) : 0.0f;

        const Json::Value& ind = rank["indicators"];
        if (ind.isObject()) {
            a.insignia.chevrons = read_count(ind["chevrons"]);
            a.insignia.pips = read_count(ind["pips"]);
            a.insignia.crown = ind["crown"].isBool() && ind["crown"].asBool();
            a.insignia.other = read_text(ind, "other");

            if (a.insignia.chevrons && *a.insignia.chevrons > 0) {
                a.rank.indicators.push_back(std::to_string(*a.insignia.chevrons) + " chevrons");
            }
            if (a.insignia.pips && *a.insignia.pips > 0) {
                a.rank.indicators.push_back(std::to_string(*a.insignia.pips) + " pips");
            }
            if (a.insignia.crown) a.rank.indicators.push_back("Crown");
            if (a.insignia.other) a.rank.indicators.push_back(*a.insignia.other);
        } else {
            a.rank.indicators = read_strings(ind);
        }
    }

    const Json::Value& uniform = root["uniform_type"];
    if (uniform.isObject()) {
        a.uniform_type = read_text(uniform, "type");
        a.uniform_description = read_text(uniform, "description");
    } else if (uniform.isString() && !uniform.asString().empty()) {
        a.uniform_type = uniform.asString();
    }

    const Json::Value& equipment = root["equipment"];
    if (equipment.isArray()) {
        for (const auto& item : equipment) {
            if (item.isString()) {
                a.equipment.push_back({item.asString(), 0.0f, ""});
                continue;
            }
            if (!item.isObject()) continue;
            auto name = read_text(item, "name");
            if (!name) continue;
            a.equipment.push_back({*name, read_confidence(item), read_text(item, "category").value_or("")});
        }
    }

    a.shoulder_number = read_opinion(root, "shoulder_number", "text");
    a.name = read_opinion(root, "name", "text");
    a.overall_notes = read_text(root, "overall_notes");
    return a;
}

std::optional<Json::Value> VisionAnalysis::extract_json(const std::string& raw) {
    auto start = raw.find('{');
    auto end = raw.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        spdlog::warn("Vision: respuesta sin JSON ({} bytes)", raw.size());
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    std::istringstream in(raw.substr(start, end - start + 1));
    if (!Json::parseFromStream(reader, in, &root, &errs) || !root.isObject()) {
        spdlog::warn("Vision: JSON invalido: {}", errs);
        return std::nullopt;
    }
    return root;
}

std::optional<VisionAnalysis> VisionAnalysis::parse(const std::string& raw) {
    auto root = extract_json(raw);
    if (!root) return std::nullopt;
    return from_json(*root);
}

Json::Value VisionAnalysis::to_json() const {
    Json::Value root(Json::objectValue);
    root["force"] = opinion_json(force, "name");
    root["unit"] = opinion_json(unit, "type");

    Json::Value r = opinion_json(rank, "name");
    Json::Value ind(Json::objectValue);
    ind["chevrons"] = insignia.chevrons ? Json::Value(*insignia.chevrons) : Json::Value();
    ind["pips"] = insignia.pips ? Json::Value(*insignia.pips) : Json::Value();
    ind["crown"] = insignia.crown;
    ind["other"] = insignia.other ? Json::Value(*insignia.other) : Json::Value();
    r["indicators"] = ind;
    root["rank"] = r;

    Json::Value uniform(Json::objectValue);
    uniform["type"] = uniform_type ? Json::Value(*uniform_type) : Json::Value();
    uniform["description"] = uniform_description ? Json::Value(*uniform_description) : Json::Value();
    root["uniform_type"] = uniform;

    Json::Value eq(Json::arrayValue);
    for (const auto& e : equipment) {
        Json::Value item(Json::objectValue);
        item["name"] = e.name;
        item["confidence"] = e.confidence;
        item["category"] = e.category;
        eq.append(item);
    }
    root["equipment"] = eq;

    root["shoulder_number"] = opinion_json(shoulder_number, "text");
    if (name.value) root["name"] = opinion_json(name, "text");
    root["overall_notes"] = overall_notes ? Json::Value(*overall_notes) : Json::Value();
    return root;
}

} // namespace rollcall
