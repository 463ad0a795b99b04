// ============= src/reconcile/detection_reconciler.cpp =============
#include "rollcall/reconcile/detection_reconciler.hpp"
#include "rollcall/core/utils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace rollcall {

namespace {

bool same_value(const std::string& a, const std::string& b) {
    return to_lower(trim(a)) == to_lower(trim(b));
}

std::string conflict_note(const std::string& vision_value, const std::string& other_value,
                          const char* other_source) {
    return "Note: Vision detected '" + vision_value + "' but " + other_source +
           " suggests '" + other_value + "'";
}

void append(std::vector<std::string>& dst, const std::vector<std::string>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

// ==================== RECORD ====================

const FieldResult& ReconciledRecord::get(Field field) const {
    static const FieldResult empty;
    auto it = fields.find(field);
    return it != fields.end() ? it->second : empty;
}

float ReconciledRecord::attribution_confidence() const {
    float sum = 0.0f;
    int count = 0;
    for (const auto& [field, result] : fields) {
        if (!result.has_value()) continue;
        sum += result.confidence;
        ++count;
    }
    return count > 0 ? sum / count : 0.0f;
}

Json::Value ReconciledRecord::to_json() const {
    Json::Value root(Json::objectValue);
    for (Field f : reconciled_fields()) {
        const FieldResult& r = get(f);
        Json::Value obj(Json::objectValue);
        obj["value"] = r.value ? Json::Value(*r.value) : Json::Value();
        obj["confidence"] = r.confidence;
        obj["source"] = to_string(r.source);
        Json::Value ind(Json::arrayValue);
        for (const auto& i : r.indicators) ind.append(i);
        obj["indicators"] = ind;
        root[to_string(f)] = obj;
    }
    root["method"] = to_string(rules.method);
    return root;
}

// ==================== RECONCILER ====================

DetectionReconciler::DetectionReconciler(const BadgeRules& rules)
    : DetectionReconciler(rules, Options{}) {}

DetectionReconciler::DetectionReconciler(const BadgeRules& rules, Options options)
    : rules(rules), options(options) {}

FieldResult DetectionReconciler::resolve(const VisionOpinion& vision, const RuleOpinion& rule) const {
    bool has_vision = vision.value && !vision.value->empty();
    bool has_rule = rule.value && !rule.value->empty() && rule.confidence > 0.0f;

    FieldResult result;
    if (has_vision && vision.confidence >= options.vision_threshold) {
        result = FieldResult::of(*vision.value, vision.confidence, FieldSource::Vision, vision.indicators);
    } else if (has_rule) {
        result = FieldResult::of(*rule.value, rule.confidence, FieldSource::RuleBased, rule.indicators);
        if (has_vision) {
            result.indicators.push_back(fmt::format("Vision confidence {:.2f} below threshold", vision.confidence));
        }
    } else if (has_vision) {
        result.indicators.push_back("Vision suggested '" + *vision.value + "' below threshold");
        return result;
    } else {
        return result;
    }

    if (has_vision && has_rule && !same_value(*vision.value, *rule.value)) {
        result.indicators.push_back(conflict_note(*vision.value, *rule.value, "badge"));
    }
    return result;
}

FieldResult DetectionReconciler::resolve_name(const std::optional<VisionAnalysis>& vision,
                                              const std::optional<OcrReading>& ocr_name) const {
    const VisionOpinion* v = vision ? &vision->name : nullptr;
    bool has_vision = v && v->value;

    FieldResult result;
    if (has_vision && v->confidence >= options.vision_threshold) {
        result = FieldResult::of(*v->value, v->confidence, FieldSource::Vision, v->indicators);
    } else if (ocr_name) {
        result = FieldResult::of(ocr_name->text, ocr_name->confidence, FieldSource::Ocr, {"OCR text"});
    } else {
        return result;
    }

    if (has_vision && ocr_name && !same_value(*v->value, ocr_name->text)) {
        result.indicators.push_back(conflict_note(*v->value, ocr_name->text, "OCR"));
    }
    return result;
}

FieldResult DetectionReconciler::resolve_badge(const std::optional<VisionAnalysis>& vision,
                                               const std::optional<OcrReading>& ocr_badge) const {
    const VisionOpinion* v = vision ? &vision->shoulder_number : nullptr;
    bool has_vision = v && v->value;

    FieldResult result;
    if (ocr_badge) {
        result = FieldResult::of(ocr_badge->text, ocr_badge->confidence, FieldSource::Ocr, {"OCR text"});
        if (has_vision && !same_value(BadgeRules::normalize(*v->value), ocr_badge->text)) {
            result.indicators.push_back(conflict_note(*v->value, ocr_badge->text, "OCR"));
        }
    } else if (has_vision && v->confidence >= options.vision_threshold) {
        result = FieldResult::of(BadgeRules::normalize(*v->value), v->confidence,
                                 FieldSource::Vision, {"Shoulder number read by vision"});
    }
    return result;
}

FieldResult DetectionReconciler::resolve_shoulder_number(const std::optional<VisionAnalysis>& vision,
                                                         const RuleOpinion& rule) const {
    const VisionOpinion* v = vision ? &vision->shoulder_number : nullptr;

    if (rule.value && rule.confidence > 0.0f) {
        auto result = FieldResult::of(*rule.value, rule.confidence, FieldSource::RuleBased, rule.indicators);
        if (v && v->value && !same_value(BadgeRules::normalize(*v->value), *rule.value)) {
            result.indicators.push_back(conflict_note(*v->value, *rule.value, "badge"));
        }
        return result;
    }
    if (v && v->value && v->confidence > 0.0f) {
        return FieldResult::of(*v->value, v->confidence, FieldSource::Vision, v->indicators);
    }
    return FieldResult{};
}

ReconciledRecord DetectionReconciler::reconcile(const DetectionSignals& signals) const {
    ReconciledRecord record;

    auto readings = filter_readings(signals.ocr, options.ocr_min_confidence);
    if (readings.size() < signals.ocr.size()) {
        spdlog::debug("OCR: {} de {} lecturas bajo {:.2f}",
                      signals.ocr.size() - readings.size(), signals.ocr.size(), options.ocr_min_confidence);
    }
    record.ocr_badge = badge_candidate(readings);
    record.ocr_name = name_candidate(readings);

    // Entradas de las reglas: equipo y uniforme de vision + detector
    std::vector<std::string> equipment = signals.equipment;
    std::optional<std::string> uniform = signals.uniform_description;
    if (signals.vision) {
        append(equipment, signals.vision->equipment_names());
        auto vu = signals.vision->uniform_text();
        if (vu) uniform = uniform ? *uniform + " " + *vu : *vu;
    }

    std::optional<std::string> badge_text;
    if (record.ocr_badge) badge_text = record.ocr_badge->text;

    record.rules = rules.analyze(badge_text, reading_texts(readings), equipment, uniform);

    static const VisionOpinion no_vision;
    const VisionAnalysis* v = signals.vision ? &*signals.vision : nullptr;

    record.fields[Field::Force] = resolve(v ? v->force : no_vision, record.rules.force);
    record.fields[Field::Unit] = resolve(v ? v->unit : no_vision, record.rules.unit);
    record.fields[Field::Rank] = resolve(v ? v->rank : no_vision, record.rules.rank);
    record.fields[Field::Name] = resolve_name(signals.vision, record.ocr_name);
    record.fields[Field::Badge] = resolve_badge(signals.vision, record.ocr_badge);
    record.fields[Field::ShoulderNumber] = resolve_shoulder_number(signals.vision, record.rules.shoulder_number);

    return record;
}

} // namespace rollcall
