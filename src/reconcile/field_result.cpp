// ============= src/reconcile/field_result.cpp =============
#include "rollcall/reconcile/field_result.hpp"

namespace rollcall {

const char* to_string(Field field) {
    switch (field) {
        case Field::Force:          return "force";
        case Field::Unit:           return "unit";
        case Field::Rank:           return "rank";
        case Field::Name:           return "name";
        case Field::Badge:          return "badge";
        case Field::ShoulderNumber: return "shoulder_number";
        case Field::Role:           return "role";
    }
    return "unknown";
}

const char* to_string(FieldSource source) {
    switch (source) {
        case FieldSource::None:      return "none";
        case FieldSource::Ocr:       return "ocr";
        case FieldSource::RuleBased: return "rule_based";
        case FieldSource::Vision:    return "vision";
        case FieldSource::Manual:    return "manual";
    }
    return "none";
}

std::optional<Field> field_from_string(const std::string& name) {
    static const std::map<std::string, Field> fields = {
        {"force", Field::Force},
        {"unit", Field::Unit},
        {"rank", Field::Rank},
        {"name", Field::Name},
        {"badge", Field::Badge},
        {"shoulder_number", Field::ShoulderNumber},
        {"role", Field::Role},
    };
    auto it = fields.find(name);
    if (it == fields.end()) return std::nullopt;
    return it->second;
}

FieldSource source_from_string(const std::string& name) {
    if (name == "ocr") return FieldSource::Ocr;
    if (name == "rule_based") return FieldSource::RuleBased;
    if (name == "vision") return FieldSource::Vision;
    if (name == "manual") return FieldSource::Manual;
    return FieldSource::None;
}

const std::vector<Field>& reconciled_fields() {
    static const std::vector<Field> fields = {
        Field::Force, Field::Unit, Field::Rank,
        Field::Name, Field::Badge, Field::ShoulderNumber
    };
    return fields;
}

FieldResult FieldResult::of(std::string value, float confidence, FieldSource source,
                            std::vector<std::string> indicators) {
    FieldResult r;
    r.value = std::move(value);
    r.confidence = confidence;
    r.source = source;
    r.indicators = std::move(indicators);
    return r;
}

FieldResult effective_value(Field field, const OverrideMap& overrides, const FieldResult& detected) {
    auto it = overrides.find(field);
    if (it != overrides.end() && !it->second.empty()) {
        return FieldResult::of(it->second, 1.0f, FieldSource::Manual, {"Manual override"});
    }
    return detected;
}

FieldResult effective_value(Field field, const OverrideMap& overrides, const FieldMap& detected) {
    auto it = detected.find(field);
    return effective_value(field, overrides, it != detected.end() ? it->second : FieldResult{});
}

} // namespace rollcall
