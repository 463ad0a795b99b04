// ============= src/database/records.cpp =============
#include "rollcall/database/records.hpp"
#include <algorithm>
#include <map>

namespace rollcall {

const char* to_string(DuplicateType type) {
    return type == DuplicateType::Exact ? "exact" : "similar";
}

std::optional<DuplicateType> duplicate_type_from_string(const std::string& name) {
    if (name == "exact") return DuplicateType::Exact;
    if (name == "similar") return DuplicateType::Similar;
    return std::nullopt;
}

const std::vector<Field>& officer_fields() {
    static const std::vector<Field> fields = {
        Field::Badge, Field::Force, Field::Rank, Field::Name, Field::Unit
    };
    return fields;
}

FieldResult effective_value(const OfficerRecord& officer, Field field) {
    return effective_value(field, officer.overrides, officer.detected);
}

FieldResult effective_value(const AppearanceRecord& appearance, Field field) {
    return effective_value(field, appearance.overrides, appearance.fields);
}

std::vector<std::pair<std::string, int>> force_distribution(const std::vector<OfficerRecord>& officers) {
    std::map<std::string, int> counts;
    for (const auto& o : officers) {
        counts[effective_value(o, Field::Force).value.value_or("Unknown")]++;
    }

    std::vector<std::pair<std::string, int>> out(counts.begin(), counts.end());
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return out;
}

} // namespace rollcall
