// ============= include/rollcall/reconcile/field_result.hpp =============
/*
 * Resultado reconciliado por campo
 *
 * Cada campo (force, unit, rank, name, badge, shoulder_number) lleva
 * su valor, la confianza [0,1], la fuente que lo decidio y una lista
 * de indicadores legibles para el operador.
 *
 * PRECEDENCIA (effective_value):
 *   override manual > valor detectado
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

enum class Field {
    Force,
    Unit,
    Rank,
    Name,
    Badge,
    ShoulderNumber,
    Role   // solo override manual, por aparicion
};

enum class FieldSource { None, Ocr, RuleBased, Vision, Manual };

const char* to_string(Field field);
const char* to_string(FieldSource source);
std::optional<Field> field_from_string(const std::string& name);
FieldSource source_from_string(const std::string& name);

// Campos que produce el reconciliador, en orden de presentacion
const std::vector<Field>& reconciled_fields();

struct FieldResult {
    std::optional<std::string> value;
    float confidence = 0.0f;
    FieldSource source = FieldSource::None;
    std::vector<std::string> indicators;

    bool has_value() const { return value.has_value() && !value->empty(); }

    static FieldResult of(std::string value, float confidence, FieldSource source,
                          std::vector<std::string> indicators = {});
};

using OverrideMap = std::map<Field, std::string>;
using FieldMap = std::map<Field, FieldResult>;

// The only place the override-beats-detection rule lives.
FieldResult effective_value(Field field, const OverrideMap& overrides, const FieldResult& detected);
FieldResult effective_value(Field field, const OverrideMap& overrides, const FieldMap& detected);

} // namespace rollcall
