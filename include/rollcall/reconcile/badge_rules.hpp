// ============= include/rollcall/reconcile/badge_rules.hpp =============
/*
 * Badge Rules - deteccion por reglas (fallback sin vision)
 *
 * NUMERO DE HOMBRO (UK):
 *   prefijo 1-4 letras + 2-5 digitos   U1234, BX5678, GMP1234
 *   prefijo de rango + 3-5 digitos     PC4567
 *   solo digitos (4-6)                 123456
 *
 * FUERZA: tabla de prefijos, probando prefijos cada vez mas cortos.
 *   - prefijos de rango (PC, PS, PCSO, SGT, ...) nunca son fuerza
 *   - prefijo de una letra requiere >= 3 digitos
 *   - confianza: 1 letra 0.65, 2 letras 0.85, 3+ letras 0.90
 *
 * UNIDAD: patrones en badge (+0.4), equipo (+0.2 c/u), uniforme (+0.3 c/u),
 *         tope 0.9; por defecto Standard 0.3
 *
 * RANGO: patron de prefijo -> 0.85; letra sola + numero -> PC inferido 0.5
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct BadgeParts {
    std::optional<std::string> prefix;
    std::optional<std::string> number;

    bool empty() const { return !prefix && !number; }
};

struct RuleOpinion {
    std::optional<std::string> value;
    float confidence = 0.0f;
    std::vector<std::string> indicators;
};

struct RankInsigniaHint {
    int chevrons = 0;
    int pips = 0;
    bool crown = false;
    bool inferred = false;
};

enum class DetectionMethod { None, BadgePrefix, PatternMatch, Combined };

const char* to_string(DetectionMethod method);

struct RuleDetection {
    RuleOpinion force;
    RuleOpinion unit;
    RuleOpinion rank;
    RankInsigniaHint insignia;
    RuleOpinion shoulder_number;
    DetectionMethod method = DetectionMethod::None;
};

class BadgeRules {
public:
    BadgeRules();

    // Uppercase, sin espacios ni guiones
    static std::string normalize(const std::string& badge_text);

    BadgeParts extract_badge_prefix(const std::string& badge_text) const;

    RuleOpinion detect_force(const std::string& badge_text) const;

    RuleOpinion detect_unit(const std::optional<std::string>& badge_text,
                            const std::vector<std::string>& equipment,
                            const std::optional<std::string>& uniform_description) const;

    RuleOpinion detect_rank(const std::string& badge_text, RankInsigniaHint* insignia = nullptr) const;

    RuleDetection analyze(const std::optional<std::string>& badge_text,
                          const std::vector<std::string>& ocr_texts,
                          const std::vector<std::string>& equipment,
                          const std::optional<std::string>& uniform_description) const;

    static bool is_rank_prefix(const std::string& prefix);
    std::optional<std::string> force_for_prefix(const std::string& prefix) const;
};

} // namespace rollcall
