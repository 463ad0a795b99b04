// ============= src/reconcile/badge_rules.cpp =============
#include "rollcall/reconcile/badge_rules.hpp"
#include "rollcall/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <regex>

namespace rollcall {

namespace {

const std::string MET = "Metropolitan Police Service";

const std::map<std::string, std::string>& prefix_forces() {
    static const std::map<std::string, std::string> forces = [] {
        std::map<std::string, std::string> m;

        // Met: una letra por distrito / unidad (sin O)
        for (char c = 'A'; c <= 'Z'; ++c) {
            if (c != 'O') m[std::string(1, c)] = MET;
        }

        m.insert({
            {"EC", "City of London Police"}, {"CO", "City of London Police"},
            {"BX", "British Transport Police"}, {"BTP", "British Transport Police"},
            {"QK", "Ministry of Defence Police"}, {"MDP", "Ministry of Defence Police"},

            // Regionales
            {"CE", "Kent Police"}, {"KE", "Kent Police"},
            {"EX", "Essex Police"}, {"ES", "Essex Police"},
            {"SX", "Sussex Police"}, {"SU", "Sussex Police"},
            {"SR", "Surrey Police"},
            {"TH", "Thames Valley Police"}, {"TV", "Thames Valley Police"},
            {"HA", "Hampshire Constabulary"}, {"HC", "Hampshire Constabulary"},
            {"WL", "Wiltshire Police"},
            {"DV", "Devon and Cornwall Police"}, {"DC", "Devon and Cornwall Police"},
            {"DO", "Dorset Police"},
            {"AS", "Avon and Somerset Police"}, {"AV", "Avon and Somerset Police"},
            {"GM", "Greater Manchester Police"}, {"GMP", "Greater Manchester Police"},
            {"WM", "West Midlands Police"}, {"WMP", "West Midlands Police"},
            {"WY", "West Yorkshire Police"}, {"WYP", "West Yorkshire Police"},
            {"SY", "South Yorkshire Police"}, {"SYP", "South Yorkshire Police"},
            {"NY", "North Yorkshire Police"}, {"NYP", "North Yorkshire Police"},
            {"HU", "Humberside Police"},
            {"MS", "Merseyside Police"}, {"MER", "Merseyside Police"},
            {"CH", "Cheshire Constabulary"},
            {"LA", "Lancashire Constabulary"},
            {"CU", "Cumbria Constabulary"},
            {"DU", "Durham Constabulary"},
            {"NB", "Northumbria Police"}, {"NU", "Northumbria Police"},
            {"CL", "Cleveland Police"},
            {"NF", "Norfolk Constabulary"},
            {"SF", "Suffolk Constabulary"},
            {"CB", "Cambridgeshire Constabulary"},
            {"LI", "Lincolnshire Police"},
            {"NM", "Northamptonshire Police"},
            {"LE", "Leicestershire Police"},
            {"NT", "Nottinghamshire Police"},
            {"DB", "Derbyshire Constabulary"},
            {"ST", "Staffordshire Police"},
            {"WA", "Warwickshire Police"},
            {"WS", "West Mercia Police"}, {"WR", "West Mercia Police"},
            {"GL", "Gloucestershire Constabulary"},
            {"HW", "Hertfordshire Constabulary"}, {"HF", "Hertfordshire Constabulary"},
            {"BD", "Bedfordshire Police"},

            // Gales
            {"SW", "South Wales Police"}, {"SWP", "South Wales Police"},
            {"GW", "Gwent Police"}, {"GWP", "Gwent Police"},
            {"DY", "Dyfed-Powys Police"}, {"DP", "Dyfed-Powys Police"},
            {"NW", "North Wales Police"}, {"NWP", "North Wales Police"},

            // Escocia (PS es Sergeant, no Police Scotland)
            {"SC", "Police Scotland"},

            // Irlanda del Norte
            {"PSNI", "Police Service of Northern Ireland"},
        });
        return m;
    }();
    return forces;
}

std::vector<std::regex> compile(std::initializer_list<const char*> patterns) {
    std::vector<std::regex> out;
    for (const char* p : patterns) out.emplace_back(p);
    return out;
}

struct UnitIndicators {
    std::string unit;
    std::vector<std::regex> patterns;   // sobre el badge en minusculas
    std::vector<std::string> equipment;
    std::vector<std::string> uniform;
};

// Orden = prioridad en empates
const std::vector<UnitIndicators>& unit_table() {
    static const std::vector<UnitIndicators> units = {
        {"TSG", compile({"tsg", "territorial support", "u\\d{3,4}"}),
                {"nato helmet", "riot shield", "shield", "baton"},
                {"dark operational", "no hi-vis", "black tactical"}},
        {"FIT", compile({"fit", "forward intelligence", "evidence gatherer"}),
                {"camera", "video camera", "tabard"},
                {"blue tabard", "evidence gatherer vest"}},
        {"Level 2 PSU", compile({"psu", "level 2", "public order"}),
                {"shield", "helmet", "body armor"},
                {"riot gear", "protective equipment"}},
        {"SCO19", compile({"sco19", "firearms", "armed"}),
                {"firearm", "rifle", "pistol", "ballistic vest"},
                {"armed response", "ballistic"}},
        {"Dog Unit", compile({"dog", "k9", "canine"}),
                {"dog lead", "muzzle"},
                {}},
        {"Mounted", compile({"mounted", "horse"}),
                {"horse", "riding helmet"},
                {"mounted branch"}},
        {"Standard", {},
                {},
                {"hi-vis", "high visibility", "yellow jacket"}},
    };
    return units;
}

struct RankPattern {
    std::string rank;
    std::regex pattern;
    RankInsigniaHint insignia;
};

const std::vector<RankPattern>& rank_table() {
    static const std::vector<RankPattern> ranks = {
        {"Police Constable", std::regex("^PC\\s*\\d+"), {0, 0, false, false}},
        {"Sergeant", std::regex("^(PS|SGT)\\s*\\d+"), {3, 0, false, false}},
        {"Inspector", std::regex("^(INSP|INS)\\s*\\d+"), {0, 2, false, false}},
        {"Chief Inspector", std::regex("^(CI|CHINSP)\\s*\\d+"), {0, 3, false, false}},
        {"Superintendent", std::regex("^SUPT\\s*\\d+"), {0, 0, true, false}},
        {"PCSO", std::regex("^PCSO\\s*\\d+"), {0, 0, false, false}},
    };
    return ranks;
}

const std::regex& standard_badge() {
    static const std::regex r("^([A-Z]{1,4})(\\d{2,5})$");
    return r;
}
const std::regex& rank_badge() {
    static const std::regex r("^(PC|PS|PCSO)(\\d{3,5})$");
    return r;
}
const std::regex& numeric_badge() {
    static const std::regex r("^(\\d{4,6})$");
    return r;
}

std::string remove_spaces(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return out;
}

} // namespace

const char* to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::None:         return "none";
        case DetectionMethod::BadgePrefix:  return "badge_prefix";
        case DetectionMethod::PatternMatch: return "pattern_match";
        case DetectionMethod::Combined:     return "combined";
    }
    return "none";
}

BadgeRules::BadgeRules() {
    // Fuerza la construccion de las tablas estaticas (regex) fuera del hot path
    prefix_forces();
    unit_table();
    rank_table();
}

std::string BadgeRules::normalize(const std::string& badge_text) {
    std::string out;
    for (char c : to_upper(trim(badge_text))) {
        if (c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(c);
    }
    return out;
}

bool BadgeRules::is_rank_prefix(const std::string& prefix) {
    static const char* ranks[] = {"PC", "PS", "PCSO", "SGT", "INSP", "INS", "CI", "CHINSP", "SUPT"};
    for (const char* r : ranks) {
        if (prefix == r) return true;
    }
    return false;
}

std::optional<std::string> BadgeRules::force_for_prefix(const std::string& prefix) const {
    auto it = prefix_forces().find(prefix);
    if (it == prefix_forces().end()) return std::nullopt;
    return it->second;
}

// ==================== BADGE PARSING ====================

BadgeParts BadgeRules::extract_badge_prefix(const std::string& badge_text) const {
    BadgeParts parts;
    std::string cleaned = normalize(badge_text);
    if (cleaned.empty()) return parts;

    std::smatch m;
    if (std::regex_match(cleaned, m, standard_badge()) ||
        std::regex_match(cleaned, m, rank_badge())) {
        parts.prefix = m[1].str();
        parts.number = m[2].str();
    } else if (std::regex_match(cleaned, m, numeric_badge())) {
        parts.number = m[1].str();
    }
    return parts;
}

// ==================== FORCE ====================

RuleOpinion BadgeRules::detect_force(const std::string& badge_text) const {
    RuleOpinion opinion;

    auto parts = extract_badge_prefix(badge_text);
    if (!parts.prefix) {
        return opinion;
    }

    const std::string& prefix = *parts.prefix;
    if (is_rank_prefix(prefix)) {
        return opinion;
    }

    size_t digits = parts.number ? parts.number->size() : 0;

    for (size_t length = prefix.size(); length > 0; --length) {
        std::string test_prefix = prefix.substr(0, length);
        // PCS1234, CIX1234: empieza por un prefijo de rango, nunca es fuerza
        if (is_rank_prefix(test_prefix)) return opinion;

        auto force = force_for_prefix(test_prefix);
        if (!force) continue;

        // Prefijo de una letra con pocos digitos: demasiado ambiguo
        if (length == 1 && digits < 3) {
            return opinion;
        }

        opinion.value = *force;
        opinion.confidence = length == 1 ? 0.65f : (length == 2 ? 0.85f : 0.9f);
        opinion.indicators.push_back("Badge prefix '" + test_prefix + "' matches " + *force);
        if (length < prefix.size()) {
            opinion.indicators.push_back("Partial prefix match: " + prefix);
        } else if (length >= 2) {
            opinion.indicators.push_back("Full prefix match: " + prefix);
        }
        return opinion;
    }
    return opinion;
}

// ==================== UNIT ====================

RuleOpinion BadgeRules::detect_unit(const std::optional<std::string>& badge_text,
                                    const std::vector<std::string>& equipment,
                                    const std::optional<std::string>& uniform_description) const {
    std::vector<std::string> equipment_lower;
    for (const auto& e : equipment) equipment_lower.push_back(to_lower(e));

    std::string badge_lower = badge_text ? to_lower(*badge_text) : "";
    std::string uniform_lower = uniform_description ? to_lower(*uniform_description) : "";

    RuleOpinion best;
    float best_score = 0.0f;

    for (const auto& unit : unit_table()) {
        float score = 0.0f;
        std::vector<std::string> matched;

        if (!badge_lower.empty()) {
            for (const auto& pattern : unit.patterns) {
                if (std::regex_search(badge_lower, pattern)) {
                    score += 0.4f;
                    matched.push_back("Badge matches " + unit.unit + " pattern");
                    break;
                }
            }
        }

        for (const auto& equip : unit.equipment) {
            bool found = std::any_of(equipment_lower.begin(), equipment_lower.end(),
                [&equip](const std::string& e) { return e.find(equip) != std::string::npos; });
            if (found) {
                score += 0.2f;
                matched.push_back("Equipment: " + equip);
            }
        }

        if (!uniform_lower.empty()) {
            for (const auto& u : unit.uniform) {
                if (uniform_lower.find(u) != std::string::npos) {
                    score += 0.3f;
                    matched.push_back("Uniform: " + u);
                }
            }
        }

        if (score > best_score) {
            best_score = score;
            best.value = unit.unit;
            best.indicators = matched;
        }
    }

    if (best_score <= 0.0f) {
        best.value = "Standard";
        best.confidence = 0.3f;
        best.indicators = {"Default to standard patrol"};
        return best;
    }

    best.confidence = std::min(0.9f, best_score);
    return best;
}

// ==================== RANK ====================

RuleOpinion BadgeRules::detect_rank(const std::string& badge_text, RankInsigniaHint* insignia) const {
    RuleOpinion opinion;
    if (trim(badge_text).empty()) return opinion;

    std::string badge_upper = remove_spaces(to_upper(badge_text));

    for (const auto& r : rank_table()) {
        if (std::regex_search(badge_upper, r.pattern)) {
            opinion.value = r.rank;
            opinion.confidence = 0.85f;
            opinion.indicators.push_back("Badge prefix pattern: " + r.rank);
            if (r.insignia.chevrons > 0) {
                opinion.indicators.push_back(std::to_string(r.insignia.chevrons) + " chevrons expected");
            }
            if (r.insignia.pips > 0) {
                opinion.indicators.push_back(std::to_string(r.insignia.pips) + " pips expected");
            }
            if (r.insignia.crown) {
                opinion.indicators.push_back("Crown expected");
            }
            if (insignia) *insignia = r.insignia;
            return opinion;
        }
    }

    // Prefijo de una letra + numero: PC por defecto
    auto parts = extract_badge_prefix(badge_text);
    if (parts.prefix && parts.number && parts.prefix->size() == 1) {
        opinion.value = "Police Constable";
        opinion.confidence = 0.5f;
        opinion.indicators.push_back("Inferred from single-letter shoulder number");
        if (insignia) {
            *insignia = RankInsigniaHint{};
            insignia->inferred = true;
        }
    }
    return opinion;
}

// ==================== ANALYZE ====================

RuleDetection BadgeRules::analyze(const std::optional<std::string>& badge_text,
                                  const std::vector<std::string>& ocr_texts,
                                  const std::vector<std::string>& equipment,
                                  const std::optional<std::string>& uniform_description) const {
    RuleDetection result;

    bool has_badge = badge_text && !trim(*badge_text).empty();

    if (has_badge) {
        result.force = detect_force(*badge_text);
        if (!extract_badge_prefix(*badge_text).empty()) {
            result.shoulder_number.value = normalize(*badge_text);
            result.shoulder_number.confidence = 0.8f;
            result.shoulder_number.indicators.push_back("Parsed from badge text");
        }
    }

    // Fallback: textos OCR sueltos
    if (!result.force.value) {
        for (const auto& text : ocr_texts) {
            auto f = detect_force(text);
            if (f.confidence > result.force.confidence) {
                result.force = f;
                if (!extract_badge_prefix(text).empty()) {
                    result.shoulder_number.value = normalize(text);
                    result.shoulder_number.confidence = 0.6f;
                    result.shoulder_number.indicators = {"Parsed from OCR text"};
                }
            }
        }
    }

    result.unit = detect_unit(badge_text, equipment, uniform_description);
    result.rank = detect_rank(has_badge ? *badge_text : "", &result.insignia);

    if (result.force.confidence > 0.0f) {
        result.method = DetectionMethod::BadgePrefix;
    }
    if (result.unit.confidence > 0.3f || result.rank.confidence > 0.0f) {
        result.method = result.method == DetectionMethod::BadgePrefix
            ? DetectionMethod::Combined : DetectionMethod::PatternMatch;
    }
    return result;
}

} // namespace rollcall
