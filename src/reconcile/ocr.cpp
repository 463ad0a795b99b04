// ============= src/reconcile/ocr.cpp =============
#include "rollcall/reconcile/ocr.hpp"
#include "rollcall/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace rollcall {

namespace {

std::string clean_badge(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return to_upper(out);
}

bool is_name_word(const std::string& word) {
    if (word.size() < 2) return false;
    return std::all_of(word.begin(), word.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '-' || c == '\'';
    }) && std::isalpha(static_cast<unsigned char>(word.front()));
}

} // namespace

std::vector<OcrReading> filter_readings(const std::vector<OcrReading>& readings, float min_confidence) {
    std::vector<OcrReading> out;
    for (const auto& r : readings) {
        if (r.confidence >= min_confidence && !trim(r.text).empty()) out.push_back(r);
    }
    return out;
}

std::optional<OcrReading> badge_candidate(const std::vector<OcrReading>& readings) {
    std::optional<OcrReading> best;
    for (const auto& r : readings) {
        std::string clean = clean_badge(r.text);
        auto digits = std::count_if(clean.begin(), clean.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
        if (digits < 2 || clean.size() > 8) continue;

        if (!best || r.confidence > best->confidence) {
            best = OcrReading{clean, r.confidence};
        }
    }
    return best;
}

std::optional<OcrReading> name_candidate(const std::vector<OcrReading>& readings) {
    std::optional<OcrReading> best;
    for (const auto& r : readings) {
        auto words = split_whitespace(r.text);
        if (words.size() < 2 || words.size() > 3) continue;
        if (!std::all_of(words.begin(), words.end(), is_name_word)) continue;

        if (!best || r.confidence > best->confidence) {
            std::string joined;
            for (const auto& w : words) {
                if (!joined.empty()) joined += ' ';
                joined += w;
            }
            best = OcrReading{joined, r.confidence};
        }
    }
    return best;
}

std::vector<std::string> reading_texts(const std::vector<OcrReading>& readings) {
    std::vector<std::string> out;
    out.reserve(readings.size());
    for (const auto& r : readings) out.push_back(r.text);
    return out;
}

} // namespace rollcall
