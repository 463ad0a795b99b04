// ============= include/rollcall/reconcile/ocr.hpp =============
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct OcrReading {
    std::string text;
    float confidence = 0.0f;
};

// Descarta lecturas con confianza < min_confidence
std::vector<OcrReading> filter_readings(const std::vector<OcrReading>& readings, float min_confidence);

// Numero de placa: >= 2 digitos y <= 8 caracteres (sin espacios, mayusculas).
// Devuelve la lectura de mayor confianza.
std::optional<OcrReading> badge_candidate(const std::vector<OcrReading>& readings);

// Nombre: 2-3 palabras alfabeticas
std::optional<OcrReading> name_candidate(const std::vector<OcrReading>& readings);

std::vector<std::string> reading_texts(const std::vector<OcrReading>& readings);

} // namespace rollcall
