// ============= include/rollcall/matching/threshold_calibrator.hpp =============
/*
 * Calibracion de umbrales con pares etiquetados
 *
 * Cada par: distancia (euclidiana o Hamming) + etiqueta misma/distinta.
 * Prediccion "misma" iff distancia <= umbral.
 * sweep() barre un rango y devuelve precision / recall / F1 por umbral;
 * best = mayor F1 (empate: el umbral mas bajo).
 */

#pragma once
#include "rollcall/matching/embedding.hpp"
#include <string>
#include <vector>

namespace rollcall {

struct ThresholdMetrics {
    double threshold = 0.0;
    int tp = 0, fp = 0, tn = 0, fn = 0;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
};

struct CalibrationReport {
    std::vector<ThresholdMetrics> sweep;
    ThresholdMetrics best;
};

class ThresholdCalibrator {
public:
    void add_pair(double distance, bool same);
    void add_embedding_pair(const Embedding& a, const Embedding& b, bool same);
    // false (pair dropped) when the hashes cannot be compared
    bool add_hash_pair(const std::string& a, const std::string& b, bool same);

    ThresholdMetrics evaluate(double threshold) const;
    CalibrationReport sweep(double from, double to, double step) const;

    size_t size() const { return pairs.size(); }

private:
    struct LabeledPair {
        double distance;
        bool same;
    };
    std::vector<LabeledPair> pairs;
};

} // namespace rollcall
