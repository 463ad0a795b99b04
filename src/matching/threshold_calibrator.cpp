// ============= src/matching/threshold_calibrator.cpp =============
#include "rollcall/matching/threshold_calibrator.hpp"
#include "rollcall/hashing/hash_distance.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace rollcall {

void ThresholdCalibrator::add_pair(double distance, bool same) {
    if (!std::isfinite(distance)) {
        spdlog::warn("Calibracion: distancia no finita ignorada");
        return;
    }
    pairs.push_back({distance, same});
}

void ThresholdCalibrator::add_embedding_pair(const Embedding& a, const Embedding& b, bool same) {
    add_pair(euclidean_distance(a, b), same);
}

bool ThresholdCalibrator::add_hash_pair(const std::string& a, const std::string& b, bool same) {
    auto d = hamming_distance(a, b);
    if (!d.ok()) {
        spdlog::warn("Calibracion: par no comparable ({})", to_string(d.error));
        return false;
    }
    pairs.push_back({static_cast<double>(d.bits), same});
    return true;
}

ThresholdMetrics ThresholdCalibrator::evaluate(double threshold) const {
    ThresholdMetrics m;
    m.threshold = threshold;

    for (const auto& p : pairs) {
        bool predicted_same = p.distance <= threshold;
        if (predicted_same && p.same) m.tp++;
        else if (predicted_same && !p.same) m.fp++;
        else if (!predicted_same && p.same) m.fn++;
        else m.tn++;
    }

    m.precision = (m.tp + m.fp) > 0 ? static_cast<double>(m.tp) / (m.tp + m.fp) : 0.0;
    m.recall = (m.tp + m.fn) > 0 ? static_cast<double>(m.tp) / (m.tp + m.fn) : 0.0;
    m.f1 = (m.precision + m.recall) > 0.0
        ? 2.0 * m.precision * m.recall / (m.precision + m.recall) : 0.0;
    return m;
}

CalibrationReport ThresholdCalibrator::sweep(double from, double to, double step) const {
    CalibrationReport report;
    if (step <= 0.0 || to < from) {
        spdlog::error("Calibracion: rango invalido [{}, {}] paso {}", from, to, step);
        return report;
    }

    int steps = static_cast<int>(std::floor((to - from) / step + 1e-9));
    for (int i = 0; i <= steps; ++i) {
        auto m = evaluate(from + i * step);
        if (report.sweep.empty() || m.f1 > report.best.f1) {
            report.best = m;
        }
        report.sweep.push_back(m);
    }
    return report;
}

} // namespace rollcall
