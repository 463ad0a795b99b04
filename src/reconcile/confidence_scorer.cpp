// ============= src/reconcile/confidence_scorer.cpp =============
#include "rollcall/reconcile/confidence_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace rollcall {

std::string ConfidenceScore::factors_json() const {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, factors);
}

ConfidenceScore score_confidence(const ConfidenceInputs& inputs) {
    ConfidenceScore result;
    double sum = 0.0;
    int count = 0;

    auto add = [&](const char* name, double value) {
        value = std::clamp(value, 0.0, 1.0);
        result.factors[name] = value;
        sum += value;
        ++count;
    };

    if (inputs.face_detection) add("face_detection", *inputs.face_detection);
    if (inputs.blur_score) add("face_quality", std::min(1.0, *inputs.blur_score / 100.0));
    if (inputs.match_distance && inputs.match_threshold > 0.0f && std::isfinite(*inputs.match_distance)) {
        add("identity_match", 1.0 - *inputs.match_distance / inputs.match_threshold);
    }
    if (inputs.attribution) add("attribution", *inputs.attribution);

    result.score = count > 0 ? static_cast<int>(std::lround(100.0 * sum / count)) : 0;
    result.factors["factor_count"] = count;
    return result;
}

} // namespace rollcall
