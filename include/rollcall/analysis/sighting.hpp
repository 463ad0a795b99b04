// ============= include/rollcall/analysis/sighting.hpp =============
#pragma once
#include "rollcall/matching/embedding.hpp"
#include "rollcall/reconcile/detection_reconciler.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace rollcall {

// Un rostro detectado en un frame, con todas las señales ya extraidas
struct Sighting {
    cv::Rect bbox;
    std::optional<int> frame_number;
    std::optional<double> timestamp_seconds;

    std::optional<float> detection_confidence;
    std::optional<double> blur_score;
    std::optional<Embedding> embedding;   // nullopt = modelo ausente o fallo

    DetectionSignals signals;
    std::optional<std::string> crop_path;
};

// Frame decodificado + cajas de rostros del detector
struct FrameInput {
    cv::Mat image;
    int frame_number = 0;
    std::optional<double> timestamp_seconds;
    std::vector<cv::Rect> faces;
    std::vector<float> confidences;
};

} // namespace rollcall
