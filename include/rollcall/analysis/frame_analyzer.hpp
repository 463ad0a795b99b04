// ============= include/rollcall/analysis/frame_analyzer.hpp =============
/*
 * Frame Analyzer - rostro detectado -> Sighting
 *
 * PIPELINE:
 *   1. Recorta la caja al frame (cajas < 10px o vacias se descartan)
 *   2. Blur = varianza del Laplaciano del rostro
 *   3. Embedding del rostro (si hay embedder)
 *   4. Region del cuerpo bajo el rostro -> OCR + vision (si disponibles)
 *
 * Un modelo ausente deja su señal vacia; nunca aborta el frame.
 */

#pragma once
#include "rollcall/analysis/sighting.hpp"
#include "rollcall/models/model_context.hpp"
#include <optional>
#include <vector>

namespace rollcall {

class FrameAnalyzer {
public:
    static constexpr int MIN_FACE_SIZE = 10;

    explicit FrameAnalyzer(ModelContext& models);

    std::optional<Sighting> analyze(const cv::Mat& frame, const cv::Rect& face,
                                    std::optional<float> detection_confidence = std::nullopt) const;

    std::vector<Sighting> analyze_frame(const FrameInput& frame) const;

    static std::optional<cv::Rect> clip_box(const cv::Rect& box, const cv::Size& frame_size);

    // Hombros/pecho: y+0.8h .. y+3.5h, x-0.8w .. x+w+0.8w
    static std::optional<cv::Rect> body_roi(const cv::Rect& face, const cv::Size& frame_size);

    static double blur_score(const cv::Mat& image);

private:
    ModelContext& models;
};

} // namespace rollcall
