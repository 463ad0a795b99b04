// ============= src/analysis/frame_analyzer.cpp =============
#include "rollcall/analysis/frame_analyzer.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rollcall {

FrameAnalyzer::FrameAnalyzer(ModelContext& models) : models(models) {}

// ==================== GEOMETRIA ====================

std::optional<cv::Rect> FrameAnalyzer::clip_box(const cv::Rect& box, const cv::Size& frame_size) {
    if (box.width < MIN_FACE_SIZE || box.height < MIN_FACE_SIZE) return std::nullopt;

    cv::Rect clipped = box & cv::Rect(0, 0, frame_size.width, frame_size.height);
    if (clipped.empty()) return std::nullopt;
    return clipped;
}

std::optional<cv::Rect> FrameAnalyzer::body_roi(const cv::Rect& face, const cv::Size& frame_size) {
    int x = face.x, y = face.y, w = face.width, h = face.height;

    int y1 = std::min(frame_size.height, y + static_cast<int>(h * 0.8));
    int y2 = std::min(frame_size.height, y + static_cast<int>(h * 3.5));
    int x1 = std::max(0, x - static_cast<int>(w * 0.8));
    int x2 = std::min(frame_size.width, x + w + static_cast<int>(w * 0.8));

    if (y2 <= y1 || x2 <= x1) return std::nullopt;
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

double FrameAnalyzer::blur_score(const cv::Mat& image) {
    if (image.empty()) return 0.0;

    cv::Mat gray, lap;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = image;
    }
    cv::Laplacian(gray, lap, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(lap, mean, stddev);
    return stddev[0] * stddev[0];
}

// ==================== ANALISIS ====================

std::optional<Sighting> FrameAnalyzer::analyze(const cv::Mat& frame, const cv::Rect& face,
                                               std::optional<float> detection_confidence) const {
    if (frame.empty()) return std::nullopt;

    auto box = clip_box(face, frame.size());
    if (!box) {
        spdlog::debug("Rostro descartado: caja {}x{} en ({},{})", face.width, face.height, face.x, face.y);
        return std::nullopt;
    }

    Sighting s;
    s.bbox = *box;
    s.detection_confidence = detection_confidence;

    cv::Mat face_crop = frame(*box);
    s.blur_score = blur_score(face_crop);

    if (models.has_embedder()) {
        s.embedding = models.get_embedder().embed(face_crop);
        if (!s.embedding) spdlog::warn("Embedding fallido para rostro en ({},{})", box->x, box->y);
    }

    auto roi = body_roi(*box, frame.size());
    if (!roi) return s;

    cv::Mat body = frame(*roi);
    if (models.has_text_reader()) {
        s.signals.ocr = models.get_text_reader().read(body);
    }
    if (models.has_vision()) {
        s.signals.vision = models.get_vision().analyze(body);
    }
    return s;
}

std::vector<Sighting> FrameAnalyzer::analyze_frame(const FrameInput& frame) const {
    std::vector<Sighting> out;
    for (size_t i = 0; i < frame.faces.size(); ++i) {
        std::optional<float> conf;
        if (i < frame.confidences.size()) conf = frame.confidences[i];

        auto s = analyze(frame.image, frame.faces[i], conf);
        if (!s) continue;
        s->frame_number = frame.frame_number;
        s->timestamp_seconds = frame.timestamp_seconds;
        out.push_back(std::move(*s));
    }
    return out;
}

} // namespace rollcall
