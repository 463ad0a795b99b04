// ============= include/rollcall/models/face_embedder.hpp =============
#pragma once
#include "rollcall/matching/embedding.hpp"
#include "rollcall/reconcile/ocr.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

// Extractor de embeddings faciales (rostro recortado BGR -> vector L2-normalizado)
class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;

    virtual std::optional<Embedding> embed(const cv::Mat& face) = 0;
    virtual int get_embedding_size() const = 0;
};

// Motor OCR (recorte BGR -> lecturas con confianza)
class TextReader {
public:
    virtual ~TextReader() = default;

    virtual std::vector<OcrReading> read(const cv::Mat& image) = 0;
};

} // namespace rollcall
