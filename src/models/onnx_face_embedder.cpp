// ============= src/models/onnx_face_embedder.cpp =============
#include "rollcall/models/onnx_face_embedder.hpp"
#include "rollcall/core/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>

namespace rollcall {

// ==================== CONSTRUCTOR ====================

OnnxFaceEmbedder::OnnxFaceEmbedder(const std::string& model_path, int embedding_size)
    : embedding_size(embedding_size)
{
    spdlog::info("Inicializando Face Embedder (ONNX)");
    spdlog::info("   Modelo: {}", model_path);

    if (!std::filesystem::exists(model_path)) {
        throw RegistryError("modelo de embeddings no encontrado: " + model_path);
    }

    try {
        net = cv::dnn::readNetFromONNX(model_path);
    } catch (const cv::Exception& e) {
        throw RegistryError("no se pudo cargar el modelo " + model_path + ": " + e.what());
    }
    if (net.empty()) {
        throw RegistryError("modelo vacio: " + model_path);
    }

    net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

    spdlog::info("✓ Face Embedder listo (embedding size: {})", embedding_size);
}

// ==================== PREPROCESS ====================

cv::Mat OnnxFaceEmbedder::preprocess(const cv::Mat& face) const {
    cv::Mat bgr;
    if (face.channels() == 1) {
        cv::cvtColor(face, bgr, cv::COLOR_GRAY2BGR);
    } else if (face.channels() == 4) {
        cv::cvtColor(face, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = face;
    }

    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(input_width, input_height));

    return cv::dnn::blobFromImage(resized, 1.0 / 128.0, cv::Size(input_width, input_height),
                                  cv::Scalar(127.5, 127.5, 127.5), true, false);
}

// ==================== EMBED ====================

std::optional<Embedding> OnnxFaceEmbedder::embed(const cv::Mat& face) {
    if (face.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mtx);
    try {
        auto t0 = std::chrono::high_resolution_clock::now();
        cv::Mat blob = preprocess(face);
        auto t1 = std::chrono::high_resolution_clock::now();

        net.setInput(blob);
        cv::Mat out = net.forward();
        auto t2 = std::chrono::high_resolution_clock::now();

        last_profile.preprocess_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        last_profile.inference_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

        cv::Mat flat = out.reshape(1, 1);
        if (static_cast<int>(flat.total()) != embedding_size) {
            spdlog::error("Embedder: salida de {} valores, esperado {}", flat.total(), embedding_size);
            return std::nullopt;
        }

        flat.convertTo(flat, CV_32F);
        cv::normalize(flat, flat, 1.0, 0.0, cv::NORM_L2);

        Embedding emb(flat.begin<float>(), flat.end<float>());
        if (!is_valid_embedding(emb, embedding_size)) return std::nullopt;
        return emb;

    } catch (const cv::Exception& e) {
        spdlog::error("Embedder: error de inferencia: {}", e.what());
        return std::nullopt;
    }
}

} // namespace rollcall
