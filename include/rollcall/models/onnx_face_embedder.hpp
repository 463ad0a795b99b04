// ============= include/rollcall/models/onnx_face_embedder.hpp =============
/*
 * Face Embedder - OpenCV DNN (ONNX)
 *
 * CARACTERÍSTICAS:
 * - Modelos tipo ArcFace / SFace en formato ONNX
 * - Entrada 112x112 RGB, (x - 127.5) / 128
 * - Salida L2-normalizada
 *
 * ERRORES:
 * - modelo ausente o ilegible -> RegistryError en el constructor
 * - rostro vacio o fallo de inferencia -> nullopt
 */

#pragma once
#include "rollcall/models/face_embedder.hpp"
#include <opencv2/dnn.hpp>
#include <mutex>
#include <string>

namespace rollcall {

class OnnxFaceEmbedder : public FaceEmbedder {
public:
    explicit OnnxFaceEmbedder(const std::string& model_path, int embedding_size = 512);

    std::optional<Embedding> embed(const cv::Mat& face) override;
    int get_embedding_size() const override { return embedding_size; }

    struct ProfileStats {
        double preprocess_ms = 0;
        double inference_ms = 0;
    };
    ProfileStats last_profile;

private:
    cv::dnn::Net net;
    int input_width = 112;
    int input_height = 112;
    int embedding_size;
    std::mutex mtx;   // cv::dnn::Net no es thread-safe

    cv::Mat preprocess(const cv::Mat& face) const;
};

} // namespace rollcall
