// ============= src/models/model_context.cpp =============
#include "rollcall/models/model_context.hpp"
#include "rollcall/core/errors.hpp"
#include "rollcall/models/onnx_face_embedder.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

ModelContext::ModelContext(std::unique_ptr<FaceEmbedder> embedder,
                           std::unique_ptr<TextReader> text_reader,
                           VisionService* vision)
    : embedder(std::move(embedder)), text_reader(std::move(text_reader)), vision(vision),
      embedder_available(this->embedder != nullptr),
      text_reader_available(this->text_reader != nullptr),
      vision_available(vision != nullptr) {}

ModelContext ModelContext::from_config(const RegistryConfig& config) {
    std::unique_ptr<FaceEmbedder> embedder;

    if (config.matching.enabled && !config.matching.model_path.empty()) {
        try {
            embedder = std::make_unique<OnnxFaceEmbedder>(config.matching.model_path,
                                                          config.matching.embedding_dim);
        } catch (const RegistryError& e) {
            spdlog::warn("Embedder no disponible: {}", e.what());
        }
    }

    ModelContext ctx(std::move(embedder));
    ctx.print_capabilities();
    return ctx;
}

void ModelContext::print_capabilities() const {
    spdlog::info("Modelos:");
    spdlog::info("   Embeddings: {}", embedder_available ? "✓" : "no disponible");
    spdlog::info("   OCR:        {}", text_reader_available ? "✓" : "no disponible");
    spdlog::info("   Vision:     {}", vision_available ? "✓" : "no disponible");
}

} // namespace rollcall
