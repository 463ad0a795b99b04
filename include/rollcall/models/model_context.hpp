// ============= include/rollcall/models/model_context.hpp =============
/*
 * Model Context - servicios de modelos construidos una vez al arrancar
 *
 * Cada servicio es opcional. La disponibilidad se fija en el constructor
 * (has_embedder / has_text_reader / has_vision) y los componentes la
 * consultan en lugar de comprobar punteros en cada llamada.
 */

#pragma once
#include "rollcall/core/config.hpp"
#include "rollcall/models/face_embedder.hpp"
#include "rollcall/vision/vision_service.hpp"
#include <memory>

namespace rollcall {

class ModelContext {
public:
    ModelContext(std::unique_ptr<FaceEmbedder> embedder = nullptr,
                 std::unique_ptr<TextReader> text_reader = nullptr,
                 VisionService* vision = nullptr);

    // Carga el embedder ONNX si matching.model_path esta configurado.
    // Un modelo que no carga deja la capacidad deshabilitada (warning).
    static ModelContext from_config(const RegistryConfig& config);

    bool has_embedder() const { return embedder_available; }
    bool has_text_reader() const { return text_reader_available; }
    bool has_vision() const { return vision_available; }

    FaceEmbedder& get_embedder() const { return *embedder; }
    TextReader& get_text_reader() const { return *text_reader; }
    VisionService& get_vision() const { return *vision; }

    void print_capabilities() const;

private:
    std::unique_ptr<FaceEmbedder> embedder;
    std::unique_ptr<TextReader> text_reader;
    VisionService* vision;

    bool embedder_available;
    bool text_reader_available;
    bool vision_available;
};

} // namespace rollcall
