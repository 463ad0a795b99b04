// ============= include/rollcall/vision/vision_client.hpp =============
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

// Servicio externo de analisis de uniforme.
// Recibe la imagen codificada (JPEG) y devuelve el texto crudo de la respuesta,
// o nullopt si el servicio fallo.
class VisionClient {
public:
    virtual ~VisionClient() = default;

    virtual std::optional<std::string> analyze(const std::vector<unsigned char>& encoded_image) = 0;
    virtual std::string name() const = 0;
};

} // namespace rollcall
