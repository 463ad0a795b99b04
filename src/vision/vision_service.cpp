// ============= src/vision/vision_service.cpp =============
#include "rollcall/vision/vision_service.hpp"
#include "rollcall/hashing/content_hasher.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

namespace rollcall {

VisionService::VisionService(VisionClient& client, AnalysisCache& cache, RateLimiter& limiter)
    : client(client), cache(cache), limiter(limiter) {}

std::optional<VisionAnalysis> VisionService::analyze(const cv::Mat& image, bool force_reanalyze) {
    if (image.empty()) return std::nullopt;

    std::vector<unsigned char> encoded;
    try {
        if (!cv::imencode(".jpg", image, encoded, {cv::IMWRITE_JPEG_QUALITY, 95})) {
            spdlog::warn("Vision: no se pudo codificar la imagen");
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        spdlog::warn("Vision: error codificando imagen: {}", e.what());
        return std::nullopt;
    }

    std::string key = ContentHasher::sha256_bytes(encoded.data(), encoded.size());

    if (!force_reanalyze) {
        auto cached = cache.get(key);
        if (cached) {
            cache_hits++;
            spdlog::debug("Vision: cache hit {}", key.substr(0, 12));
            return VisionAnalysis::from_json(*cached);
        }
    }

    limiter.acquire();
    api_calls++;

    auto raw = client.analyze(encoded);
    if (!raw) {
        spdlog::warn("Vision: {} no devolvio respuesta", client.name());
        return std::nullopt;
    }

    auto root = VisionAnalysis::extract_json(*raw);
    if (!root) return std::nullopt;

    if (!cache.set(key, *root)) {
        spdlog::warn("Vision: no se pudo guardar en cache {}", key.substr(0, 12));
    }
    return VisionAnalysis::from_json(*root);
}

} // namespace rollcall
