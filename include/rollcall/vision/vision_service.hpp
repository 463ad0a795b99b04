// ============= include/rollcall/vision/vision_service.hpp =============
/*
 * Vision Service
 *
 * FLUJO:
 *   crop -> JPEG -> SHA-256 -> cache? -> rate limit -> cliente -> parse -> cache
 *
 * ERRORES: fallo de codificacion, del cliente o del parseo -> nullopt
 */

#pragma once
#include "rollcall/reconcile/vision_analysis.hpp"
#include "rollcall/vision/analysis_cache.hpp"
#include "rollcall/vision/rate_limiter.hpp"
#include "rollcall/vision/vision_client.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <optional>

namespace rollcall {

class VisionService {
public:
    VisionService(VisionClient& client, AnalysisCache& cache, RateLimiter& limiter);

    std::optional<VisionAnalysis> analyze(const cv::Mat& image, bool force_reanalyze = false);

    int get_cache_hits() const { return cache_hits.load(); }
    int get_api_calls() const { return api_calls.load(); }

private:
    VisionClient& client;
    AnalysisCache& cache;
    RateLimiter& limiter;

    std::atomic<int> cache_hits{0};
    std::atomic<int> api_calls{0};
};

} // namespace rollcall
