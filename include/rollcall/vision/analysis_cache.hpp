// ============= include/rollcall/vision/analysis_cache.hpp =============
/*
 * Cache de analisis de vision en disco
 *
 * ESTRUCTURA:
 *   cache_dir/<hash[0:2]>/<hash>.json
 *   { "image_hash", "cached_at" (unix s), "cached_at_iso", "analysis" }
 *
 * - TTL configurable (30 dias por defecto)
 * - Entradas expiradas o corruptas se borran al leerlas
 */

#pragma once
#include <json/json.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rollcall {

struct CacheStats {
    int total_entries = 0;
    int expired_entries = 0;
    int valid_entries = 0;
    uintmax_t total_size_bytes = 0;
    int ttl_days = 0;
    std::string cache_dir;
};

class AnalysisCache {
public:
    AnalysisCache(const std::string& cache_dir, int ttl_days = 30);

    std::optional<Json::Value> get(const std::string& image_hash) const;
    bool set(const std::string& image_hash, const Json::Value& analysis) const;
    bool remove(const std::string& image_hash) const;

    int clear() const;
    int cleanup_expired() const;
    CacheStats stats() const;

    std::filesystem::path path_for(const std::string& image_hash) const;

private:
    std::filesystem::path cache_dir;
    int64_t ttl_seconds;

    static bool valid_key(const std::string& image_hash);
    std::optional<Json::Value> read_entry(const std::filesystem::path& file) const;
    bool expired(const Json::Value& entry) const;
};

} // namespace rollcall
