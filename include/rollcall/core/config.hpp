// ============= include/rollcall/core/config.hpp =============
/*
 * Configuración del registro
 *
 * - ConfigFile: lector TOML minimo ([section], key = value, # comentarios)
 * - RegistryConfig: todos los umbrales y rutas, con defaults
 *
 * Las claves se leen como "section.key", p.ej. "duplicates.phash_threshold".
 */

#pragma once
#include <map>
#include <string>

namespace rollcall {

namespace defaults {
    constexpr const char* DB_PATH = "data/rollcall.db";
    constexpr int BUSY_TIMEOUT_MS = 5000;

    // Duplicados
    constexpr int PHASH_THRESHOLD = 10;
    constexpr int HASH_SIZE = 16;
    constexpr int CANDIDATE_BATCH = 1000;
    constexpr int MAX_CANDIDATES = 100000;

    // Embeddings
    constexpr float EMBEDDING_THRESHOLD = 0.8f;
    constexpr int EMBEDDING_DIM = 512;

    // Reconciliación
    constexpr float VISION_THRESHOLD = 0.6f;
    constexpr float OCR_MIN_CONFIDENCE = 0.3f;

    // Merge
    constexpr float AUTO_MERGE_THRESHOLD = 0.95f;
    constexpr float SUGGEST_THRESHOLD = 0.85f;

    // Vision API
    constexpr int RATE_LIMIT_PER_MINUTE = 10;
    constexpr const char* CACHE_DIR = "data/analysis_cache";
    constexpr int CACHE_TTL_DAYS = 30;

    constexpr int INGEST_WORKERS = 2;
}

class ConfigFile {
public:
    bool load(const std::string& filename);
    bool parse(const std::string& text);

    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

    bool has(const std::string& key) const { return values.count(key) > 0; }

private:
    std::map<std::string, std::string> values;
};

enum class IndexKind { Linear, Hnsw };

struct RegistryConfig {
    struct Database {
        std::string path = defaults::DB_PATH;
        int busy_timeout_ms = defaults::BUSY_TIMEOUT_MS;
    } database;

    struct Duplicates {
        int phash_threshold = defaults::PHASH_THRESHOLD;
        int hash_size = defaults::HASH_SIZE;
        int batch_size = defaults::CANDIDATE_BATCH;
        int max_candidates = defaults::MAX_CANDIDATES;
    } duplicates;

    struct Matching {
        bool enabled = true;
        float embedding_threshold = defaults::EMBEDDING_THRESHOLD;
        int embedding_dim = defaults::EMBEDDING_DIM;
        IndexKind index = IndexKind::Linear;
        std::string model_path;
    } matching;

    struct Reconcile {
        float vision_threshold = defaults::VISION_THRESHOLD;
        float ocr_min_confidence = defaults::OCR_MIN_CONFIDENCE;
    } reconcile;

    struct Merge {
        float auto_threshold = defaults::AUTO_MERGE_THRESHOLD;
        float suggest_threshold = defaults::SUGGEST_THRESHOLD;
    } merge;

    struct Vision {
        int rate_limit_per_minute = defaults::RATE_LIMIT_PER_MINUTE;
        std::string cache_dir = defaults::CACHE_DIR;
        int cache_ttl_days = defaults::CACHE_TTL_DAYS;
    } vision;

    int ingest_workers = defaults::INGEST_WORKERS;
    std::string log_level = "info";

    static RegistryConfig from_config(const ConfigFile& config);

    // Falls back to defaults (with a warning) when the file is missing.
    static RegistryConfig from_file(const std::string& filename);
};

// Applies the "[%H:%M:%S.%e] [%^%l%$] %v" pattern and the named level.
void setup_logging(const std::string& level);

} // namespace rollcall
