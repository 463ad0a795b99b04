// ============= src/core/config.cpp =============
#include "rollcall/core/config.hpp"
#include "rollcall/core/utils.hpp"
#include "rollcall/dedup/similarity_index.hpp"
#include "rollcall/matching/face_matcher.hpp"
#include "rollcall/reconcile/detection_reconciler.hpp"
#include "rollcall/registry/merge_manager.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace rollcall {

// ==================== CONFIG FILE ====================

bool ConfigFile::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool ConfigFile::parse(const std::string& text) {
    std::istringstream input(text);
    std::string line, section;

    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Config: linea ignorada '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.length() - 2);
        } else {
            // Comentario al final de un valor sin comillas
            auto hash = val.find('#');
            if (hash != std::string::npos) val = trim(val.substr(0, hash));
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string ConfigFile::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int ConfigFile::get_int(const std::string& key, int def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) {
        spdlog::warn("Config: '{}' no es entero ({}), usando {}", key, it->second, def);
        return def;
    }
}

float ConfigFile::get_float(const std::string& key, float def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try { return std::stof(it->second); }
    catch (const std::exception&) {
        spdlog::warn("Config: '{}' no es numero ({}), usando {}", key, it->second, def);
        return def;
    }
}

bool ConfigFile::get_bool(const std::string& key, bool def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    return it->second == "true" || it->second == "1";
}

// ==================== REGISTRY CONFIG ====================

RegistryConfig RegistryConfig::from_config(const ConfigFile& config) {
    RegistryConfig c;

    c.database.path = config.get("database.path", c.database.path);
    c.database.busy_timeout_ms = config.get_int("database.busy_timeout_ms", c.database.busy_timeout_ms);

    c.duplicates.phash_threshold = config.get_int("duplicates.phash_threshold", c.duplicates.phash_threshold);
    c.duplicates.hash_size = config.get_int("duplicates.hash_size", c.duplicates.hash_size);
    c.duplicates.batch_size = config.get_int("duplicates.batch_size", c.duplicates.batch_size);
    c.duplicates.max_candidates = config.get_int("duplicates.max_candidates", c.duplicates.max_candidates);

    c.matching.enabled = config.get_bool("matching.enabled", c.matching.enabled);
    c.matching.embedding_threshold = config.get_float("matching.embedding_threshold", c.matching.embedding_threshold);
    c.matching.embedding_dim = config.get_int("matching.embedding_dim", c.matching.embedding_dim);
    c.matching.model_path = config.get("matching.model_path", c.matching.model_path);

    std::string index = config.get("matching.index", "linear");
    if (index == "hnsw") {
        c.matching.index = IndexKind::Hnsw;
    } else if (index != "linear") {
        spdlog::warn("Config: matching.index '{}' desconocido, usando linear", index);
    }

    c.reconcile.vision_threshold = config.get_float("reconcile.vision_threshold", c.reconcile.vision_threshold);
    c.reconcile.ocr_min_confidence = config.get_float("reconcile.ocr_min_confidence", c.reconcile.ocr_min_confidence);

    c.merge.auto_threshold = config.get_float("merge.auto_threshold", c.merge.auto_threshold);
    c.merge.suggest_threshold = config.get_float("merge.suggest_threshold", c.merge.suggest_threshold);

    c.vision.rate_limit_per_minute = config.get_int("vision.rate_limit_per_minute", c.vision.rate_limit_per_minute);
    c.vision.cache_dir = config.get("vision.cache_dir", c.vision.cache_dir);
    c.vision.cache_ttl_days = config.get_int("vision.cache_ttl_days", c.vision.cache_ttl_days);

    c.ingest_workers = config.get_int("ingest.workers", c.ingest_workers);
    c.log_level = config.get("logging.level", c.log_level);

    if (c.duplicates.hash_size < 2) {
        spdlog::warn("Config: hash_size {} invalido, usando {}", c.duplicates.hash_size, defaults::HASH_SIZE);
        c.duplicates.hash_size = defaults::HASH_SIZE;
    }
    if (c.duplicates.batch_size <= 0) c.duplicates.batch_size = defaults::CANDIDATE_BATCH;
    if (c.ingest_workers <= 0) c.ingest_workers = 1;

    return c;
}

RegistryConfig RegistryConfig::from_file(const std::string& filename) {
    ConfigFile config;
    if (!config.load(filename)) {
        spdlog::warn("No se pudo cargar {}, usando valores por defecto", filename);
    }
    return from_config(config);
}

// ==================== OPCIONES POR COMPONENTE ====================

SimilarityIndex::Options SimilarityIndex::Options::from_config(const RegistryConfig& config) {
    Options o;
    o.threshold = config.duplicates.phash_threshold;
    o.batch_size = config.duplicates.batch_size;
    o.max_candidates = config.duplicates.max_candidates;
    return o;
}

FaceEmbeddingMatcher::Options FaceEmbeddingMatcher::Options::from_config(const RegistryConfig& config) {
    Options o;
    o.enabled = config.matching.enabled;
    o.threshold = config.matching.embedding_threshold;
    o.dim = config.matching.embedding_dim;
    return o;
}

DetectionReconciler::Options DetectionReconciler::Options::from_config(const RegistryConfig& config) {
    Options o;
    o.vision_threshold = config.reconcile.vision_threshold;
    o.ocr_min_confidence = config.reconcile.ocr_min_confidence;
    return o;
}

MergeManager::Options MergeManager::Options::from_config(const RegistryConfig& config) {
    Options o;
    o.auto_threshold = config.merge.auto_threshold;
    o.suggest_threshold = config.merge.suggest_threshold;
    return o;
}

void setup_logging(const std::string& level) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

} // namespace rollcall
