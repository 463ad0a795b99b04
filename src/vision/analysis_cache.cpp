// ============= src/vision/analysis_cache.cpp =============
#include "rollcall/vision/analysis_cache.hpp"
#include "rollcall/core/utils.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

namespace rollcall {

AnalysisCache::AnalysisCache(const std::string& cache_dir, int ttl_days)
    : cache_dir(cache_dir), ttl_seconds(static_cast<int64_t>(ttl_days) * 24 * 60 * 60)
{
    std::error_code ec;
    fs::create_directories(this->cache_dir, ec);
    if (ec) {
        spdlog::warn("AnalysisCache: no se pudo crear {}: {}", cache_dir, ec.message());
    }
}

bool AnalysisCache::valid_key(const std::string& image_hash) {
    if (image_hash.size() < 2) return false;
    for (char c : image_hash) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

fs::path AnalysisCache::path_for(const std::string& image_hash) const {
    return cache_dir / image_hash.substr(0, 2) / (image_hash + ".json");
}

std::optional<Json::Value> AnalysisCache::read_entry(const fs::path& file) const {
    std::ifstream in(file);
    if (!in.is_open()) return std::nullopt;

    Json::Value entry;
    Json::CharReaderBuilder reader;
    std::string errs;
    if (!Json::parseFromStream(reader, in, &entry, &errs) || !entry.isObject()) {
        return std::nullopt;
    }
    return entry;
}

bool AnalysisCache::expired(const Json::Value& entry) const {
    int64_t cached_at = entry["cached_at"].isNumeric() ? entry["cached_at"].asInt64() : 0;
    return unix_seconds() - cached_at > ttl_seconds;
}

// ==================== GET / SET ====================

std::optional<Json::Value> AnalysisCache::get(const std::string& image_hash) const {
    if (!valid_key(image_hash)) return std::nullopt;

    fs::path file = path_for(image_hash);
    std::error_code ec;
    if (!fs::exists(file, ec)) return std::nullopt;

    auto entry = read_entry(file);
    if (!entry) {
        spdlog::warn("AnalysisCache: entrada corrupta {}, eliminando", file.string());
        fs::remove(file, ec);
        return std::nullopt;
    }
    if (expired(*entry)) {
        spdlog::debug("AnalysisCache: entrada expirada {}", image_hash);
        fs::remove(file, ec);
        return std::nullopt;
    }
    return (*entry)["analysis"];
}

bool AnalysisCache::set(const std::string& image_hash, const Json::Value& analysis) const {
    if (!valid_key(image_hash)) {
        spdlog::error("AnalysisCache: clave invalida '{}'", image_hash);
        return false;
    }

    fs::path file = path_for(image_hash);
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
        spdlog::error("AnalysisCache: {}", ec.message());
        return false;
    }

    Json::Value entry(Json::objectValue);
    entry["image_hash"] = image_hash;
    entry["cached_at"] = Json::Int64(unix_seconds());
    entry["cached_at_iso"] = now_timestamp();
    entry["analysis"] = analysis;

    std::ofstream out(file);
    if (!out.is_open()) {
        spdlog::error("AnalysisCache: no se pudo escribir {}", file.string());
        return false;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    out << Json::writeString(writer, entry);
    return out.good();
}

bool AnalysisCache::remove(const std::string& image_hash) const {
    if (!valid_key(image_hash)) return false;
    std::error_code ec;
    fs::remove(path_for(image_hash), ec);
    return !ec;
}

// ==================== MANTENIMIENTO ====================

int AnalysisCache::clear() const {
    int count = 0;
    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) return 0;

    for (const auto& sub : fs::directory_iterator(cache_dir, ec)) {
        if (!sub.is_directory()) continue;
        for (const auto& f : fs::directory_iterator(sub.path(), ec)) {
            if (f.path().extension() != ".json") continue;
            if (fs::remove(f.path(), ec)) count++;
        }
    }
    spdlog::info("AnalysisCache: {} entradas eliminadas", count);
    return count;
}

int AnalysisCache::cleanup_expired() const {
    int count = 0;
    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) return 0;

    for (const auto& sub : fs::directory_iterator(cache_dir, ec)) {
        if (!sub.is_directory()) continue;
        for (const auto& f : fs::directory_iterator(sub.path(), ec)) {
            if (f.path().extension() != ".json") continue;
            auto entry = read_entry(f.path());
            if (!entry || expired(*entry)) {
                if (fs::remove(f.path(), ec)) count++;
            }
        }
    }
    spdlog::info("AnalysisCache: {} entradas expiradas eliminadas", count);
    return count;
}

CacheStats AnalysisCache::stats() const {
    CacheStats s;
    s.ttl_days = static_cast<int>(ttl_seconds / (24 * 60 * 60));
    s.cache_dir = cache_dir.string();

    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) return s;

    for (const auto& sub : fs::directory_iterator(cache_dir, ec)) {
        if (!sub.is_directory()) continue;
        for (const auto& f : fs::directory_iterator(sub.path(), ec)) {
            if (f.path().extension() != ".json") continue;
            s.total_entries++;
            auto size = fs::file_size(f.path(), ec);
            if (!ec) s.total_size_bytes += size;

            auto entry = read_entry(f.path());
            if (!entry || expired(*entry)) s.expired_entries++;
        }
    }
    s.valid_entries = s.total_entries - s.expired_entries;
    return s;
}

} // namespace rollcall
