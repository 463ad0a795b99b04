// ============= include/rollcall/hashing/content_hasher.hpp =============
/*
 * Content Hasher - huellas de archivos subidos
 *
 * - content_hash: SHA-256 (hex, 64 chars) sobre el stream completo,
 *   leido en bloques de 8 KB
 * - perceptual_hash: pHash DCT (hash_size x hash_size bits, hex)
 *     imagen -> gris -> resize (4*hash_size)^2 -> DCT 2D
 *     -> bloque top-left hash_size x hash_size -> bit = coef > mediana
 * - video: pHash del primer frame decodificable
 *
 * FALLOS:
 * - archivo ilegible          -> ambos hashes nulos
 * - imagen corrupta / codec   -> solo perceptual_hash nulo
 */

#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace rollcall {

enum class MediaType { Image, Video, Other };

const char* to_string(MediaType type);
MediaType media_type_from_string(const std::string& name);

// Classifies by file extension (case-insensitive).
MediaType media_type_from_path(const std::string& path);

struct MediaFingerprint {
    std::optional<std::string> content_hash;
    std::optional<std::string> perceptual_hash;
    int64_t file_size = 0;

    bool readable() const { return content_hash.has_value(); }
};

class ContentHasher {
public:
    static constexpr size_t CHUNK_SIZE = 8192;

    explicit ContentHasher(int hash_size = 16);

    MediaFingerprint hash_file(const std::string& path, MediaType type) const;

    std::optional<std::string> perceptual_hash(const cv::Mat& image) const;
    std::optional<std::string> perceptual_hash_file(const std::string& path) const;
    std::optional<std::string> video_first_frame_hash(const std::string& path) const;

    static std::optional<std::string> sha256_stream(std::istream& in);
    static std::optional<std::string> sha256_file(const std::string& path);
    static std::string sha256_bytes(const void* data, size_t size);

    int get_hash_size() const { return hash_size; }

private:
    int hash_size;

    std::optional<std::string> compute_phash(const cv::Mat& image) const;
};

} // namespace rollcall
