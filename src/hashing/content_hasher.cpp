// ============= src/hashing/content_hasher.cpp =============
#include "rollcall/hashing/content_hasher.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace rollcall {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

std::string to_hex(const unsigned char* data, size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Bits MSB-first. Left-padded with zeros to a whole number of nibbles.
std::string bits_to_hex(const std::vector<bool>& bits) {
    static const char* digits = "0123456789abcdef";
    size_t pad = (4 - bits.size() % 4) % 4;

    std::string out;
    int nibble = 0;
    int filled = static_cast<int>(pad);
    for (bool bit : bits) {
        nibble = (nibble << 1) | (bit ? 1 : 0);
        if (++filled == 4) {
            out.push_back(digits[nibble]);
            nibble = 0;
            filled = 0;
        }
    }
    return out;
}

} // namespace

// ==================== MEDIA TYPE ====================

const char* to_string(MediaType type) {
    switch (type) {
        case MediaType::Image: return "image";
        case MediaType::Video: return "video";
        case MediaType::Other: return "other";
    }
    return "other";
}

MediaType media_type_from_string(const std::string& name) {
    std::string n = lower(name);
    if (n == "image") return MediaType::Image;
    if (n == "video") return MediaType::Video;
    return MediaType::Other;
}

MediaType media_type_from_path(const std::string& path) {
    std::string ext = lower(std::filesystem::path(path).extension().string());

    static const char* images[] = {".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp"};
    static const char* videos[] = {".mp4", ".mov", ".avi", ".mkv", ".webm"};

    for (const char* e : images) if (ext == e) return MediaType::Image;
    for (const char* e : videos) if (ext == e) return MediaType::Video;
    return MediaType::Other;
}

// ==================== CONSTRUCTOR ====================

ContentHasher::ContentHasher(int hash_size) : hash_size(hash_size) {
    if (hash_size < 2) {
        throw std::invalid_argument("hash_size must be >= 2");
    }
}

// ==================== SHA-256 ====================

std::optional<std::string> ContentHasher::sha256_stream(std::istream& in) {
    EvpCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("EVP_DigestInit_ex failed");
        return std::nullopt;
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            spdlog::error("EVP_DigestUpdate failed");
            return std::nullopt;
        }
    }
    if (in.bad()) {
        spdlog::warn("Error de lectura durante el hash");
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        spdlog::error("EVP_DigestFinal_ex failed");
        return std::nullopt;
    }
    return to_hex(digest, len);
}

std::optional<std::string> ContentHasher::sha256_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::warn("No se puede abrir {}", path);
        return std::nullopt;
    }
    return sha256_stream(file);
}

std::string ContentHasher::sha256_bytes(const void* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    EvpCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(digest, len);
}

// ==================== PERCEPTUAL HASH ====================

std::optional<std::string> ContentHasher::perceptual_hash(const cv::Mat& image) const {
    if (image.empty()) {
        return std::nullopt;
    }

    try {
        return compute_phash(image);
    } catch (const cv::Exception& e) {
        spdlog::warn("pHash: error de OpenCV: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> ContentHasher::compute_phash(const cv::Mat& image) const {
    cv::Mat gray;
    switch (image.channels()) {
        case 1: gray = image; break;
        case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            spdlog::warn("pHash: {} canales no soportados", image.channels());
            return std::nullopt;
    }

    const int img_size = hash_size * 4;
    cv::Mat resized, pixels, freq;
    cv::resize(gray, resized, cv::Size(img_size, img_size), 0, 0, cv::INTER_AREA);
    resized.convertTo(pixels, CV_32F);
    cv::dct(pixels, freq);

    cv::Mat low = freq(cv::Rect(0, 0, hash_size, hash_size)).clone();

    std::vector<float> values(low.begin<float>(), low.end<float>());
    std::vector<float> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    size_t n = sorted.size();
    float median = (n % 2 == 0) ? (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0f
                                : sorted[n / 2];

    std::vector<bool> bits;
    bits.reserve(n);
    for (float v : values) {
        bits.push_back(v > median);
    }
    return bits_to_hex(bits);
}

std::optional<std::string> ContentHasher::perceptual_hash_file(const std::string& path) const {
    cv::Mat image;
    try {
        image = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        spdlog::warn("pHash: error decodificando {}: {}", path, e.what());
        return std::nullopt;
    }
    if (image.empty()) {
        spdlog::warn("pHash: imagen ilegible o corrupta: {}", path);
        return std::nullopt;
    }
    return perceptual_hash(image);
}

std::optional<std::string> ContentHasher::video_first_frame_hash(const std::string& path) const {
    cv::VideoCapture cap(path);
    if (!cap.isOpened()) {
        spdlog::warn("pHash: no se pudo abrir video {}", path);
        return std::nullopt;
    }

    // Algunos codecs entregan frames vacios al inicio
    cv::Mat frame;
    for (int attempt = 0; attempt < 30; ++attempt) {
        if (!cap.read(frame)) break;
        if (!frame.empty()) {
            return perceptual_hash(frame);
        }
    }

    spdlog::warn("pHash: ningun frame decodificable en {}", path);
    return std::nullopt;
}

// ==================== FINGERPRINT ====================

MediaFingerprint ContentHasher::hash_file(const std::string& path, MediaType type) const {
    MediaFingerprint fp;

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        spdlog::warn("Archivo ilegible: {} ({})", path, ec.message());
        return fp;
    }

    fp.content_hash = sha256_file(path);
    if (!fp.content_hash) {
        return fp;
    }
    fp.file_size = static_cast<int64_t>(size);

    if (type == MediaType::Image) {
        fp.perceptual_hash = perceptual_hash_file(path);
    } else if (type == MediaType::Video) {
        fp.perceptual_hash = video_first_frame_hash(path);
    }

    spdlog::debug("Hashed {}: sha256={} phash={}", path,
                  fp.content_hash->substr(0, 16),
                  fp.perceptual_hash ? fp.perceptual_hash->substr(0, 16) : "null");
    return fp;
}

} // namespace rollcall
