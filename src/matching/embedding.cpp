// ============= src/matching/embedding.cpp =============
#include "rollcall/matching/embedding.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace rollcall {

float euclidean_distance(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        return std::numeric_limits<float>::infinity();
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = static_cast<double>(a[i]) - b[i];
        sum += d * d;
    }
    return static_cast<float>(std::sqrt(sum));
}

float cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }

    double dot = 0.0, norm1 = 0.0, norm2 = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm1 += static_cast<double>(a[i]) * a[i];
        norm2 += static_cast<double>(b[i]) * b[i];
    }
    if (norm1 < 1e-12 || norm2 < 1e-12) {
        return 0.0f;
    }

    double sim = dot / (std::sqrt(norm1) * std::sqrt(norm2));
    return static_cast<float>(std::max(-1.0, std::min(1.0, sim)));
}

void l2_normalize(Embedding& embedding) {
    double norm = 0.0;
    for (float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 1e-6) {
        for (float& v : embedding) {
            v = static_cast<float>(v / norm);
        }
    }
}

bool is_valid_embedding(const Embedding& embedding, int expected_dim) {
    if (embedding.empty() || embedding.size() != static_cast<size_t>(expected_dim)) {
        return false;
    }
    return std::all_of(embedding.begin(), embedding.end(),
                       [](float v) { return std::isfinite(v); });
}

std::vector<unsigned char> serialize_embedding(const Embedding& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

Embedding deserialize_embedding(const void* data, int size) {
    if (data == nullptr || size <= 0 || size % sizeof(float) != 0) {
        return {};
    }
    Embedding emb(size / sizeof(float));
    std::memcpy(emb.data(), data, size);
    return emb;
}

} // namespace rollcall
