// ============= src/dedup/similarity_index.cpp =============
#include "rollcall/dedup/similarity_index.hpp"
#include "rollcall/hashing/hash_distance.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rollcall {

SimilarityIndex::SimilarityIndex(FingerprintStore& store, const Options& options)
    : store(store), options(options)
{
    if (this->options.batch_size <= 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
}

DuplicateMatch SimilarityIndex::find_duplicate(const std::optional<std::string>& content_hash,
                                               const std::optional<std::string>& perceptual_hash,
                                               MediaType type) {
    DuplicateMatch match;

    if (content_hash && !content_hash->empty()) {
        auto original = store.find_original_by_content_hash(*content_hash);
        if (original) {
            match.kind = MatchKind::Exact;
            match.original_id = original;
            return match;
        }
    }

    if (type == MediaType::Image && perceptual_hash && !perceptual_hash->empty()) {
        return scan_similar(*perceptual_hash);
    }

    return match;
}

DuplicateMatch SimilarityIndex::scan_similar(const std::string& perceptual_hash) {
    DuplicateMatch match;
    int64_t cursor = 0;

    while (true) {
        int remaining = options.max_candidates - match.scanned;
        if (remaining <= 0) {
            // Hay mas candidatos detras del tope?
            if (!store.image_hash_batch(cursor, 1).empty()) {
                match.cap_reached = true;
                spdlog::warn("Perceptual hash search truncated at {} candidates", match.scanned);
            }
            break;
        }

        auto batch = store.image_hash_batch(cursor, std::min(options.batch_size, remaining));
        if (batch.empty()) {
            break;
        }

        for (const auto& candidate : batch) {
            cursor = candidate.media_id;
            match.scanned++;

            auto d = hamming_distance(perceptual_hash, candidate.perceptual_hash);
            if (!d.ok()) {
                match.incomparable++;
                spdlog::debug("Media {} no comparable: {}", candidate.media_id, to_string(d.error));
                continue;
            }

            if (d.bits <= options.threshold) {
                match.kind = MatchKind::Similar;
                match.original_id = candidate.media_id;
                match.distance = d.bits;
                return match;
            }
        }
    }

    if (match.incomparable > 0) {
        spdlog::warn("{} candidatos con pHash no comparable fueron ignorados", match.incomparable);
    }
    return match;
}

} // namespace rollcall
