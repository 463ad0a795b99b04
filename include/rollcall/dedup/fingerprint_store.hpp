// ============= include/rollcall/dedup/fingerprint_store.hpp =============
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct HashCandidate {
    int64_t media_id;
    std::string perceptual_hash;
};

// Queryable pool of prior fingerprints. Only non-duplicate media are
// visible through this interface.
class FingerprintStore {
public:
    virtual ~FingerprintStore() = default;

    // Earliest non-duplicate media with this exact content hash.
    virtual std::optional<int64_t> find_original_by_content_hash(const std::string& content_hash) = 0;

    // Non-duplicate images with a perceptual hash and id > after_id,
    // ascending by id, at most limit rows.
    virtual std::vector<HashCandidate> image_hash_batch(int64_t after_id, int limit) = 0;
};

} // namespace rollcall
