// ============= include/rollcall/dedup/similarity_index.hpp =============
/*
 * Similarity Index - compuerta de duplicados
 *
 * 1. exacto: mismo content_hash entre media no-duplicada -> fin
 * 2. similar (solo imagenes): pHash contra candidatos en lotes,
 *    primer candidato con distancia <= threshold
 *
 * Tope duro de candidatos: al alcanzarlo se deja de escanear y se
 * reporta "sin match" (best-effort, se loguea).
 */

#pragma once
#include "rollcall/core/config.hpp"
#include "rollcall/dedup/fingerprint_store.hpp"
#include "rollcall/hashing/content_hasher.hpp"
#include <optional>
#include <string>

namespace rollcall {

enum class MatchKind { None, Exact, Similar };

struct DuplicateMatch {
    MatchKind kind = MatchKind::None;
    std::optional<int64_t> original_id;
    int distance = 0;             // solo para Similar
    int scanned = 0;              // candidatos comparados
    int incomparable = 0;         // candidatos con hash no comparable
    bool cap_reached = false;

    bool found() const { return kind != MatchKind::None; }
};

class SimilarityIndex {
public:
    struct Options {
        int threshold = 10;
        int batch_size = 1000;
        int max_candidates = 100000;

        static Options from_config(const RegistryConfig& config);
    };

    SimilarityIndex(FingerprintStore& store, const Options& options);

    DuplicateMatch find_duplicate(const std::optional<std::string>& content_hash,
                                  const std::optional<std::string>& perceptual_hash,
                                  MediaType type);

    const Options& get_options() const { return options; }

private:
    FingerprintStore& store;
    Options options;

    DuplicateMatch scan_similar(const std::string& perceptual_hash);
};

} // namespace rollcall
