// ============= include/rollcall/matching/face_matcher.hpp =============
/*
 * Face Embedding Matcher
 *
 * match(embedding) -> (officer_id | nueva identidad, distancia)
 *
 * - distancia euclidiana minima contra los oficiales activos
 * - match si distancia <= threshold (0.8 para 512D por defecto)
 * - sin embedding o matching deshabilitado -> Unavailable (nunca match)
 * - embeddings guardados malformados se saltan al cargar
 */

#pragma once
#include "rollcall/core/config.hpp"
#include "rollcall/matching/embedding_index.hpp"
#include <limits>
#include <memory>
#include <optional>

namespace rollcall {

enum class MatchStatus { Matched, NewIdentity, Unavailable, InvalidEmbedding };

const char* to_string(MatchStatus status);

struct MatchResult {
    MatchStatus status = MatchStatus::Unavailable;
    std::optional<int64_t> officer_id;     // solo si Matched
    std::optional<int64_t> nearest_id;     // vecino mas cercano aunque no haga match
    float distance = std::numeric_limits<float>::infinity();

    bool matched() const { return status == MatchStatus::Matched; }
};

class FaceEmbeddingMatcher {
public:
    struct Options {
        bool enabled = true;
        float threshold = 0.8f;
        int dim = 512;

        static Options from_config(const RegistryConfig& config);
    };

    FaceEmbeddingMatcher(std::unique_ptr<EmbeddingIndex> index, const Options& options);

    static std::unique_ptr<EmbeddingIndex> make_index(IndexKind kind, int dim);

    // Reemplaza el pool de candidatos. Devuelve cuantos quedaron indexados.
    size_t load(const std::vector<std::pair<int64_t, Embedding>>& candidates);

    MatchResult match(const std::optional<Embedding>& embedding) const;

    // Linear scan against an explicit candidate list, no index involved.
    MatchResult match_against(const Embedding& embedding,
                              const std::vector<std::pair<int64_t, Embedding>>& candidates) const;

    bool add(int64_t officer_id, const Embedding& embedding);
    bool remove(int64_t officer_id);

    bool is_enabled() const { return options.enabled; }
    float get_threshold() const { return options.threshold; }
    size_t size() const { return index->size(); }

private:
    std::unique_ptr<EmbeddingIndex> index;
    Options options;

    MatchResult decide(const std::optional<NearestOfficer>& nearest) const;
};

} // namespace rollcall
