// ============= src/matching/face_matcher.cpp =============
#include "rollcall/matching/face_matcher.hpp"
#include "rollcall/matching/hnsw_index.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

const char* to_string(MatchStatus status) {
    switch (status) {
        case MatchStatus::Matched:          return "matched";
        case MatchStatus::NewIdentity:      return "new_identity";
        case MatchStatus::Unavailable:      return "unavailable";
        case MatchStatus::InvalidEmbedding: return "invalid_embedding";
    }
    return "unknown";
}

FaceEmbeddingMatcher::FaceEmbeddingMatcher(std::unique_ptr<EmbeddingIndex> index, const Options& options)
    : index(std::move(index)), options(options)
{
    if (!this->index) {
        throw std::invalid_argument("FaceEmbeddingMatcher requires an index");
    }
    spdlog::info("Face matcher: {} (threshold={:.2f}, dim={})",
                 options.enabled ? "enabled" : "DISABLED", options.threshold, options.dim);
}

std::unique_ptr<EmbeddingIndex> FaceEmbeddingMatcher::make_index(IndexKind kind, int dim) {
    if (kind == IndexKind::Hnsw) {
        return std::make_unique<HnswEmbeddingIndex>(dim);
    }
    return std::make_unique<LinearEmbeddingIndex>();
}

size_t FaceEmbeddingMatcher::load(const std::vector<std::pair<int64_t, Embedding>>& candidates) {
    std::vector<std::pair<int64_t, Embedding>> valid;
    valid.reserve(candidates.size());

    for (const auto& [id, emb] : candidates) {
        if (!is_valid_embedding(emb, options.dim)) {
            spdlog::warn("Oficial {}: embedding guardado invalido ({} valores), se ignora", id, emb.size());
            continue;
        }
        valid.emplace_back(id, emb);
    }

    index->rebuild(valid);
    spdlog::debug("Matcher: {} embeddings cargados ({} ignorados)",
                  valid.size(), candidates.size() - valid.size());
    return valid.size();
}

MatchResult FaceEmbeddingMatcher::decide(const std::optional<NearestOfficer>& nearest) const {
    MatchResult result;
    result.status = MatchStatus::NewIdentity;

    if (!nearest) {
        return result;
    }

    result.nearest_id = nearest->officer_id;
    result.distance = nearest->distance;
    if (nearest->distance <= options.threshold) {
        result.status = MatchStatus::Matched;
        result.officer_id = nearest->officer_id;
    }
    return result;
}

MatchResult FaceEmbeddingMatcher::match(const std::optional<Embedding>& embedding) const {
    MatchResult result;

    if (!options.enabled || !embedding) {
        result.status = MatchStatus::Unavailable;
        return result;
    }
    if (!is_valid_embedding(*embedding, options.dim)) {
        spdlog::warn("Embedding invalido ({} valores, esperado {})", embedding->size(), options.dim);
        result.status = MatchStatus::InvalidEmbedding;
        return result;
    }

    return decide(index->find_nearest(*embedding));
}

MatchResult FaceEmbeddingMatcher::match_against(const Embedding& embedding,
                                                const std::vector<std::pair<int64_t, Embedding>>& candidates) const {
    MatchResult result;

    if (!options.enabled) {
        result.status = MatchStatus::Unavailable;
        return result;
    }
    if (!is_valid_embedding(embedding, options.dim)) {
        result.status = MatchStatus::InvalidEmbedding;
        return result;
    }

    std::optional<NearestOfficer> best;
    for (const auto& [id, emb] : candidates) {
        if (!is_valid_embedding(emb, options.dim)) continue;

        float d = euclidean_distance(embedding, emb);
        if (!best || d < best->distance) {
            best = NearestOfficer{id, d};
        }
    }
    return decide(best);
}

bool FaceEmbeddingMatcher::add(int64_t officer_id, const Embedding& embedding) {
    if (!options.enabled || !is_valid_embedding(embedding, options.dim)) {
        return false;
    }
    index->add(officer_id, embedding);
    return true;
}

bool FaceEmbeddingMatcher::remove(int64_t officer_id) {
    return index->remove(officer_id);
}

} // namespace rollcall
