// ============= src/matching/embedding_index.cpp =============
#include "rollcall/matching/embedding_index.hpp"
#include <algorithm>

namespace rollcall {

void LinearEmbeddingIndex::rebuild(const std::vector<std::pair<int64_t, Embedding>>& new_entries) {
    entries = new_entries;
}

void LinearEmbeddingIndex::add(int64_t officer_id, const Embedding& embedding) {
    for (auto& entry : entries) {
        if (entry.first == officer_id) {
            // Reemplazo: el embedding del oficial no se promedia
            entry.second = embedding;
            return;
        }
    }
    entries.emplace_back(officer_id, embedding);
}

bool LinearEmbeddingIndex::remove(int64_t officer_id) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [officer_id](const auto& e) { return e.first == officer_id; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}

std::optional<NearestOfficer> LinearEmbeddingIndex::find_nearest(const Embedding& query) const {
    std::optional<NearestOfficer> best;

    for (const auto& [id, emb] : entries) {
        if (emb.size() != query.size()) continue;

        float d = euclidean_distance(query, emb);
        if (!best || d < best->distance) {
            best = NearestOfficer{id, d};
        }
    }
    return best;
}

} // namespace rollcall
