// ============= src/matching/hnsw_index.cpp =============
#include "rollcall/matching/hnsw_index.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <queue>
#include <unordered_set>

namespace rollcall {

HnswEmbeddingIndex::HnswEmbeddingIndex(int dim, int M, int ef_construction, int ef_search, uint32_t seed)
    : dim(dim), M(std::max(2, M)), M0(std::max(2, M) * 2), ef_construction(std::max(1, ef_construction)),
      ef_search(std::max(1, ef_search)), max_layer(0),
      level_mult(1.0 / std::log(static_cast<double>(std::max(2, M)))), gen(seed)
{
    spdlog::info("Inicializando HNSW Embedding Index");
    spdlog::info("   Dimensión: {}", dim);
    spdlog::info("   M: {}, ef_construction: {}, ef_search: {}", this->M, this->ef_construction, this->ef_search);
}

// ==================== HELPERS ====================

float HnswEmbeddingIndex::distance(const Embedding& a, const Embedding& b) const {
    return euclidean_distance(a, b);
}

int HnswEmbeddingIndex::random_layer() {
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    double r = 1.0 - dis(gen);   // (0, 1]
    int layer = static_cast<int>(-std::log(r) * level_mult);
    return std::min(layer, MAX_LAYERS - 1);
}

// ==================== REBUILD / ADD ====================

void HnswEmbeddingIndex::rebuild(const std::vector<std::pair<int64_t, Embedding>>& entries) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    nodes.clear();
    entry_point.reset();
    max_layer = 0;

    for (const auto& [id, vec] : entries) {
        if (vec.size() != static_cast<size_t>(dim)) {
            spdlog::warn("HNSW: embedding de oficial {} con dimension {} ignorado", id, vec.size());
            continue;
        }
        insert_locked(id, vec);
    }
}

void HnswEmbeddingIndex::add(int64_t officer_id, const Embedding& embedding) {
    if (embedding.size() != static_cast<size_t>(dim)) {
        spdlog::warn("HNSW: dimension {} != {}, oficial {} no indexado", embedding.size(), dim, officer_id);
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    if (nodes.count(officer_id)) {
        // Reemplazo del embedding: sacar y volver a insertar
        remove_locked(officer_id);
    }
    insert_locked(officer_id, embedding);
}

void HnswEmbeddingIndex::insert_locked(int64_t id, const Embedding& vector) {
    Node node;
    node.vector = vector;
    node.layer = random_layer();
    node.neighbors.resize(node.layer + 1);

    // First insertion
    if (!entry_point) {
        nodes[id] = std::move(node);
        entry_point = id;
        max_layer = nodes[id].layer;
        return;
    }

    int node_layer = node.layer;
    nodes[id] = std::move(node);

    // Descenso greedy por las capas superiores
    int64_t current = *entry_point;
    for (int lc = max_layer; lc > node_layer; --lc) {
        auto candidates = search_layer(vector, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0];
        }
    }

    // Conectar en capas [0, node_layer]
    for (int lc = std::min(node_layer, max_layer); lc >= 0; --lc) {
        auto candidates = search_layer(vector, current, lc, ef_construction);
        candidates.erase(std::remove(candidates.begin(), candidates.end(), id), candidates.end());

        int M_cur = (lc == 0) ? M0 : M;
        auto neighbors = select_neighbors(vector, candidates, M_cur);
        nodes[id].neighbors[lc] = neighbors;

        // Bidirectional connections
        for (int64_t neighbor_id : neighbors) {
            auto& nb = nodes.at(neighbor_id).neighbors[lc];
            nb.push_back(id);
            if (static_cast<int>(nb.size()) > M_cur) {
                // Prune connections
                nb = select_neighbors(nodes.at(neighbor_id).vector, nb, M_cur);
            }
        }

        if (!candidates.empty()) {
            current = candidates[0];
        }
    }

    if (node_layer > max_layer) {
        max_layer = node_layer;
        entry_point = id;
    }
}

// ==================== REMOVE ====================

bool HnswEmbeddingIndex::remove(int64_t officer_id) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    return remove_locked(officer_id);
}

bool HnswEmbeddingIndex::remove_locked(int64_t id) {
    auto it = nodes.find(id);
    if (it == nodes.end()) {
        return false;
    }

    int layer = it->second.layer;
    nodes.erase(it);

    // Los enlaces pueden ser unidireccionales tras el pruning: barrer todo
    for (auto& [nid, node] : nodes) {
        for (int lc = 0; lc <= std::min(layer, node.layer); ++lc) {
            auto& nb = node.neighbors[lc];
            nb.erase(std::remove(nb.begin(), nb.end(), id), nb.end());
        }
    }

    if (entry_point && *entry_point == id) {
        entry_point.reset();
        max_layer = 0;
        for (const auto& [nid, node] : nodes) {
            if (!entry_point || node.layer > max_layer) {
                max_layer = node.layer;
                entry_point = nid;
            }
        }
    }
    return true;
}

// ==================== SEARCH ====================

std::optional<NearestOfficer> HnswEmbeddingIndex::find_nearest(const Embedding& query) const {
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto results = search_locked(query, 1);
    if (results.empty()) {
        return std::nullopt;
    }
    return results.front();
}

std::vector<NearestOfficer> HnswEmbeddingIndex::search(const Embedding& query, int k) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return search_locked(query, k);
}

std::vector<NearestOfficer> HnswEmbeddingIndex::search_locked(const Embedding& query, int k) const {
    if (!entry_point || query.size() != static_cast<size_t>(dim) || k <= 0) {
        return {};
    }

    int64_t current = *entry_point;
    for (int lc = max_layer; lc > 0; --lc) {
        auto candidates = search_layer(query, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0];
        }
    }

    auto candidates = search_layer(query, current, 0, std::max(ef_search, k));

    std::vector<NearestOfficer> results;
    for (int64_t id : candidates) {
        results.push_back({id, distance(query, nodes.at(id).vector)});
        if (static_cast<int>(results.size()) >= k) break;
    }
    return results;
}

std::vector<int64_t> HnswEmbeddingIndex::search_layer(const Embedding& query, int64_t entry_id,
                                                      int layer, int ef) const {
    std::unordered_set<int64_t> visited;

    using Candidate = std::pair<float, int64_t>;  // (distance, id)
    auto cmp = [](const Candidate& a, const Candidate& b) { return a.first > b.first; };

    std::priority_queue<Candidate, std::vector<Candidate>, decltype(cmp)> candidates(cmp);
    std::priority_queue<Candidate> w;  // Max heap

    float d = distance(query, nodes.at(entry_id).vector);
    candidates.push({d, entry_id});
    w.push({d, entry_id});
    visited.insert(entry_id);

    while (!candidates.empty()) {
        auto [current_dist, current_id] = candidates.top();
        candidates.pop();

        if (current_dist > w.top().first) {
            break;
        }

        const auto& node = nodes.at(current_id);
        if (layer > node.layer) continue;

        for (int64_t neighbor_id : node.neighbors[layer]) {
            if (!visited.insert(neighbor_id).second) continue;

            float d_neighbor = distance(query, nodes.at(neighbor_id).vector);
            if (static_cast<int>(w.size()) < ef || d_neighbor < w.top().first) {
                candidates.push({d_neighbor, neighbor_id});
                w.push({d_neighbor, neighbor_id});
                if (static_cast<int>(w.size()) > ef) {
                    w.pop();
                }
            }
        }
    }

    std::vector<int64_t> results;
    while (!w.empty()) {
        results.push_back(w.top().second);
        w.pop();
    }
    std::reverse(results.begin(), results.end());
    return results;
}

std::vector<int64_t> HnswEmbeddingIndex::select_neighbors(const Embedding& base,
                                                          const std::vector<int64_t>& candidates,
                                                          int max_count) const {
    if (static_cast<int>(candidates.size()) <= max_count) {
        return candidates;
    }

    // Simple heuristic: keep M closest
    std::vector<std::pair<float, int64_t>> scored;
    for (int64_t id : candidates) {
        scored.push_back({distance(base, nodes.at(id).vector), id});
    }
    std::sort(scored.begin(), scored.end());

    std::vector<int64_t> selected;
    for (int i = 0; i < max_count; ++i) {
        selected.push_back(scored[i].second);
    }
    return selected;
}

// ==================== STATS ====================

size_t HnswEmbeddingIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return nodes.size();
}

} // namespace rollcall
