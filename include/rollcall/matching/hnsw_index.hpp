// ============= include/rollcall/matching/hnsw_index.hpp =============
/*
 * HNSW Embedding Index - In-Memory Approximate Search
 *
 * ALGORITMO: Hierarchical Navigable Small World
 * - Complexity: O(log n) search time
 * - Memory: O(n * d * M) donde M = max connections
 * - Distancia: euclidiana (misma metrica que el matcher lineal)
 *
 * CARACTERÍSTICAS:
 * - Thread-safe reads (RW lock)
 * - Incremental add/remove
 * - Capas aleatorias con semilla fija (reproducible)
 *
 * Es aproximado: puede no devolver el vecino exacto en grafos grandes.
 * La distancia devuelta siempre es la real del candidato encontrado.
 */

#pragma once
#include "rollcall/matching/embedding_index.hpp"
#include <random>
#include <shared_mutex>
#include <unordered_map>

namespace rollcall {

class HnswEmbeddingIndex : public EmbeddingIndex {
public:
    explicit HnswEmbeddingIndex(int dim = 512, int M = 16, int ef_construction = 200,
                                int ef_search = 64, uint32_t seed = 42);

    void rebuild(const std::vector<std::pair<int64_t, Embedding>>& entries) override;
    void add(int64_t officer_id, const Embedding& embedding) override;
    bool remove(int64_t officer_id) override;
    size_t size() const override;

    std::optional<NearestOfficer> find_nearest(const Embedding& query) const override;

    // k vecinos mas cercanos, ordenados por distancia
    std::vector<NearestOfficer> search(const Embedding& query, int k) const;


private:
    static constexpr int MAX_LAYERS = 10;

    struct Node {
        Embedding vector;
        int layer = 0;
        std::vector<std::vector<int64_t>> neighbors;   // por capa
    };

    int dim;
    int M;                 // Max connections per layer
    int M0;                // Max connections at layer 0
    int ef_construction;
    int ef_search;
    int max_layer;
    double level_mult;

    std::unordered_map<int64_t, Node> nodes;
    std::optional<int64_t> entry_point;

    mutable std::shared_mutex mutex;
    std::mt19937 gen;

    float distance(const Embedding& a, const Embedding& b) const;
    int random_layer();

    void insert_locked(int64_t id, const Embedding& vector);
    bool remove_locked(int64_t id);
    std::vector<NearestOfficer> search_locked(const Embedding& query, int k) const;

    std::vector<int64_t> search_layer(const Embedding& query, int64_t entry_id,
                                      int layer, int ef) const;
    std::vector<int64_t> select_neighbors(const Embedding& base,
                                          const std::vector<int64_t>& candidates,
                                          int max_count) const;
};

} // namespace rollcall
