// ============= include/rollcall/matching/embedding_index.hpp =============
/*
 * Embedding Index - busqueda del oficial mas cercano
 *
 * Interfaz: find_nearest(embedding) -> (officer_id, distancia euclidiana)
 *
 * IMPLEMENTACIONES:
 * - LinearEmbeddingIndex: O(n), referencia de correctitud.
 *   Empates: gana el primero insertado.
 * - HnswEmbeddingIndex:   grafo HNSW (ver hnsw_index.hpp)
 *
 * La decision de match (distancia <= umbral) la toma el matcher, nunca
 * el indice.
 */

#pragma once
#include "rollcall/matching/embedding.hpp"
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace rollcall {

struct NearestOfficer {
    int64_t officer_id;
    float distance;   // euclidiana
};

class EmbeddingIndex {
public:
    virtual ~EmbeddingIndex() = default;

    virtual void rebuild(const std::vector<std::pair<int64_t, Embedding>>& entries) = 0;
    virtual void add(int64_t officer_id, const Embedding& embedding) = 0;
    virtual bool remove(int64_t officer_id) = 0;
    virtual size_t size() const = 0;

    virtual std::optional<NearestOfficer> find_nearest(const Embedding& query) const = 0;
};

class LinearEmbeddingIndex : public EmbeddingIndex {
public:
    void rebuild(const std::vector<std::pair<int64_t, Embedding>>& entries) override;
    void add(int64_t officer_id, const Embedding& embedding) override;
    bool remove(int64_t officer_id) override;
    size_t size() const override { return entries.size(); }

    std::optional<NearestOfficer> find_nearest(const Embedding& query) const override;

private:
    // Orden de insercion = orden de desempate
    std::vector<std::pair<int64_t, Embedding>> entries;
};

} // namespace rollcall
