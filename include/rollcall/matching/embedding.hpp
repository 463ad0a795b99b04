// ============= include/rollcall/matching/embedding.hpp =============
#pragma once
#include <cstdint>
#include <vector>

namespace rollcall {

using Embedding = std::vector<float>;

float euclidean_distance(const Embedding& a, const Embedding& b);

// Cosine similarity clamped to [-1, 1]; 0 when either vector is all-zero.
float cosine_similarity(const Embedding& a, const Embedding& b);

void l2_normalize(Embedding& embedding);

// Non-empty, expected dimension, every component finite.
bool is_valid_embedding(const Embedding& embedding, int expected_dim);

// BLOB <-> floats (memcpy). A blob whose size is not a multiple of
// sizeof(float) deserializes to an empty vector.
std::vector<unsigned char> serialize_embedding(const Embedding& emb);
Embedding deserialize_embedding(const void* data, int size);

} // namespace rollcall
