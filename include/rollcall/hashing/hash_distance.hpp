// ============= include/rollcall/hashing/hash_distance.hpp =============
#pragma once
#include <optional>
#include <string>

namespace rollcall {

enum class CompareError {
    None,
    Empty,           // uno de los hashes esta vacio
    LengthMismatch,  // hashes de distinto tamaño
    InvalidHex       // caracter fuera de [0-9a-fA-F]
};

const char* to_string(CompareError error);

// Bit distance between two hex hashes, or the reason they cannot be compared.
// An error is never a distance: check ok() before reading bits.
struct HashDistance {
    int bits = 0;
    CompareError error = CompareError::None;

    bool ok() const { return error == CompareError::None; }

    static HashDistance of(int bits) { return {bits, CompareError::None}; }
    static HashDistance failure(CompareError e) { return {0, e}; }
};

// XOR + popcount nibble by nibble. Symmetric, case-insensitive.
HashDistance hamming_distance(const std::string& a, const std::string& b);

// True iff both hashes are present, comparable and within threshold bits.
bool is_perceptually_similar(const std::optional<std::string>& a,
                             const std::optional<std::string>& b,
                             int threshold);

} // namespace rollcall
