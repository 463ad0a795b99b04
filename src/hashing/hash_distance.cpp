// ============= src/hashing/hash_distance.cpp =============
#include "rollcall/hashing/hash_distance.hpp"
#include <bitset>

namespace rollcall {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const char* to_string(CompareError error) {
    switch (error) {
        case CompareError::None:           return "none";
        case CompareError::Empty:          return "empty";
        case CompareError::LengthMismatch: return "length_mismatch";
        case CompareError::InvalidHex:     return "invalid_hex";
    }
    return "unknown";
}

HashDistance hamming_distance(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return HashDistance::failure(CompareError::Empty);
    }
    if (a.size() != b.size()) {
        return HashDistance::failure(CompareError::LengthMismatch);
    }

    int bits = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        int va = hex_value(a[i]);
        int vb = hex_value(b[i]);
        if (va < 0 || vb < 0) {
            return HashDistance::failure(CompareError::InvalidHex);
        }
        bits += static_cast<int>(std::bitset<4>(va ^ vb).count());
    }
    return HashDistance::of(bits);
}

bool is_perceptually_similar(const std::optional<std::string>& a,
                             const std::optional<std::string>& b,
                             int threshold) {
    if (!a || !b) return false;

    auto d = hamming_distance(*a, *b);
    return d.ok() && d.bits <= threshold;
}

} // namespace rollcall
