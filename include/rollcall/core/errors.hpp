// ============= include/rollcall/core/errors.hpp =============
#pragma once
#include <stdexcept>
#include <string>

namespace rollcall {

// Resource could not be established (database, schema, model file).
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& what) : std::runtime_error(what) {}
};

// Programming error: the caller asked for something the data model forbids
// (self-merge, appearance without an officer, double unmerge).
class ConsistencyError : public std::logic_error {
public:
    explicit ConsistencyError(const std::string& what) : std::logic_error(what) {}
};

} // namespace rollcall
