#pragma once

#include "store/migration.hpp"
#include <expected>
#include <vector>

namespace dashstore::store {

// Immutable, version-ordered set of migration units
class Registry {
public:
    // Sorts by version; rejects duplicate or non-positive versions and units without `up`
    static std::expected<Registry, MigrationError> create(std::vector<Migration> units);

    const std::vector<Migration>& units() const { return units_; }
    const Migration* find(int version) const;

    // Highest registered version, 0 for an empty registry
    int latest_version() const;

    bool empty() const { return units_.empty(); }
    size_t size() const { return units_.size(); }

private:
    explicit Registry(std::vector<Migration> units) : units_(std::move(units)) {}

    std::vector<Migration> units_;
};

} // namespace dashstore::store
