#include "store/registry.hpp"
#include <algorithm>

namespace dashstore::store {

std::expected<Registry, MigrationError> Registry::create(std::vector<Migration> units) {
    std::sort(units.begin(), units.end(),
              [](const Migration& a, const Migration& b) { return a.version < b.version; });

    for (size_t i = 0; i < units.size(); ++i) {
        const auto& unit = units[i];
        if (unit.version <= 0) {
            return std::unexpected(MigrationError{MigrationErrorKind::Structural, unit.version,
                "migration '" + unit.name + "' has a non-positive version"});
        }
        if (!unit.up) {
            return std::unexpected(MigrationError{MigrationErrorKind::Structural, unit.version,
                "migration '" + unit.name + "' has no up step"});
        }
        if (i > 0 && units[i - 1].version == unit.version) {
            return std::unexpected(MigrationError{MigrationErrorKind::Structural, unit.version,
                "duplicate version shared by '" + units[i - 1].name + "' and '" + unit.name + "'"});
        }
    }

    return Registry(std::move(units));
}

const Migration* Registry::find(int version) const {
    auto it = std::lower_bound(units_.begin(), units_.end(), version,
                               [](const Migration& m, int v) { return m.version < v; });
    if (it != units_.end() && it->version == version) {
        return &*it;
    }
    return nullptr;
}

int Registry::latest_version() const {
    return units_.empty() ? 0 : units_.back().version;
}

} // namespace dashstore::store
