// factor_cache.hpp
// Factor Cache Interface: memoizes built panels by (scope, date, filter-set, factor-set)

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../core/date.hpp"
#include "../factors/factor_panel.hpp"

namespace equitybt {

// ============================================================================
// Cache Key
// ============================================================================

struct FactorCacheKey {
    std::string scope;                 // identifies the data behind the panel
    Date date;
    std::string filter;                // canonical universe filter
    std::vector<std::string> factors;  // ascending, unique

    std::string toString() const {
        std::string out = scope + "|" + date.toString() + "|" + filter + "|";
        for (size_t i = 0; i < factors.size(); ++i) {
            if (i) out += ',';
            out += factors[i];
        }
        return out;
    }
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t puts = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    size_t entries = 0;
};

// ============================================================================
// Factor Cache Interface
// ============================================================================

// Entries are immutable once stored. Implementations may throw CacheException;
// callers treat any failure as a miss.
class IFactorCache {
public:
    virtual ~IFactorCache() = default;

    // nullptr on miss
    virtual std::shared_ptr<const FactorPanel> get(const FactorCacheKey& key) = 0;
    virtual void put(const FactorCacheKey& key, std::shared_ptr<const FactorPanel> panel) = 0;
    virtual void clear() = 0;
    virtual CacheStats getStats() const = 0;
};

} // namespace equitybt
