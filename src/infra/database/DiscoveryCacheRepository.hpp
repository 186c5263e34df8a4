#pragma once

#include "core/types/DiscoveryTypes.hpp"
#include "infra/database/Database.hpp"
#include "infra/discovery/DiscoveryCache.hpp"

#include <memory>
#include <vector>

namespace camlink::infra {

/**
 * @brief Persists discovery cache entries and session history.
 *
 * Lets a new process start with a warm DiscoveryCache.
 */
class DiscoveryCacheRepository {
public:
    /**
     * @brief Constructs a DiscoveryCacheRepository.
     * @param db Database with migrations applied.
     */
    explicit DiscoveryCacheRepository(std::shared_ptr<Database> db);

    /**
     * @brief Loads every stored cache entry.
     */
    std::vector<CacheEntry> loadAll();

    /**
     * @brief Replaces the stored cache with the given entries.
     */
    void saveAll(const std::vector<CacheEntry>& entries);

    /**
     * @brief Deletes entries recorded before the cutoff.
     * @return Number of deleted rows.
     */
    int removeOlderThan(std::chrono::system_clock::time_point cutoff);

    /**
     * @brief Inserts or updates a discovery session record.
     */
    void recordSession(const core::DiscoverySession& session);

    /**
     * @brief Returns the most recent sessions, newest first.
     */
    std::vector<core::DiscoverySession> recentSessions(int limit = 10);

private:
    std::shared_ptr<Database> db_;
};

} // namespace camlink::infra
