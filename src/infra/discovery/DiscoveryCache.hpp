#pragma once

#include "core/types/DiscoveryTypes.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace camlink::infra {

/**
 * @brief Result of a cache lookup.
 */
enum class CacheLookup {
    FreshHit,  ///< Camera confirmed within the TTL, reuse the classification
    FreshMiss, ///< Rejected within the TTL, skip the endpoint
    Stale      ///< Absent or expired, classify again
};

std::string cacheLookupToString(CacheLookup lookup);

enum class CacheStatus : int {
    Hit = 0,
    Miss = 1
};

/**
 * @brief Recorded outcome of probing one (host, port).
 */
struct CacheEntry {
    std::string host;
    uint16_t port{0};
    CacheStatus status{CacheStatus::Miss};
    core::ProtocolKind kind{core::ProtocolKind::Rejected}; ///< Classification of a hit
    std::string reason;                                     ///< Rejection reason of a miss
    std::chrono::system_clock::time_point recordedAt;

    bool operator==(const CacheEntry& other) const = default;
};

/**
 * @brief Time-bounded memory of discovery outcomes keyed by (host, port).
 *
 * Entries expire ttl after insertion. All operations are thread-safe.
 */
class DiscoveryCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::hours DEFAULT_TTL{24};

    /**
     * @brief Constructs a DiscoveryCache.
     * @param ttl Lifetime of an entry.
     * @param clock Time source (system clock when empty).
     */
    explicit DiscoveryCache(std::chrono::seconds ttl = DEFAULT_TTL, Clock clock = {});

    /**
     * @brief Classifies the cached state of an endpoint.
     * @return FreshHit, FreshMiss, or Stale when absent or expired.
     */
    [[nodiscard]] CacheLookup lookup(const std::string& host, uint16_t port) const;

    /**
     * @brief Returns the entry of an endpoint if it is still fresh.
     */
    [[nodiscard]] std::optional<CacheEntry> freshEntry(const std::string& host,
                                                       uint16_t port) const;

    void recordHit(const std::string& host, uint16_t port, core::ProtocolKind kind);
    void recordMiss(const std::string& host, uint16_t port, const std::string& reason);

    /**
     * @brief Hosts with at least one fresh hit.
     */
    [[nodiscard]] std::set<std::string> confirmedHosts() const;

    /**
     * @brief Removes expired entries.
     * @return Number of entries removed.
     */
    size_t purgeExpired();

    /**
     * @brief Snapshot of all entries (fresh or not) for persistence.
     */
    [[nodiscard]] std::vector<CacheEntry> entries() const;

    /**
     * @brief Loads persisted entries, keeping their original timestamps.
     *
     * Already expired entries are dropped.
     */
    void restore(const std::vector<CacheEntry>& entries);

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

private:
    using Key = std::pair<std::string, uint16_t>;

    [[nodiscard]] bool isFresh(const CacheEntry& entry,
                               std::chrono::system_clock::time_point now) const;

    std::chrono::seconds ttl_;
    Clock clock_;
    std::map<Key, CacheEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace camlink::infra
