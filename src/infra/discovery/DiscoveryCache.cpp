#include "infra/discovery/DiscoveryCache.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

std::string cacheLookupToString(CacheLookup lookup) {
    switch (lookup) {
    case CacheLookup::FreshHit:
        return "fresh-hit";
    case CacheLookup::FreshMiss:
        return "fresh-miss";
    case CacheLookup::Stale:
        return "stale";
    }
    return "stale";
}

DiscoveryCache::DiscoveryCache(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(clock ? std::move(clock) : Clock([] {
          return std::chrono::system_clock::now();
      })) {}

bool DiscoveryCache::isFresh(const CacheEntry& entry,
                             std::chrono::system_clock::time_point now) const {
    return now - entry.recordedAt < ttl_;
}

CacheLookup DiscoveryCache::lookup(const std::string& host, uint16_t port) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find({host, port});
    if (it == entries_.end() || !isFresh(it->second, clock_())) {
        return CacheLookup::Stale;
    }
    return it->second.status == CacheStatus::Hit ? CacheLookup::FreshHit
                                                 : CacheLookup::FreshMiss;
}

std::optional<CacheEntry> DiscoveryCache::freshEntry(const std::string& host,
                                                     uint16_t port) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find({host, port});
    if (it == entries_.end() || !isFresh(it->second, clock_())) {
        return std::nullopt;
    }
    return it->second;
}

void DiscoveryCache::recordHit(const std::string& host, uint16_t port, core::ProtocolKind kind) {
    CacheEntry entry;
    entry.host = host;
    entry.port = port;
    entry.status = CacheStatus::Hit;
    entry.kind = kind;

    std::lock_guard lock(mutex_);
    entry.recordedAt = clock_();
    entries_[{host, port}] = std::move(entry);
}

void DiscoveryCache::recordMiss(const std::string& host, uint16_t port,
                                const std::string& reason) {
    CacheEntry entry;
    entry.host = host;
    entry.port = port;
    entry.status = CacheStatus::Miss;
    entry.reason = reason;

    std::lock_guard lock(mutex_);
    entry.recordedAt = clock_();
    entries_[{host, port}] = std::move(entry);
}

std::set<std::string> DiscoveryCache::confirmedHosts() const {
    std::lock_guard lock(mutex_);
    auto now = clock_();
    std::set<std::string> hosts;
    for (const auto& [key, entry] : entries_) {
        if (entry.status == CacheStatus::Hit && isFresh(entry, now)) {
            hosts.insert(key.first);
        }
    }
    return hosts;
}

size_t DiscoveryCache::purgeExpired() {
    std::lock_guard lock(mutex_);
    auto now = clock_();
    size_t removed = std::erase_if(entries_, [&](const auto& item) {
        return !isFresh(item.second, now);
    });
    if (removed > 0) {
        spdlog::debug("Purged {} expired discovery cache entries", removed);
    }
    return removed;
}

std::vector<CacheEntry> DiscoveryCache::entries() const {
    std::lock_guard lock(mutex_);
    std::vector<CacheEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

void DiscoveryCache::restore(const std::vector<CacheEntry>& entries) {
    std::lock_guard lock(mutex_);
    auto now = clock_();
    size_t restored = 0;
    for (const auto& entry : entries) {
        if (!isFresh(entry, now)) {
            continue;
        }
        entries_[{entry.host, entry.port}] = entry;
        ++restored;
    }
    spdlog::info("Restored {} of {} discovery cache entries", restored, entries.size());
}

void DiscoveryCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

size_t DiscoveryCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace camlink::infra
