#include "infra/database/DiscoveryCacheRepository.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

namespace {

int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

core::DiscoveryStatus statusFromString(const std::string& str) {
    if (str == "Completed") {
        return core::DiscoveryStatus::Completed;
    }
    if (str == "Cancelled") {
        return core::DiscoveryStatus::Cancelled;
    }
    return core::DiscoveryStatus::Running;
}

core::DiscoveryPhase phaseFromString(const std::string& str) {
    for (auto phase : {core::DiscoveryPhase::Multicast, core::DiscoveryPhase::PriorityScan,
                       core::DiscoveryPhase::FullScan, core::DiscoveryPhase::Completed,
                       core::DiscoveryPhase::Cancelled}) {
        if (core::discoveryPhaseToString(phase) == str) {
            return phase;
        }
    }
    return core::DiscoveryPhase::Idle;
}

} // namespace

DiscoveryCacheRepository::DiscoveryCacheRepository(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

std::vector<CacheEntry> DiscoveryCacheRepository::loadAll() {
    std::vector<CacheEntry> entries;
    auto stmt =
        db_->prepare("SELECT host, port, status, kind, reason, recorded_at FROM discovery_cache");

    while (stmt.step()) {
        CacheEntry entry;
        entry.host = stmt.columnText(0);
        entry.port = static_cast<uint16_t>(stmt.columnInt(1));
        entry.status = static_cast<CacheStatus>(stmt.columnInt(2));
        if (!stmt.columnIsNull(3)) {
            entry.kind = core::protocolKindFromString(stmt.columnText(3));
        }
        entry.reason = stmt.columnText(4);
        entry.recordedAt = fromEpochSeconds(stmt.columnInt64(5));
        entries.push_back(std::move(entry));
    }

    spdlog::debug("Loaded {} discovery cache entries", entries.size());
    return entries;
}

void DiscoveryCacheRepository::saveAll(const std::vector<CacheEntry>& entries) {
    db_->transaction([&] {
        db_->execute("DELETE FROM discovery_cache");

        auto stmt = db_->prepare(R"(
            INSERT INTO discovery_cache (host, port, status, kind, reason, recorded_at)
            VALUES (?, ?, ?, ?, ?, ?)
        )");

        for (const auto& entry : entries) {
            stmt.reset();
            stmt.bind(1, entry.host);
            stmt.bind(2, static_cast<int>(entry.port));
            stmt.bind(3, static_cast<int>(entry.status));
            if (entry.status == CacheStatus::Hit) {
                stmt.bind(4, core::protocolKindToString(entry.kind));
                stmt.bindNull(5);
            } else {
                stmt.bindNull(4);
                stmt.bind(5, entry.reason);
            }
            stmt.bind(6, toEpochSeconds(entry.recordedAt));
            stmt.step();
        }
    });

    spdlog::debug("Saved {} discovery cache entries", entries.size());
}

int DiscoveryCacheRepository::removeOlderThan(std::chrono::system_clock::time_point cutoff) {
    auto stmt = db_->prepare("DELETE FROM discovery_cache WHERE recorded_at < ?");
    stmt.bind(1, toEpochSeconds(cutoff));
    stmt.step();
    return db_->changes();
}

void DiscoveryCacheRepository::recordSession(const core::DiscoverySession& session) {
    auto stmt = db_->prepare(R"(
        INSERT OR REPLACE INTO discovery_sessions
            (id, subnet, started_at, ended_at, status, phase, devices_found, checks_issued)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, session.id);
    stmt.bind(2, session.subnet);
    stmt.bind(3, toEpochSeconds(session.startTime));
    if (session.endTime) {
        stmt.bind(4, toEpochSeconds(*session.endTime));
    } else {
        stmt.bindNull(4);
    }
    stmt.bind(5, core::discoveryStatusToString(session.status));
    stmt.bind(6, core::discoveryPhaseToString(session.phase));
    stmt.bind(7, session.devicesFound);
    stmt.bind(8, session.checksIssued);
    stmt.step();
}

std::vector<core::DiscoverySession> DiscoveryCacheRepository::recentSessions(int limit) {
    std::vector<core::DiscoverySession> sessions;
    auto stmt = db_->prepare(R"(
        SELECT id, subnet, started_at, ended_at, status, phase, devices_found, checks_issued
        FROM discovery_sessions ORDER BY started_at DESC LIMIT ?
    )");
    stmt.bind(1, limit);

    while (stmt.step()) {
        core::DiscoverySession session;
        session.id = stmt.columnText(0);
        session.subnet = stmt.columnText(1);
        session.startTime = fromEpochSeconds(stmt.columnInt64(2));
        if (!stmt.columnIsNull(3)) {
            session.endTime = fromEpochSeconds(stmt.columnInt64(3));
        }
        session.status = statusFromString(stmt.columnText(4));
        session.phase = phaseFromString(stmt.columnText(5));
        session.devicesFound = stmt.columnInt(6);
        session.checksIssued = stmt.columnInt(7);
        sessions.push_back(std::move(session));
    }
    return sessions;
}

} // namespace camlink::infra
