#include "infra/discovery/DiscoveryCoordinator.hpp"

#include "core/types/CameraPorts.hpp"
#include "infra/crypto/Digest.hpp"
#include "infra/crypto/SecureStorage.hpp"
#include "infra/database/DiscoveryCacheRepository.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace camlink::infra {

namespace {

// Share of the overall progress each phase accounts for
constexpr double MULTICAST_END = 20.0;
constexpr double PRIORITY_SCAN_END = 50.0;
constexpr double FULL_SCAN_END = 100.0;

constexpr double CACHED_CONFIDENCE = 1.0;

struct RunningGuard {
    std::atomic<bool>& flag;
    ~RunningGuard() { flag = false; }
};

} // namespace

DiscoveryCoordinator::DiscoveryCoordinator(AdapterFactory adapters,
                                           core::IProtocolDetector& detector,
                                           DiscoveryCache& cache, CameraRegistry& registry,
                                           CoordinatorOptions options,
                                           DiscoveryCacheRepository* repository)
    : adapters_(std::move(adapters)), detector_(detector), cache_(cache), registry_(registry),
      options_(std::move(options)), repository_(repository) {
    if (options_.priorityPorts.empty()) {
        options_.priorityPorts = core::CameraPorts::priorityPorts();
    }
    if (options_.fullCatalog.empty()) {
        options_.fullCatalog = core::CameraPorts::fullCatalog();
    }
    if (options_.detectorParallelism < 1) {
        options_.detectorParallelism = 1;
    }
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    cancel();
}

void DiscoveryCoordinator::setProgressCallback(ProgressCallback callback) {
    std::lock_guard lock(mutex_);
    progressCallback_ = std::move(callback);
}

std::optional<core::DiscoverySession> DiscoveryCoordinator::lastSession() const {
    std::lock_guard lock(mutex_);
    return lastSession_;
}

void DiscoveryCoordinator::cancel() {
    std::lock_guard lock(mutex_);
    if (running_) {
        spdlog::info("Discovery cancellation requested");
        currentToken_.cancel();
    }
}

std::string DiscoveryCoordinator::makeSessionId() {
    return Digest::toHex(SecureStorage::randomBytes(8));
}

void DiscoveryCoordinator::reportProgress(const SessionState& state, double percent) {
    ProgressCallback callback;
    {
        std::lock_guard lock(mutex_);
        callback = progressCallback_;
    }
    if (!callback) {
        return;
    }

    core::DiscoveryProgress progress;
    progress.phase = state.session.phase;
    progress.percentComplete = std::clamp(percent, 0.0, 100.0);
    progress.devicesFound = static_cast<int>(state.foundHosts.size());
    progress.cancelled = state.token.isCancelled();
    callback(progress);
}

void DiscoveryCoordinator::persist(const core::DiscoverySession& session) {
    if (!repository_) {
        return;
    }
    try {
        repository_->recordSession(session);
        if (session.isTerminal()) {
            repository_->saveAll(cache_.entries());
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to persist discovery session {}: {}", session.id, e.what());
    }
}

std::set<std::string> DiscoveryCoordinator::confirmedHosts() const {
    auto hosts = cache_.confirmedHosts();
    for (const auto& descriptor : registry_.roster()) {
        hosts.insert(descriptor.host);
    }
    return hosts;
}

std::vector<core::DiscoveryResult>
DiscoveryCoordinator::runMulticast(const core::NetworkInfo& network, SessionState& state) {
    std::vector<core::DiscoveryResult> results;
    if (!adapters_.multicast) {
        return results;
    }

    auto adapters = adapters_.multicast();
    std::vector<std::future<std::vector<core::DiscoveryResult>>> futures;
    futures.reserve(adapters.size());

    for (auto& adapter : adapters) {
        auto* raw = adapter.get();
        futures.push_back(std::async(std::launch::async, [this, raw, &network, &state] {
            return raw->sweep(network, options_.multicastTimeout, state.token, nullptr);
        }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            auto found = futures[i].get();
            spdlog::info("{} found {} responders", adapters[i]->name(), found.size());
            results.insert(results.end(), found.begin(), found.end());
        } catch (const std::exception& e) {
            spdlog::warn("{} failed: {}", adapters[i]->name(), e.what());
        }
    }
    return results;
}

std::vector<core::DiscoveryResult>
DiscoveryCoordinator::runPortScan(const core::NetworkInfo& network,
                                  const std::vector<uint16_t>& ports,
                                  std::chrono::milliseconds budget, SessionState& state) {
    if (!adapters_.portScan) {
        return {};
    }

    auto excluded = confirmedHosts();
    if (!excluded.empty()) {
        spdlog::info("Skipping {} confirmed hosts", excluded.size());
    }

    auto scanner = adapters_.portScan(ports, excluded);
    if (!scanner) {
        return {};
    }

    try {
        return scanner->sweep(network, budget, state.token, nullptr);
    } catch (const std::exception& e) {
        spdlog::warn("{} failed: {}", scanner->name(), e.what());
        return {};
    }
}

void DiscoveryCoordinator::accept(const std::string& host, uint16_t port,
                                  const core::Classification& classification,
                                  SessionState& state) {
    if (registry_.upsert(host, port, classification)) {
        state.foundHosts.insert(host);
    }
}

void DiscoveryCoordinator::processResults(const std::vector<core::DiscoveryResult>& results,
                                          SessionState& state, double progressStart,
                                          double progressEnd) {
    std::vector<Endpoint> pending;

    for (const auto& result : results) {
        if (!result.valid || result.port == 0) {
            spdlog::debug("Dropping invalid result from {}: {}", result.host,
                          result.error.value_or("no port"));
            continue;
        }

        Endpoint endpoint{result.host, result.port};
        if (!state.seen.insert(endpoint).second) {
            continue;
        }

        switch (cache_.lookup(result.host, result.port)) {
        case CacheLookup::FreshMiss:
            spdlog::debug("{}:{} rejected recently, skipping", result.host, result.port);
            break;
        case CacheLookup::FreshHit: {
            auto entry = cache_.freshEntry(result.host, result.port);
            if (entry) {
                core::Classification cached;
                cached.kind = entry->kind;
                cached.confidence = CACHED_CONFIDENCE;
                cached.detail = "cached";
                accept(result.host, result.port, cached, state);
            }
            break;
        }
        case CacheLookup::Stale:
            pending.push_back(endpoint);
            break;
        }
    }

    reportProgress(state, progressStart);
    if (pending.empty()) {
        return;
    }

    spdlog::info("Classifying {} endpoints", pending.size());
    auto batchSize = static_cast<size_t>(options_.detectorParallelism);

    for (size_t begin = 0; begin < pending.size(); begin += batchSize) {
        if (state.token.isCancelled()) {
            return;
        }

        auto end = std::min(begin + batchSize, pending.size());
        std::vector<std::future<core::Classification>> futures;
        futures.reserve(end - begin);

        for (size_t i = begin; i < end; ++i) {
            const auto& [host, port] = pending[i];
            futures.push_back(std::async(std::launch::async, [this, host = host, port = port] {
                return detector_.classify(host, port, options_.loginCredential);
            }));
            ++state.session.checksIssued;
        }

        for (size_t i = begin; i < end; ++i) {
            const auto& [host, port] = pending[i];
            core::Classification classification;
            try {
                classification = futures[i - begin].get();
            } catch (const std::exception& e) {
                spdlog::warn("Classifying {}:{} failed: {}", host, port, e.what());
                continue;
            }

            if (classification.isAccepted()) {
                cache_.recordHit(host, port, classification.kind);
                accept(host, port, classification, state);
            } else if (classification.isConfirmedNonCamera()) {
                cache_.recordMiss(host, port, classification.detail);
            } else {
                spdlog::debug("{}:{} inconclusive, not cached: {}", host, port,
                              classification.detail);
            }
        }

        double done = static_cast<double>(end) / static_cast<double>(pending.size());
        reportProgress(state, progressStart + (progressEnd - progressStart) * done);
    }
}

core::DiscoverySession DiscoveryCoordinator::discover(const core::NetworkInfo& network) {
    if (running_.exchange(true)) {
        spdlog::warn("Discovery already running, ignoring request for {}", network.cidr());
        core::DiscoverySession rejected;
        rejected.id = makeSessionId();
        rejected.subnet = network.cidr();
        rejected.startTime = std::chrono::system_clock::now();
        rejected.endTime = rejected.startTime;
        rejected.status = core::DiscoveryStatus::Cancelled;
        rejected.phase = core::DiscoveryPhase::Cancelled;
        return rejected;
    }

    RunningGuard guard{running_};

    SessionState state;
    state.session.id = makeSessionId();
    state.session.subnet = network.cidr();
    state.session.startTime = std::chrono::system_clock::now();
    {
        std::lock_guard lock(mutex_);
        currentToken_ = state.token;
    }

    spdlog::info("Discovery session {} started on {}", state.session.id, state.session.subnet);
    persist(state.session);

    auto expired = cache_.purgeExpired();
    if (expired > 0) {
        spdlog::debug("Purged {} expired cache entries", expired);
    }

    auto cancelled = [&] { return state.token.isCancelled(); };

    state.session.phase = core::DiscoveryPhase::Multicast;
    reportProgress(state, 0.0);
    processResults(runMulticast(network, state), state, MULTICAST_END / 2, MULTICAST_END);

    if (!cancelled() && options_.portScanEnabled) {
        state.session.phase = core::DiscoveryPhase::PriorityScan;
        auto results =
            runPortScan(network, options_.priorityPorts, options_.priorityScanBudget, state);
        processResults(results, state, (MULTICAST_END + PRIORITY_SCAN_END) / 2,
                       PRIORITY_SCAN_END);
    }

    if (!cancelled() && options_.portScanEnabled && options_.fullScanEnabled) {
        state.session.phase = core::DiscoveryPhase::FullScan;
        auto results = runPortScan(network, options_.fullCatalog, options_.fullScanBudget, state);
        processResults(results, state, (PRIORITY_SCAN_END + FULL_SCAN_END) / 2, FULL_SCAN_END);
    }

    state.session.endTime = std::chrono::system_clock::now();
    state.session.devicesFound = static_cast<int>(state.foundHosts.size());
    if (state.token.isCancelled()) {
        state.session.status = core::DiscoveryStatus::Cancelled;
        state.session.phase = core::DiscoveryPhase::Cancelled;
    } else {
        state.session.status = core::DiscoveryStatus::Completed;
        state.session.phase = core::DiscoveryPhase::Completed;
    }
    reportProgress(state, 100.0);

    spdlog::info("Discovery session {} {} in {}ms: {} cameras, {} checks", state.session.id,
                 core::discoveryStatusToString(state.session.status),
                 state.session.duration().count(), state.session.devicesFound,
                 state.session.checksIssued);
    persist(state.session);

    {
        std::lock_guard lock(mutex_);
        lastSession_ = state.session;
    }
    return state.session;
}

std::future<core::DiscoverySession> DiscoveryCoordinator::discoverAsync(core::NetworkInfo network) {
    return std::async(std::launch::async,
                      [this, network = std::move(network)] { return discover(network); });
}

} // namespace camlink::infra
