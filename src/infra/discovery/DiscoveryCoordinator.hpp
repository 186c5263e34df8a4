#pragma once

#include "core/services/IDiscoveryAdapter.hpp"
#include "core/services/IProtocolDetector.hpp"
#include "core/types/DiscoveryTypes.hpp"
#include "core/types/NetworkInfo.hpp"
#include "infra/discovery/CameraRegistry.hpp"
#include "infra/discovery/DiscoveryCache.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace camlink::infra {

class DiscoveryCacheRepository;

/**
 * @brief Creates fresh adapters for every session (adapters are one-shot).
 */
struct AdapterFactory {
    /// Phase 1 adapters, run concurrently.
    std::function<std::vector<std::unique_ptr<core::IDiscoveryAdapter>>()> multicast;

    /// Port scan over the given ports, skipping the given hosts (phases 2 and 3).
    std::function<std::unique_ptr<core::IDiscoveryAdapter>(const std::vector<uint16_t>& ports,
                                                           const std::set<std::string>& excluded)>
        portScan;
};

struct CoordinatorOptions {
    std::chrono::milliseconds multicastTimeout{3000};
    std::chrono::milliseconds priorityScanBudget{15000};
    std::chrono::milliseconds fullScanBudget{30000};
    std::vector<uint16_t> priorityPorts;      ///< Empty for CameraPorts::priorityPorts()
    std::vector<uint16_t> fullCatalog;        ///< Empty for CameraPorts::fullCatalog()
    int detectorParallelism{16};
    bool portScanEnabled{true};
    bool fullScanEnabled{true};
    std::optional<core::Credential> loginCredential; ///< Passed to the detector's vendor login
};

/**
 * @brief Runs discovery sessions: multicast, priority port scan, full port scan.
 *
 * After each phase the new (host, port) pairs are checked against the
 * cache, the rest are classified with bounded parallelism, and accepted
 * cameras are merged into the registry. Hosts already confirmed are not
 * scanned again. One session at a time.
 */
class DiscoveryCoordinator {
public:
    using ProgressCallback = std::function<void(const core::DiscoveryProgress&)>;

    /**
     * @brief Constructs a DiscoveryCoordinator.
     * @param adapters Adapter factories.
     * @param detector Classifier for discovered endpoints.
     * @param cache Classification cache shared with the connection manager.
     * @param registry Roster receiving accepted cameras.
     * @param options Phase budgets and parallelism.
     * @param repository Persists sessions and the cache (may be null).
     */
    DiscoveryCoordinator(AdapterFactory adapters, core::IProtocolDetector& detector,
                         DiscoveryCache& cache, CameraRegistry& registry,
                         CoordinatorOptions options = {},
                         DiscoveryCacheRepository* repository = nullptr);

    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    /**
     * @brief Runs a session to completion or cancellation.
     *
     * If a session is already running, logs a warning and returns a
     * cancelled session without probing.
     *
     * @param network Subnet to discover.
     * @return Terminal session record.
     */
    core::DiscoverySession discover(const core::NetworkInfo& network);

    /**
     * @brief Runs discover() on a dedicated thread.
     *
     * Not on the worker pool: the port scanner blocks its caller while its
     * connects complete on the pool.
     */
    std::future<core::DiscoverySession> discoverAsync(core::NetworkInfo network);

    /**
     * @brief Requests cancellation of the running session.
     *
     * Honoured at phase boundaries and between classifications.
     */
    void cancel();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    void setProgressCallback(ProgressCallback callback);

    [[nodiscard]] std::optional<core::DiscoverySession> lastSession() const;

private:
    using Endpoint = std::pair<std::string, uint16_t>;

    /// Per-session bookkeeping.
    struct SessionState {
        core::DiscoverySession session;
        core::CancellationToken token;
        std::set<Endpoint> seen;
        std::set<std::string> foundHosts;
    };

    std::vector<core::DiscoveryResult> runMulticast(const core::NetworkInfo& network,
                                                    SessionState& state);
    std::vector<core::DiscoveryResult> runPortScan(const core::NetworkInfo& network,
                                                   const std::vector<uint16_t>& ports,
                                                   std::chrono::milliseconds budget,
                                                   SessionState& state);

    /**
     * @brief Dedupes, consults the cache, classifies and merges one phase's results.
     */
    void processResults(const std::vector<core::DiscoveryResult>& results, SessionState& state,
                        double progressStart, double progressEnd);

    void accept(const std::string& host, uint16_t port,
                const core::Classification& classification, SessionState& state);
    std::set<std::string> confirmedHosts() const;
    void reportProgress(const SessionState& state, double percent);
    void persist(const core::DiscoverySession& session);
    static std::string makeSessionId();

    AdapterFactory adapters_;
    core::IProtocolDetector& detector_;
    DiscoveryCache& cache_;
    CameraRegistry& registry_;
    CoordinatorOptions options_;
    DiscoveryCacheRepository* repository_;

    std::atomic<bool> running_{false};
    core::CancellationToken currentToken_;
    ProgressCallback progressCallback_;
    std::optional<core::DiscoverySession> lastSession_;
    mutable std::mutex mutex_;
};

} // namespace camlink::infra
