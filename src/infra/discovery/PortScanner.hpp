#pragma once

#include "core/services/IDiscoveryAdapter.hpp"
#include "infra/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <semaphore>
#include <set>

namespace camlink::infra {

/**
 * @brief Bounded-parallel TCP connect scanner over hosts x ports.
 *
 * Connects run on the AsioContext pool, each raced against its own timer.
 * A completed TCP handshake is reported as a result whatever the service
 * behind it. Cancellation (token or exhausted budget) stops issuing new
 * connects; connects already in flight finish or time out before sweep()
 * returns.
 */
class PortScanner : public core::IDiscoveryAdapter {
public:
    static constexpr int DEFAULT_MAX_CONCURRENCY = 64;

    /**
     * @brief Constructs a PortScanner.
     * @param context Worker pool running the asynchronous connects.
     * @param ports Ports tried on every host.
     * @param connectTimeout Timeout of a single connect.
     * @param maxConcurrency Maximum connects in flight.
     * @param hostLimit Maximum hosts taken from the subnet.
     */
    PortScanner(AsioContext& context, std::vector<uint16_t> ports,
                std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(500),
                int maxConcurrency = DEFAULT_MAX_CONCURRENCY, size_t hostLimit = 1024);

    ~PortScanner() override;

    /**
     * @brief Scans every host of the subnet except the excluded ones.
     * @param timeout Budget after which no new connects are issued.
     */
    std::vector<core::DiscoveryResult> sweep(const core::NetworkInfo& network,
                                             std::chrono::milliseconds timeout,
                                             const core::CancellationToken& cancel,
                                             ResultCallback onResult) override;

    /**
     * @brief Scans an explicit host list.
     */
    std::vector<core::DiscoveryResult> scan(const std::vector<std::string>& hosts,
                                            std::chrono::milliseconds timeout,
                                            const core::CancellationToken& cancel,
                                            ResultCallback onResult);

    /**
     * @brief Hosts skipped by sweep() (already confirmed cameras).
     */
    void setExcludedHosts(std::set<std::string> hosts);

    void cancel();

    [[nodiscard]] bool isScanning() const { return scanning_.load(); }

    core::DiscoveryMethod method() const override { return core::DiscoveryMethod::PortScan; }
    std::string name() const override { return "PortScan"; }

private:
    struct ScanState {
        std::shared_ptr<asio::ip::tcp::socket> socket;
        std::shared_ptr<asio::steady_timer> timer;
        core::DiscoveryResult result;
        std::chrono::steady_clock::time_point started;
        std::atomic<bool> completed{false};
    };

    struct ScanProgress {
        std::mutex mutex;
        std::condition_variable done;
        std::vector<core::DiscoveryResult> results;
        size_t completed{0};
        ResultCallback onResult;
    };

    void startConnect(const std::string& host, uint16_t port,
                      const std::shared_ptr<ScanProgress>& progress);
    void finishPortScan(const std::shared_ptr<ScanState>& scanState, bool open,
                        const std::shared_ptr<ScanProgress>& progress);

    AsioContext& context_;
    std::vector<uint16_t> ports_;
    std::chrono::milliseconds connectTimeout_;
    int maxConcurrency_;
    size_t hostLimit_;
    std::set<std::string> excludedHosts_;

    std::atomic<bool> scanning_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> consumed_{false};
    std::unique_ptr<std::counting_semaphore<>> semaphore_;
};

} // namespace camlink::infra
