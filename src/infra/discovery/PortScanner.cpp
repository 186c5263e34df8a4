#include "infra/discovery/PortScanner.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

namespace {

constexpr std::chrono::milliseconds ACQUIRE_POLL{50};

} // namespace

PortScanner::PortScanner(AsioContext& context, std::vector<uint16_t> ports,
                         std::chrono::milliseconds connectTimeout, int maxConcurrency,
                         size_t hostLimit)
    : context_(context), ports_(std::move(ports)), connectTimeout_(connectTimeout),
      maxConcurrency_(maxConcurrency > 0 ? maxConcurrency : DEFAULT_MAX_CONCURRENCY),
      hostLimit_(hostLimit) {}

PortScanner::~PortScanner() {
    cancel();
}

void PortScanner::setExcludedHosts(std::set<std::string> hosts) {
    excludedHosts_ = std::move(hosts);
}

std::vector<core::DiscoveryResult> PortScanner::sweep(const core::NetworkInfo& network,
                                                      std::chrono::milliseconds timeout,
                                                      const core::CancellationToken& cancel,
                                                      ResultCallback onResult) {
    if (consumed_.exchange(true)) {
        spdlog::warn("PortScan adapter already used, create a new instance per phase");
        return {};
    }

    std::vector<std::string> hosts;
    for (auto& host : network.hostAddresses(hostLimit_)) {
        if (excludedHosts_.count(host) == 0) {
            hosts.push_back(std::move(host));
        }
    }

    return scan(hosts, timeout, cancel, std::move(onResult));
}

std::vector<core::DiscoveryResult> PortScanner::scan(const std::vector<std::string>& hosts,
                                                     std::chrono::milliseconds timeout,
                                                     const core::CancellationToken& cancel,
                                                     ResultCallback onResult) {
    if (!context_.isRunning()) {
        spdlog::error("Port scan requested while the worker pool is stopped");
        return {};
    }
    if (scanning_.exchange(true)) {
        spdlog::warn("Scan already in progress");
        return {};
    }

    cancelled_ = false;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto progress = std::make_shared<ScanProgress>();
    progress->onResult = std::move(onResult);
    semaphore_ = std::make_unique<std::counting_semaphore<>>(maxConcurrency_);

    spdlog::info("Scanning {} hosts on {} ports (concurrency {})", hosts.size(), ports_.size(),
                 maxConcurrency_);

    size_t issued = 0;
    for (const auto& host : hosts) {
        for (uint16_t port : ports_) {
            bool acquired = false;
            while (!acquired) {
                if (cancel.isCancelled() || std::chrono::steady_clock::now() >= deadline) {
                    cancelled_ = true;
                }
                if (cancelled_) {
                    break;
                }
                acquired = semaphore_->try_acquire_for(ACQUIRE_POLL);
            }
            if (!acquired) {
                break;
            }

            startConnect(host, port, progress);
            ++issued;
        }
        if (cancelled_) {
            break;
        }
    }

    std::unique_lock lock(progress->mutex);
    progress->done.wait(lock, [&] { return progress->completed == issued; });
    scanning_ = false;

    spdlog::info("Port scan {}: {} of {} connects succeeded",
                 cancelled_ ? "stopped early" : "complete", progress->results.size(), issued);
    return progress->results;
}

void PortScanner::startConnect(const std::string& host, uint16_t port,
                               const std::shared_ptr<ScanProgress>& progress) {
    auto scanState = std::make_shared<ScanState>();
    scanState->socket = std::make_shared<asio::ip::tcp::socket>(context_.getContext());
    scanState->timer = std::make_shared<asio::steady_timer>(context_.getContext());
    scanState->result.host = host;
    scanState->result.port = port;
    scanState->result.method = core::DiscoveryMethod::PortScan;
    scanState->started = std::chrono::steady_clock::now();

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host), port);

        scanState->timer->expires_after(connectTimeout_);
        scanState->timer->async_wait([this, scanState, progress](const asio::error_code& ec) {
            if (ec || scanState->completed.exchange(true)) {
                return;
            }
            asio::error_code ignored;
            scanState->socket->close(ignored);
            finishPortScan(scanState, false, progress);
        });

        scanState->socket->async_connect(
            endpoint, [this, scanState, progress](const asio::error_code& ec) {
                if (scanState->completed.exchange(true)) {
                    return;
                }
                scanState->timer->cancel();
                asio::error_code ignored;
                scanState->socket->close(ignored);
                finishPortScan(scanState, !ec, progress);
            });
    } catch (const std::exception& e) {
        spdlog::debug("Port scan error for {}:{} - {}", host, port, e.what());
        scanState->completed = true;
        finishPortScan(scanState, false, progress);
    }
}

void PortScanner::finishPortScan(const std::shared_ptr<ScanState>& scanState, bool open,
                                 const std::shared_ptr<ScanProgress>& progress) {
    if (open) {
        scanState->result.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - scanState->started);
        scanState->result.timestamp = std::chrono::system_clock::now();
        spdlog::debug("Open port {}:{}", scanState->result.host, scanState->result.port);
    }

    semaphore_->release();

    std::lock_guard lock(progress->mutex);
    if (open) {
        progress->results.push_back(scanState->result);
        if (progress->onResult) {
            progress->onResult(scanState->result);
        }
    }
    ++progress->completed;
    progress->done.notify_all();
}

void PortScanner::cancel() {
    if (scanning_) {
        spdlog::info("Cancelling port scan");
        cancelled_ = true;
    }
}

} // namespace camlink::infra
