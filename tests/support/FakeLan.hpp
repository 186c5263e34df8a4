#pragma once

#include "core/services/IDiscoveryAdapter.hpp"
#include "infra/discovery/DiscoveryCoordinator.hpp"
#include "support/FakeTransport.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace camlink::testing {

/**
 * @brief Adapter reporting a fixed set of responders.
 */
class InventoryAdapter : public core::IDiscoveryAdapter {
public:
    InventoryAdapter(std::vector<core::DiscoveryResult> results, core::DiscoveryMethod method,
                     std::string name)
        : results_(std::move(results)), method_(method), name_(std::move(name)) {}

    std::vector<core::DiscoveryResult> sweep(const core::NetworkInfo& network,
                                             std::chrono::milliseconds,
                                             const core::CancellationToken& cancel,
                                             ResultCallback onResult) override {
        std::vector<core::DiscoveryResult> out;
        for (const auto& result : results_) {
            if (cancel.isCancelled()) {
                break;
            }
            if (!network.contains(result.host)) {
                continue;
            }
            if (onResult) {
                onResult(result);
            }
            out.push_back(result);
        }
        return out;
    }

    core::DiscoveryMethod method() const override { return method_; }
    std::string name() const override { return name_; }

private:
    std::vector<core::DiscoveryResult> results_;
    core::DiscoveryMethod method_;
    std::string name_;
};

/**
 * @brief Simulated subnet: scripted devices behind a FakeTransport.
 *
 * Port scans report every listening endpoint on the requested ports,
 * minus excluded hosts. Scans never touch the transport, so connect
 * counts reflect classification and connection traffic only.
 */
class FakeLan {
public:
    FakeTransport transport;

    void addProprietaryCamera(const std::string& host, VendorScript vendor = {}) {
        transport.listen(host, core::DEFAULT_PROPRIETARY_PORT, vendorDevice(std::move(vendor)));
        reachable(host, core::DEFAULT_PROPRIETARY_PORT);
    }

    void addHybridCamera(const std::string& host, VendorScript vendor = {}) {
        OnvifScript onvif;
        onvif.host = host;
        onvif.username = vendor.username;
        onvif.password = vendor.password;
        transport.listen(host, 80, onvifDevice(onvif));
        transport.listen(host, 554, rtspServer());
        transport.listen(host, core::DEFAULT_PROPRIETARY_PORT, vendorDevice(std::move(vendor)));
        reachable(host, 80);
        reachable(host, 554);
        reachable(host, core::DEFAULT_PROPRIETARY_PORT);
    }

    /**
     * @brief Router with a login page, also answering SSDP.
     */
    void addRouter(const std::string& host) {
        transport.listen(host, 80,
                         webPage(200, "<html><title>Wireless Router</title>"
                                      "<form><input type=\"password\"></form></html>"));
        reachable(host, 80);
        announce(host, 80, core::DiscoveryMethod::MulticastB);
    }

    void announce(const std::string& host, uint16_t port, core::DiscoveryMethod method) {
        std::lock_guard lock(mutex_);
        announced_.push_back(result(host, port, method));
    }

    int scans() const { return scans_.load(); }

    infra::AdapterFactory adapters() {
        infra::AdapterFactory factory;
        factory.multicast = [this] {
            std::vector<std::unique_ptr<core::IDiscoveryAdapter>> list;
            std::lock_guard lock(mutex_);
            list.push_back(std::make_unique<InventoryAdapter>(
                announced_, core::DiscoveryMethod::MulticastA, "Multicast"));
            return list;
        };
        factory.portScan = [this](const std::vector<uint16_t>& ports,
                                  const std::set<std::string>& excluded)
            -> std::unique_ptr<core::IDiscoveryAdapter> {
            ++scans_;
            std::vector<core::DiscoveryResult> results;
            std::lock_guard lock(mutex_);
            for (const auto& r : reachable_) {
                if (excluded.count(r.host) > 0) {
                    continue;
                }
                if (std::find(ports.begin(), ports.end(), r.port) != ports.end()) {
                    results.push_back(r);
                }
            }
            return std::make_unique<InventoryAdapter>(std::move(results),
                                                      core::DiscoveryMethod::PortScan,
                                                      "PortScan");
        };
        return factory;
    }

private:
    static core::DiscoveryResult result(const std::string& host, uint16_t port,
                                        core::DiscoveryMethod method) {
        core::DiscoveryResult r;
        r.host = host;
        r.port = port;
        r.method = method;
        r.timestamp = std::chrono::system_clock::now();
        return r;
    }

    void reachable(const std::string& host, uint16_t port) {
        std::lock_guard lock(mutex_);
        reachable_.push_back(result(host, port, core::DiscoveryMethod::PortScan));
    }

    std::vector<core::DiscoveryResult> announced_;
    std::vector<core::DiscoveryResult> reachable_;
    std::atomic<int> scans_{0};
    std::mutex mutex_;
};

} // namespace camlink::testing
