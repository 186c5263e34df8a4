#include "infra/discovery/MulticastAdapter.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <functional>
#include <set>

namespace camlink::infra {

namespace {

constexpr size_t MAX_DATAGRAM_SIZE = 65507;
constexpr std::chrono::milliseconds POLL_INTERVAL{100};
constexpr int MULTICAST_HOPS = 4;

} // namespace

MulticastAdapter::MulticastAdapter(std::string groupAddress, uint16_t groupPort)
    : groupAddress_(std::move(groupAddress)), groupPort_(groupPort) {}

std::vector<core::DiscoveryResult> MulticastAdapter::sweep(const core::NetworkInfo& network,
                                                           std::chrono::milliseconds timeout,
                                                           const core::CancellationToken& cancel,
                                                           ResultCallback onResult) {
    std::vector<core::DiscoveryResult> results;

    if (consumed_.exchange(true)) {
        spdlog::warn("{} adapter already used, create a new instance per session", name());
        return results;
    }

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + timeout;
    std::set<std::pair<std::string, uint16_t>> seen;

    try {
        asio::io_context io;
        asio::ip::udp::socket socket(io);
        socket.open(asio::ip::udp::v4());
        socket.set_option(asio::ip::udp::socket::reuse_address(true));
        socket.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), 0));

        if (!network.localAddress.empty()) {
            socket.set_option(asio::ip::multicast::outbound_interface(
                asio::ip::make_address_v4(network.localAddress)));
        }
        socket.set_option(asio::ip::multicast::hops(MULTICAST_HOPS));

        asio::ip::udp::endpoint group(asio::ip::make_address_v4(groupAddress_), groupPort_);
        auto query = buildQuery();
        socket.send_to(asio::buffer(query), group);
        spdlog::debug("{} query sent to {}:{} via {}", name(), groupAddress_, groupPort_,
                      network.localAddress);

        std::array<uint8_t, MAX_DATAGRAM_SIZE> buffer{};
        asio::ip::udp::endpoint sender;
        std::function<void()> receive;

        receive = [&]() {
            socket.async_receive_from(
                asio::buffer(buffer), sender, [&](const asio::error_code& ec, size_t size) {
                    if (ec) {
                        if (ec != asio::error::operation_aborted) {
                            spdlog::debug("{} receive failed: {}", name(), ec.message());
                        }
                        return;
                    }

                    std::vector<uint8_t> datagram(buffer.begin(), buffer.begin() + size);
                    auto host = sender.address().to_string();
                    auto port = parseReply(datagram);

                    if (port && seen.insert({host, *port}).second) {
                        core::DiscoveryResult result;
                        result.host = host;
                        result.port = *port;
                        result.method = method();
                        result.responseTime =
                            std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start);
                        result.timestamp = std::chrono::system_clock::now();
                        results.push_back(result);
                        if (onResult) {
                            onResult(result);
                        }
                    }

                    if (!cancel.isCancelled()) {
                        receive();
                    }
                });
        };
        receive();

        while (!cancel.isCancelled() && !io.stopped()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            io.run_for(std::min(remaining, POLL_INTERVAL));
        }

        asio::error_code ignored;
        socket.close(ignored);
        io.restart();
        io.run();
    } catch (const std::exception& e) {
        spdlog::warn("{} discovery unavailable on {}: {}", name(), network.interfaceName,
                     e.what());
    }

    spdlog::info("{} found {} responders{}", name(), results.size(),
                 cancel.isCancelled() ? " (cancelled)" : "");
    return results;
}

} // namespace camlink::infra
