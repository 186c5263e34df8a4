#include "infra/network/NetworkAnalyzer.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace camlink::infra {

namespace {

bool isPrivateAddress(const std::string& address) {
    auto value = core::ipv4::parse(address);
    if (!value) {
        return false;
    }
    uint32_t a = *value;
    return (a >> 24) == 10 || (a >> 20) == ((172u << 4) | 1u) || (a >> 16) == ((192u << 8) | 168u);
}

bool isVirtualInterface(const std::string& name) {
    static const std::vector<std::string> prefixes{"docker", "veth", "br-", "virbr", "vmnet",
                                                   "vboxnet", "tun", "tap", "zt"};
    return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
        return name.rfind(prefix, 0) == 0;
    });
}

} // namespace

NetworkAnalyzer::NetworkAnalyzer(std::string preferredInterface, std::filesystem::path routeTable)
    : preferredInterface_(std::move(preferredInterface)), routeTable_(std::move(routeTable)) {}

std::vector<core::NetworkInterface> NetworkAnalyzer::enumerateInterfaces() {
    std::vector<core::NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        spdlog::error("getifaddrs failed");
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        core::NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        char ipStr[INET_ADDRSTRLEN];
        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
        iface.ipAddress = ipStr;

        if (ifa->ifa_netmask != nullptr) {
            auto* mask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask);
            inet_ntop(AF_INET, &mask->sin_addr, ipStr, INET_ADDRSTRLEN);
            iface.netmask = ipStr;
        } else {
            iface.netmask = "255.255.255.0";
        }

        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::optional<core::NetworkInterface>
NetworkAnalyzer::selectInterface(const std::vector<core::NetworkInterface>& interfaces,
                                 const std::string& preferred) {
    std::vector<core::NetworkInterface> usable;
    std::copy_if(interfaces.begin(), interfaces.end(), std::back_inserter(usable),
                 [](const core::NetworkInterface& iface) { return iface.isUsable(); });

    if (usable.empty()) {
        return std::nullopt;
    }

    if (!preferred.empty()) {
        auto it = std::find_if(usable.begin(), usable.end(),
                               [&](const auto& iface) { return iface.name == preferred; });
        if (it != usable.end()) {
            return *it;
        }
        spdlog::warn("Preferred interface {} is not usable, choosing automatically", preferred);
    }

    auto score = [](const core::NetworkInterface& iface) {
        int s = 0;
        if (isPrivateAddress(iface.ipAddress)) {
            s += 2;
        }
        if (!isVirtualInterface(iface.name)) {
            s += 1;
        }
        return s;
    };

    std::stable_sort(usable.begin(), usable.end(),
                     [&](const auto& a, const auto& b) { return score(a) > score(b); });
    return usable.front();
}

std::optional<std::string> NetworkAnalyzer::parseDefaultGateway(std::istream& routes,
                                                                const std::string& interfaceName) {
    std::string line;
    std::getline(routes, line); // header

    while (std::getline(routes, line)) {
        std::istringstream fields(line);
        std::string iface;
        std::string destination;
        std::string gateway;
        if (!(fields >> iface >> destination >> gateway)) {
            continue;
        }
        if (destination != "00000000") {
            continue;
        }
        if (!interfaceName.empty() && iface != interfaceName) {
            continue;
        }

        uint32_t raw = 0;
        try {
            raw = static_cast<uint32_t>(std::stoul(gateway, nullptr, 16));
        } catch (const std::exception&) {
            continue;
        }
        if (raw == 0) {
            continue;
        }

        // Kernel prints the address in network byte order as a host-order hex word
        uint32_t address = ((raw & 0xFF) << 24) | (((raw >> 8) & 0xFF) << 16) |
                           (((raw >> 16) & 0xFF) << 8) | ((raw >> 24) & 0xFF);
        return core::ipv4::format(address);
    }
    return std::nullopt;
}

core::NetworkInfo NetworkAnalyzer::buildNetworkInfo(const core::NetworkInterface& selected,
                                                    const std::vector<core::NetworkInterface>& all,
                                                    std::optional<std::string> gateway) {
    auto info = core::NetworkInfo::fromAddress(selected.ipAddress, selected.netmask);
    info.interfaceName = selected.name;
    info.gateway = std::move(gateway);
    std::copy_if(all.begin(), all.end(), std::back_inserter(info.activeInterfaces),
                 [](const core::NetworkInterface& iface) { return iface.isUsable(); });
    return info;
}

core::NetworkInfo NetworkAnalyzer::analyze() const {
    auto interfaces = enumerateInterfaces();
    auto selected = selectInterface(interfaces, preferredInterface_);
    if (!selected) {
        throw core::NoActiveInterfaceError();
    }

    std::optional<std::string> gateway;
    std::ifstream routes(routeTable_);
    if (routes) {
        gateway = parseDefaultGateway(routes, selected->name);
    } else {
        spdlog::debug("Routing table {} not readable", routeTable_.string());
    }

    auto info = buildNetworkInfo(*selected, interfaces, gateway);
    spdlog::info("Using interface {} ({}), subnet {}, gateway {}", info.interfaceName,
                 info.localAddress, info.cidr(), info.gateway.value_or("none"));
    return info;
}

} // namespace camlink::infra
