#include "core/types/NetworkInfo.hpp"

#include <bit>
#include <charconv>
#include <stdexcept>

namespace camlink::core {

namespace ipv4 {

std::optional<uint32_t> parse(const std::string& address) {
    uint32_t result = 0;
    const char* pos = address.data();
    const char* end = address.data() + address.size();

    for (int octet = 0; octet < 4; ++octet) {
        unsigned value = 0;
        auto [next, ec] = std::from_chars(pos, end, value);
        if (ec != std::errc{} || next == pos || value > 255) {
            return std::nullopt;
        }
        result = (result << 8) | value;
        pos = next;

        if (octet < 3) {
            if (pos == end || *pos != '.') {
                return std::nullopt;
            }
            ++pos;
        }
    }

    if (pos != end) {
        return std::nullopt;
    }
    return result;
}

std::string format(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

int prefixLengthFromMask(uint32_t mask) {
    return std::popcount(mask);
}

uint32_t maskFromPrefixLength(int prefixLength) {
    if (prefixLength <= 0) {
        return 0;
    }
    if (prefixLength >= 32) {
        return 0xFFFFFFFFu;
    }
    return 0xFFFFFFFFu << (32 - prefixLength);
}

} // namespace ipv4

bool NetworkInterface::isUsable() const {
    return isUp && !isLoopback && ipv4::parse(ipAddress).has_value();
}

std::string NetworkInfo::cidr() const {
    return networkAddress + "/" + std::to_string(prefixLength);
}

std::vector<std::string> NetworkInfo::hostAddresses(size_t limit) const {
    std::vector<std::string> hosts;

    auto network = ipv4::parse(networkAddress);
    if (!network || prefixLength >= 31) {
        return hosts;
    }

    auto self = ipv4::parse(localAddress);
    uint32_t mask = ipv4::maskFromPrefixLength(prefixLength);
    uint32_t broadcast = *network | ~mask;

    for (uint32_t addr = *network + 1; addr < broadcast && hosts.size() < limit; ++addr) {
        if (self && addr == *self) {
            continue;
        }
        hosts.push_back(ipv4::format(addr));
    }
    return hosts;
}

bool NetworkInfo::contains(const std::string& address) const {
    auto addr = ipv4::parse(address);
    auto network = ipv4::parse(networkAddress);
    if (!addr || !network) {
        return false;
    }
    return (*addr & ipv4::maskFromPrefixLength(prefixLength)) == *network;
}

NetworkInfo NetworkInfo::fromAddress(const std::string& address, const std::string& netmask) {
    auto addr = ipv4::parse(address);
    auto mask = ipv4::parse(netmask);
    if (!addr || !mask) {
        throw std::invalid_argument("Invalid IPv4 address or netmask: " + address + "/" + netmask);
    }

    NetworkInfo info;
    info.localAddress = address;
    info.netmask = netmask;
    info.prefixLength = ipv4::prefixLengthFromMask(*mask);
    info.networkAddress = ipv4::format(*addr & *mask);
    return info;
}

} // namespace camlink::core
