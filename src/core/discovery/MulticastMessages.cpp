#include "core/discovery/MulticastMessages.hpp"

#include "core/protocol/XmlSupport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace camlink::core::multicast {

namespace {

constexpr uint16_t DNS_TYPE_PTR = 12;
constexpr uint16_t DNS_TYPE_SRV = 33;
constexpr uint16_t DNS_CLASS_IN = 1;
constexpr size_t DNS_HEADER_SIZE = 12;
constexpr int MAX_NAME_JUMPS = 16;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

uint16_t readU16(const std::vector<uint8_t>& p, size_t offset) {
    return static_cast<uint16_t>((p[offset] << 8) | p[offset + 1]);
}

void writeU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

// Reads a possibly compressed DNS name; offset ends after the name in the record.
std::optional<std::string> readName(const std::vector<uint8_t>& packet, size_t& offset) {
    std::string name;
    size_t pos = offset;
    bool jumped = false;
    int jumps = 0;

    while (true) {
        if (pos >= packet.size()) {
            return std::nullopt;
        }
        uint8_t len = packet[pos];

        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= packet.size() || ++jumps > MAX_NAME_JUMPS) {
                return std::nullopt;
            }
            size_t target = static_cast<size_t>(((len & 0x3F) << 8) | packet[pos + 1]);
            if (!jumped) {
                offset = pos + 2;
                jumped = true;
            }
            pos = target;
            continue;
        }

        if (len == 0) {
            if (!jumped) {
                offset = pos + 1;
            }
            return name;
        }

        if (pos + 1 + len > packet.size()) {
            return std::nullopt;
        }
        if (!name.empty()) {
            name += '.';
        }
        name.append(reinterpret_cast<const char*>(&packet[pos + 1]), len);
        pos += 1 + len;
    }
}

} // namespace

uint16_t portFromUrl(const std::string& url, uint16_t defaultPort) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return defaultPort;
    }

    std::string scheme = toLower(url.substr(0, schemeEnd));
    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos
                                                           ? std::string::npos
                                                           : authorityEnd - authorityStart);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    size_t colon = std::string::npos;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close != std::string::npos && close + 1 < authority.size() &&
            authority[close + 1] == ':') {
            colon = close + 1;
        }
    } else {
        colon = authority.rfind(':');
    }

    if (colon != std::string::npos) {
        unsigned value = 0;
        const char* first = authority.data() + colon + 1;
        const char* last = authority.data() + authority.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc{} && ptr == last && value > 0 && value <= 65535) {
            return static_cast<uint16_t>(value);
        }
        return defaultPort;
    }

    if (scheme == "http") {
        return 80;
    }
    if (scheme == "https") {
        return 443;
    }
    if (scheme == "rtsp") {
        return 554;
    }
    return defaultPort;
}

std::string buildWsDiscoveryRequest(const std::string& messageId) {
    std::ostringstream oss;
    oss << R"(<?xml version="1.0" encoding="UTF-8"?>)"
        << R"(<e:Envelope xmlns:e="http://www.w3.org/2003/05/soap-envelope" )"
        << R"(xmlns:w="http://schemas.xmlsoap.org/ws/2004/08/addressing" )"
        << R"(xmlns:d="http://schemas.xmlsoap.org/ws/2005/04/discovery" )"
        << R"(xmlns:dn="http://www.onvif.org/ver10/network/wsdl">)"
        << "<e:Header>"
        << "<w:MessageID>uuid:" << messageId << "</w:MessageID>"
        << "<w:To e:mustUnderstand=\"true\">urn:schemas-xmlsoap-org:ws:2005:04:discovery</w:To>"
        << "<w:Action e:mustUnderstand=\"true\">"
           "http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</w:Action>"
        << "</e:Header>"
        << "<e:Body><d:Probe><d:Types>dn:NetworkVideoTransmitter</d:Types></d:Probe></e:Body>"
        << "</e:Envelope>";
    return oss.str();
}

std::optional<uint16_t> parseWsDiscoveryReply(const std::string& xml) {
    if (!xml::containsElement(xml, "ProbeMatch")) {
        return std::nullopt;
    }

    auto xaddrs = xml::nestedText(xml, "ProbeMatch", "XAddrs");
    if (!xaddrs) {
        return 80;
    }

    std::istringstream urls(*xaddrs);
    std::string first;
    if (!(urls >> first)) {
        return 80;
    }
    return portFromUrl(first, 80);
}

std::string buildSsdpSearch(int mx) {
    std::ostringstream oss;
    oss << "M-SEARCH * HTTP/1.1\r\n"
        << "HOST: " << SSDP_ADDRESS << ":" << SSDP_PORT << "\r\n"
        << "MAN: \"ssdp:discover\"\r\n"
        << "MX: " << mx << "\r\n"
        << "ST: ssdp:all\r\n"
        << "\r\n";
    return oss.str();
}

std::optional<uint16_t> parseSsdpReply(const std::string& message) {
    std::istringstream stream(message);
    std::string statusLine;
    if (!std::getline(stream, statusLine)) {
        return std::nullopt;
    }

    statusLine = toLower(trim(statusLine));
    bool isResponse = statusLine.rfind("http/1.1 200", 0) == 0;
    bool isNotify = statusLine.rfind("notify * http/1.1", 0) == 0;
    if (!isResponse && !isNotify) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (toLower(trim(line.substr(0, colon))) == "location") {
            return portFromUrl(trim(line.substr(colon + 1)), 80);
        }
    }
    return 80;
}

const std::vector<std::string>& mdnsServiceTypes() {
    static const std::vector<std::string> services{"_rtsp._tcp.local", "_onvif._tcp.local",
                                                   "_http._tcp.local"};
    return services;
}

std::vector<uint8_t> buildMdnsQuery(const std::vector<std::string>& services) {
    std::vector<uint8_t> packet;
    writeU16(packet, 0); // id
    writeU16(packet, 0); // flags: standard query
    writeU16(packet, static_cast<uint16_t>(services.size()));
    writeU16(packet, 0);
    writeU16(packet, 0);
    writeU16(packet, 0);

    for (const auto& service : services) {
        std::istringstream labels(service);
        std::string label;
        while (std::getline(labels, label, '.')) {
            if (label.empty() || label.size() > 63) {
                continue;
            }
            packet.push_back(static_cast<uint8_t>(label.size()));
            packet.insert(packet.end(), label.begin(), label.end());
        }
        packet.push_back(0);
        writeU16(packet, DNS_TYPE_PTR);
        writeU16(packet, DNS_CLASS_IN);
    }
    return packet;
}

std::optional<uint16_t> parseMdnsReply(const std::vector<uint8_t>& packet) {
    if (packet.size() < DNS_HEADER_SIZE) {
        return std::nullopt;
    }

    uint16_t flags = readU16(packet, 2);
    if ((flags & 0x8000) == 0) {
        return std::nullopt; // a query, not a response
    }

    uint16_t questions = readU16(packet, 4);
    int records = readU16(packet, 6) + readU16(packet, 8) + readU16(packet, 10);

    size_t offset = DNS_HEADER_SIZE;
    for (uint16_t i = 0; i < questions; ++i) {
        if (!readName(packet, offset) || offset + 4 > packet.size()) {
            return std::nullopt;
        }
        offset += 4;
    }

    std::optional<uint16_t> ptrPort;
    for (int i = 0; i < records; ++i) {
        auto owner = readName(packet, offset);
        if (!owner || offset + 10 > packet.size()) {
            break;
        }

        uint16_t type = readU16(packet, offset);
        uint16_t rdLength = readU16(packet, offset + 8);
        size_t rdata = offset + 10;
        if (rdata + rdLength > packet.size()) {
            break;
        }

        if (type == DNS_TYPE_SRV && rdLength >= 6) {
            return readU16(packet, rdata + 4);
        }

        if (type == DNS_TYPE_PTR && !ptrPort) {
            auto name = toLower(*owner);
            if (name.find("_rtsp._tcp") != std::string::npos) {
                ptrPort = 554;
            } else if (name.find("_onvif._tcp") != std::string::npos ||
                       name.find("_http._tcp") != std::string::npos) {
                ptrPort = 80;
            }
        }

        offset = rdata + rdLength;
    }

    return ptrPort;
}

} // namespace camlink::core::multicast
