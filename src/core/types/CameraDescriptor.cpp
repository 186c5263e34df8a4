#include "core/types/CameraDescriptor.hpp"

#include <algorithm>

namespace camlink::core {

namespace {

void addUnique(std::vector<uint16_t>& ports, std::optional<uint16_t> port) {
    if (port && std::find(ports.begin(), ports.end(), *port) == ports.end()) {
        ports.push_back(*port);
    }
}

void putPort(nlohmann::json& j, const char* key, const std::optional<uint16_t>& port) {
    if (port) {
        j[key] = *port;
    } else {
        j[key] = nullptr;
    }
}

std::optional<uint16_t> getPort(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<uint16_t>();
}

} // namespace

std::string protocolTypeToString(ProtocolType type) {
    switch (type) {
    case ProtocolType::Undetermined:
        return "Undetermined";
    case ProtocolType::Standards:
        return "Standards";
    case ProtocolType::Proprietary:
        return "Proprietary";
    case ProtocolType::Hybrid:
        return "Hybrid";
    }
    return "Undetermined";
}

ProtocolType protocolTypeFromString(const std::string& str) {
    if (str == "Standards") {
        return ProtocolType::Standards;
    }
    if (str == "Proprietary") {
        return ProtocolType::Proprietary;
    }
    if (str == "Hybrid") {
        return ProtocolType::Hybrid;
    }
    return ProtocolType::Undetermined;
}

const std::vector<uint16_t>& CameraDescriptor::defaultFallbackPorts() {
    static const std::vector<uint16_t> ports{80, 8080, 554, 8554, 8000, 8899, 34567};
    return ports;
}

CameraDescriptor CameraDescriptor::forHost(const std::string& host) {
    CameraDescriptor descriptor;
    descriptor.id = host;
    descriptor.host = host;
    descriptor.name = host;
    descriptor.ensureFallbackPorts();
    return descriptor;
}

void CameraDescriptor::ensureFallbackPorts() {
    for (uint16_t port : defaultFallbackPorts()) {
        if (std::find(fallbackPorts.begin(), fallbackPorts.end(), port) == fallbackPorts.end()) {
            fallbackPorts.push_back(port);
        }
    }
}

bool CameraDescriptor::isValid() const {
    if (id.empty() || host.empty()) {
        return false;
    }
    for (const auto& port : {httpPort, mediaPort, controlPort, eventPort, proprietaryPort}) {
        if (port && *port == 0) {
            return false;
        }
    }
    return std::none_of(fallbackPorts.begin(), fallbackPorts.end(),
                        [](uint16_t p) { return p == 0; });
}

std::vector<uint16_t> CameraDescriptor::candidatePorts() const {
    std::vector<uint16_t> ports;
    addUnique(ports, controlPort);
    addUnique(ports, mediaPort);
    addUnique(ports, proprietaryPort);
    addUnique(ports, httpPort);
    addUnique(ports, eventPort);
    for (uint16_t port : fallbackPorts) {
        addUnique(ports, port);
    }
    return ports;
}

nlohmann::json CameraDescriptor::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["host"] = host;
    j["name"] = name;
    putPort(j, "http_port", httpPort);
    putPort(j, "media_port", mediaPort);
    putPort(j, "control_port", controlPort);
    putPort(j, "event_port", eventPort);
    putPort(j, "proprietary_port", proprietaryPort);
    j["protocol_type"] = protocolTypeToString(protocolType);
    j["auto_detect"] = autoDetect;
    j["fallback_ports"] = fallbackPorts;
    j["manufacturer"] = manufacturer;
    if (lastSeen) {
        j["last_seen"] = std::chrono::duration_cast<std::chrono::seconds>(
                             lastSeen->time_since_epoch())
                             .count();
    }
    return j;
}

CameraDescriptor CameraDescriptor::fromJson(const nlohmann::json& j) {
    CameraDescriptor descriptor;
    descriptor.host = j.at("host").get<std::string>();
    descriptor.id = j.value("id", descriptor.host);
    descriptor.name = j.value("name", descriptor.host);
    descriptor.httpPort = getPort(j, "http_port");
    descriptor.mediaPort = getPort(j, "media_port");
    descriptor.controlPort = getPort(j, "control_port");
    descriptor.eventPort = getPort(j, "event_port");
    descriptor.proprietaryPort = getPort(j, "proprietary_port");
    descriptor.protocolType = protocolTypeFromString(j.value("protocol_type", "Undetermined"));
    descriptor.autoDetect = j.value("auto_detect", true);
    descriptor.fallbackPorts = j.value("fallback_ports", std::vector<uint16_t>{});
    descriptor.manufacturer = j.value("manufacturer", "");
    if (j.contains("last_seen") && j["last_seen"].is_number_integer()) {
        descriptor.lastSeen = std::chrono::system_clock::time_point(
            std::chrono::seconds(j["last_seen"].get<int64_t>()));
    }
    descriptor.ensureFallbackPorts();
    return descriptor;
}

} // namespace camlink::core
