#include "core/types/DiscoveryTypes.hpp"

namespace camlink::core {

std::string discoveryMethodToString(DiscoveryMethod method) {
    switch (method) {
    case DiscoveryMethod::MulticastA:
        return "ws-discovery";
    case DiscoveryMethod::MulticastB:
        return "ssdp";
    case DiscoveryMethod::MulticastC:
        return "mdns";
    case DiscoveryMethod::PortScan:
        return "port-scan";
    }
    return "unknown";
}

std::string discoveryPhaseToString(DiscoveryPhase phase) {
    switch (phase) {
    case DiscoveryPhase::Idle:
        return "Idle";
    case DiscoveryPhase::Multicast:
        return "Phase1";
    case DiscoveryPhase::PriorityScan:
        return "Phase2";
    case DiscoveryPhase::FullScan:
        return "Phase3";
    case DiscoveryPhase::Completed:
        return "Completed";
    case DiscoveryPhase::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

std::string discoveryStatusToString(DiscoveryStatus status) {
    switch (status) {
    case DiscoveryStatus::Running:
        return "Running";
    case DiscoveryStatus::Completed:
        return "Completed";
    case DiscoveryStatus::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

std::chrono::milliseconds DiscoverySession::duration() const {
    auto end = endTime.value_or(std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - startTime);
}

std::string protocolKindToString(ProtocolKind kind) {
    switch (kind) {
    case ProtocolKind::Standards:
        return "Standards";
    case ProtocolKind::Media:
        return "Media";
    case ProtocolKind::Proprietary:
        return "Proprietary";
    case ProtocolKind::Web:
        return "Web";
    case ProtocolKind::Rejected:
        return "Rejected";
    }
    return "Rejected";
}

ProtocolKind protocolKindFromString(const std::string& str) {
    if (str == "Standards") {
        return ProtocolKind::Standards;
    }
    if (str == "Media") {
        return ProtocolKind::Media;
    }
    if (str == "Proprietary") {
        return ProtocolKind::Proprietary;
    }
    if (str == "Web") {
        return ProtocolKind::Web;
    }
    return ProtocolKind::Rejected;
}

} // namespace camlink::core
