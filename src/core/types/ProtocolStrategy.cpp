#include "core/types/ProtocolStrategy.hpp"

namespace camlink::core {

namespace {

StandardsStrategy standardsFor(const CameraDescriptor& descriptor) {
    return StandardsStrategy{descriptor.controlPort.value_or(DEFAULT_CONTROL_PORT),
                             descriptor.mediaPort.value_or(DEFAULT_MEDIA_PORT)};
}

ProprietaryStrategy proprietaryFor(const CameraDescriptor& descriptor) {
    return ProprietaryStrategy{descriptor.proprietaryPort.value_or(DEFAULT_PROPRIETARY_PORT)};
}

} // namespace

ProtocolStrategy selectStrategy(const CameraDescriptor& descriptor) {
    switch (descriptor.protocolType) {
    case ProtocolType::Standards:
        return standardsFor(descriptor);
    case ProtocolType::Proprietary:
        return proprietaryFor(descriptor);
    case ProtocolType::Hybrid:
        return HybridStrategy{standardsFor(descriptor), proprietaryFor(descriptor)};
    case ProtocolType::Undetermined:
        break;
    }

    if (!descriptor.autoDetect) {
        return standardsFor(descriptor);
    }

    auto fallback = descriptor;
    fallback.ensureFallbackPorts();
    return AutoFallbackStrategy{standardsFor(descriptor), proprietaryFor(descriptor),
                                fallback.fallbackPorts};
}

std::string strategyName(const ProtocolStrategy& strategy) {
    return std::visit(Overloaded{
                          [](const StandardsStrategy&) { return std::string("standards"); },
                          [](const ProprietaryStrategy&) { return std::string("proprietary"); },
                          [](const HybridStrategy&) { return std::string("hybrid"); },
                          [](const AutoFallbackStrategy&) { return std::string("auto-fallback"); },
                      },
                      strategy);
}

} // namespace camlink::core
