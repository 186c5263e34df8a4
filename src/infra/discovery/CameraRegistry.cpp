#include "infra/discovery/CameraRegistry.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

void CameraRegistry::setRosterCallback(RosterCallback callback) {
    std::lock_guard lock(callbackMutex_);
    rosterCallback_ = std::move(callback);
}

core::ProtocolType CameraRegistry::mergeProtocolType(core::ProtocolType current,
                                                     core::ProtocolKind observed) {
    bool standards = observed == core::ProtocolKind::Standards ||
                     observed == core::ProtocolKind::Media;
    bool proprietary = observed == core::ProtocolKind::Proprietary;

    switch (current) {
    case core::ProtocolType::Undetermined:
        if (standards) {
            return core::ProtocolType::Standards;
        }
        if (proprietary) {
            return core::ProtocolType::Proprietary;
        }
        return current;
    case core::ProtocolType::Standards:
        return proprietary ? core::ProtocolType::Hybrid : current;
    case core::ProtocolType::Proprietary:
        return standards ? core::ProtocolType::Hybrid : current;
    case core::ProtocolType::Hybrid:
        return current;
    }
    return current;
}

std::shared_ptr<std::mutex> CameraRegistry::hostLock(const std::string& host) {
    std::lock_guard lock(mutex_);
    auto& entry = hostLocks_[host];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

std::optional<core::CameraDescriptor>
CameraRegistry::upsert(const std::string& host, uint16_t port,
                       const core::Classification& classification) {
    if (!classification.isAccepted()) {
        spdlog::debug("Not adding {}:{} to roster: {}", host, port, classification.detail);
        return std::nullopt;
    }

    auto perHost = hostLock(host);
    std::lock_guard hostGuard(*perHost);

    core::CameraDescriptor descriptor;
    bool isNew = false;
    {
        std::lock_guard lock(mutex_);
        auto it = cameras_.find(host);
        if (it != cameras_.end()) {
            descriptor = it->second;
        } else {
            descriptor = core::CameraDescriptor::forHost(host);
            isNew = true;
        }
    }

    auto before = descriptor;

    switch (classification.kind) {
    case core::ProtocolKind::Standards:
        descriptor.controlPort = port;
        break;
    case core::ProtocolKind::Media:
        descriptor.mediaPort = port;
        break;
    case core::ProtocolKind::Proprietary:
        descriptor.proprietaryPort = port;
        break;
    case core::ProtocolKind::Web:
        if (!descriptor.httpPort) {
            descriptor.httpPort = port;
        }
        break;
    case core::ProtocolKind::Rejected:
        break;
    }

    descriptor.protocolType = mergeProtocolType(descriptor.protocolType, classification.kind);
    descriptor.lastSeen = std::chrono::system_clock::now();

    {
        std::lock_guard lock(mutex_);
        cameras_[host] = descriptor;
    }

    auto withoutTimestamp = [](core::CameraDescriptor d) {
        d.lastSeen.reset();
        return d;
    };
    if (isNew || !(withoutTimestamp(before) == withoutTimestamp(descriptor))) {
        spdlog::info("Roster {} {} ({}, {} on port {})", isNew ? "added" : "updated", host,
                     core::protocolTypeToString(descriptor.protocolType),
                     core::protocolKindToString(classification.kind), port);
        notify(descriptor);
    }

    return descriptor;
}

void CameraRegistry::update(const core::CameraDescriptor& descriptor) {
    auto perHost = hostLock(descriptor.host);
    std::lock_guard hostGuard(*perHost);
    {
        std::lock_guard lock(mutex_);
        cameras_[descriptor.host] = descriptor;
    }
    notify(descriptor);
}

bool CameraRegistry::remove(const std::string& host) {
    std::lock_guard lock(mutex_);
    return cameras_.erase(host) > 0;
}

std::optional<core::CameraDescriptor> CameraRegistry::find(const std::string& host) const {
    std::lock_guard lock(mutex_);
    auto it = cameras_.find(host);
    if (it == cameras_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CameraRegistry::contains(const std::string& host) const {
    std::lock_guard lock(mutex_);
    return cameras_.count(host) > 0;
}

std::vector<core::CameraDescriptor> CameraRegistry::roster() const {
    std::lock_guard lock(mutex_);
    std::vector<core::CameraDescriptor> result;
    result.reserve(cameras_.size());
    for (const auto& [host, descriptor] : cameras_) {
        result.push_back(descriptor);
    }
    return result;
}

size_t CameraRegistry::size() const {
    std::lock_guard lock(mutex_);
    return cameras_.size();
}

void CameraRegistry::notify(const core::CameraDescriptor& descriptor) {
    RosterCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = rosterCallback_;
    }
    if (callback) {
        callback(descriptor);
    }
}

} // namespace camlink::infra
