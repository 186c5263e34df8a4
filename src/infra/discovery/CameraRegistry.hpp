#pragma once

#include "core/types/CameraDescriptor.hpp"
#include "core/types/DiscoveryTypes.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Live roster of discovered cameras keyed by host.
 *
 * Writes for the same host are serialised; different hosts update
 * concurrently. Protocol type resolution only moves forward
 * (Undetermined, then Standards or Proprietary, then Hybrid). Rejected
 * hosts are never stored.
 */
class CameraRegistry {
public:
    using RosterCallback = std::function<void(const core::CameraDescriptor&)>;

    /**
     * @brief Sets the callback invoked for every new or changed descriptor.
     */
    void setRosterCallback(RosterCallback callback);

    /**
     * @brief Merges a classification into the roster.
     * @param host Host that was classified.
     * @param port Port that was classified.
     * @param classification Detector outcome.
     * @return Updated descriptor, or nullopt if the classification was a rejection.
     */
    std::optional<core::CameraDescriptor> upsert(const std::string& host, uint16_t port,
                                                 const core::Classification& classification);

    /**
     * @brief Replaces a descriptor (e.g. after the connection manager resolved its ports).
     */
    void update(const core::CameraDescriptor& descriptor);

    bool remove(const std::string& host);

    [[nodiscard]] std::optional<core::CameraDescriptor> find(const std::string& host) const;
    [[nodiscard]] bool contains(const std::string& host) const;

    /**
     * @brief Snapshot of all descriptors ordered by host.
     */
    [[nodiscard]] std::vector<core::CameraDescriptor> roster() const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Combines the current protocol type with newly observed evidence.
     */
    static core::ProtocolType mergeProtocolType(core::ProtocolType current,
                                                core::ProtocolKind observed);

private:
    std::shared_ptr<std::mutex> hostLock(const std::string& host);
    void notify(const core::CameraDescriptor& descriptor);

    std::map<std::string, core::CameraDescriptor> cameras_;
    std::map<std::string, std::shared_ptr<std::mutex>> hostLocks_;
    RosterCallback rosterCallback_;
    mutable std::mutex mutex_;
    std::mutex callbackMutex_;
};

} // namespace camlink::infra
