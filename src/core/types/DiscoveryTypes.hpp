/**
 * @file DiscoveryTypes.hpp
 * @brief Discovery session, result, progress and classification types.
 *
 * This file defines the value types exchanged between the discovery adapters,
 * the protocol detector and the discovery coordinator.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace camlink::core {

/**
 * @brief Mechanism that produced a discovery result.
 */
enum class DiscoveryMethod : int {
    MulticastA = 0, ///< WS-Discovery search (UDP 3702)
    MulticastB = 1, ///< SSDP M-SEARCH (UDP 1900)
    MulticastC = 2, ///< mDNS service query (UDP 5353)
    PortScan = 3    ///< TCP connect scan
};

/**
 * @brief Converts a DiscoveryMethod to a human-readable string.
 * @param method The method to convert.
 * @return E.g. "ws-discovery", "ssdp", "mdns", "port-scan".
 */
std::string discoveryMethodToString(DiscoveryMethod method);

/**
 * @brief A single responding (host, port) found by an adapter.
 *
 * Immutable once created by the adapter that produced it.
 */
struct DiscoveryResult {
    std::string host;                               ///< IPv4 address of the responder
    uint16_t port{0};                               ///< Port that answered
    DiscoveryMethod method{DiscoveryMethod::PortScan}; ///< How the responder was found
    std::chrono::milliseconds responseTime{0};      ///< Time until the answer arrived
    bool valid{true};                               ///< False if the answer could not be parsed
    std::optional<std::string> error;               ///< Parse or transport error, if any
    std::chrono::system_clock::time_point timestamp; ///< When the result was produced

    bool operator==(const DiscoveryResult& other) const = default;
};

/**
 * @brief Phases of a discovery session.
 */
enum class DiscoveryPhase : int {
    Idle = 0,
    Multicast = 1,    ///< Phase 1: all multicast adapters
    PriorityScan = 2, ///< Phase 2: priority port set
    FullScan = 3,     ///< Phase 3: full port catalog
    Completed = 4,
    Cancelled = 5
};

std::string discoveryPhaseToString(DiscoveryPhase phase);

/**
 * @brief Lifecycle status of a discovery session.
 */
enum class DiscoveryStatus : int {
    Running = 0,
    Completed = 1,
    Cancelled = 2
};

std::string discoveryStatusToString(DiscoveryStatus status);

/**
 * @brief One run of the discovery coordinator against a subnet.
 *
 * Terminal once status is Completed or Cancelled.
 */
struct DiscoverySession {
    std::string id;                                   ///< Unique session identifier
    std::string subnet;                               ///< CIDR of the scanned subnet
    std::chrono::system_clock::time_point startTime;  ///< When the session started
    std::optional<std::chrono::system_clock::time_point> endTime; ///< When it ended
    DiscoveryStatus status{DiscoveryStatus::Running}; ///< Current status
    DiscoveryPhase phase{DiscoveryPhase::Idle};       ///< Last phase reached
    int devicesFound{0};                              ///< Cameras accepted into the roster
    int checksIssued{0};                              ///< Detector checks run in this session

    [[nodiscard]] bool isTerminal() const { return status != DiscoveryStatus::Running; }

    /**
     * @brief Returns the elapsed session time.
     * @return Duration from start to end (or to now while running).
     */
    [[nodiscard]] std::chrono::milliseconds duration() const;
};

/**
 * @brief Progress snapshot reported while a session runs.
 */
struct DiscoveryProgress {
    DiscoveryPhase phase{DiscoveryPhase::Idle}; ///< Phase currently running
    double percentComplete{0.0};                ///< Overall completion (0-100)
    int devicesFound{0};                        ///< Cameras found so far
    bool cancelled{false};                      ///< Whether cancellation was requested
};

/**
 * @brief Protocol family detected on a (host, port).
 */
enum class ProtocolKind : int {
    Standards = 0,   ///< ONVIF-style SOAP device management
    Media = 1,       ///< RTSP media endpoint
    Proprietary = 2, ///< Vendor binary command protocol
    Web = 3,         ///< Plain HTTP interface with camera markers
    Rejected = 4     ///< Not a camera, or no structural response
};

std::string protocolKindToString(ProtocolKind kind);
ProtocolKind protocolKindFromString(const std::string& str);

/**
 * @brief Outcome of classifying a (host, port).
 */
struct Classification {
    ProtocolKind kind{ProtocolKind::Rejected}; ///< Detected protocol family
    double confidence{0.0};                    ///< Confidence in [0, 1]
    std::string detail;                        ///< Evidence or failure explanation
    bool conclusive{true}; ///< False when the endpoint could not be assessed at all

    [[nodiscard]] bool isAccepted() const { return kind != ProtocolKind::Rejected; }

    /**
     * @brief Whether the endpoint answered and was judged not to be a camera.
     *
     * Only these rejections may be remembered; an unreachable or silent
     * endpoint says nothing about what it is.
     */
    [[nodiscard]] bool isConfirmedNonCamera() const { return !isAccepted() && conclusive; }

    /**
     * @brief Rejection for an endpoint that was unreachable or gave no structural answer.
     */
    static Classification inconclusive(std::string detail) {
        Classification c;
        c.detail = std::move(detail);
        c.conclusive = false;
        return c;
    }
};

/**
 * @brief Shared cooperative cancellation flag.
 *
 * Copies share the same flag; cancelling one cancels all.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    [[nodiscard]] bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace camlink::core
