#pragma once

#include "core/protocol/BinaryProtocolCodec.hpp"
#include "core/services/IConnectionManager.hpp"
#include "core/services/IHttpClient.hpp"
#include "core/services/ITransport.hpp"
#include "core/types/ProtocolStrategy.hpp"
#include "infra/connection/CameraSession.hpp"
#include "infra/network/AsioContext.hpp"
#include "infra/network/RtspClient.hpp"
#include "infra/protocol/OnvifClient.hpp"
#include "infra/protocol/ProprietaryClient.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace camlink::infra {

class DiscoveryCache;

struct ConnectionOptions {
    std::chrono::milliseconds pathTimeout{3000}; ///< Budget of each protocol path attempt
    core::ProtocolConstants constants;
};

/**
 * @brief Connects to cameras over the standards path, the vendor path, or both.
 *
 * The strategy is chosen once per descriptor (selectStrategy) and dispatched
 * with std::visit. Undetermined cameras get both paths tried in parallel;
 * if neither answers the descriptor's fallback ports are walked with the
 * standards path. Authentication failures are never retried.
 *
 * Live sessions are cached by (host, username) until disconnected. A reused
 * session writes its resolved descriptor back to the caller.
 *
 * The media URL is the one GetStreamUri reports. Without it, well-known
 * stream paths are tried with RTSP DESCRIBE; if none exists the URL stays
 * empty.
 */
class HybridConnectionManager : public core::IConnectionManager {
public:
    /**
     * @brief Constructs a HybridConnectionManager.
     * @param context Worker pool for connectAsync.
     * @param transport Factory used for RTSP and vendor connections.
     * @param http Client used for ONVIF requests.
     * @param options Path timeout and vendor protocol constants.
     * @param cache Discovery cache that learns from successful connects (may be null).
     */
    HybridConnectionManager(AsioContext& context, core::ITransportFactory& transport,
                            core::IHttpClient& http, ConnectionOptions options = {},
                            DiscoveryCache* cache = nullptr);
    ~HybridConnectionManager() override;

    std::shared_ptr<core::ICameraSession> connect(core::CameraDescriptor& descriptor,
                                                  const core::Credential& credential) override;

    /**
     * @brief Runs connect() on the worker pool.
     * @return Future of the session paired with the updated descriptor.
     */
    std::future<std::pair<std::shared_ptr<core::ICameraSession>, core::CameraDescriptor>>
    connectAsync(core::CameraDescriptor descriptor, core::Credential credential);

    void disconnect(const std::shared_ptr<core::ICameraSession>& session) override;

    void disconnectAll();

    /**
     * @brief Returns the cached open session for a key, if any.
     */
    [[nodiscard]] std::shared_ptr<CameraSession> find(const std::string& host,
                                                      const std::string& username) const;

    [[nodiscard]] size_t activeSessions() const;

private:
    using SessionKey = std::pair<std::string, std::string>;

    std::optional<StandardsHandle> connectStandards(const std::string& host,
                                                    const core::StandardsStrategy& strategy,
                                                    const core::Credential& credential);
    std::unique_ptr<ProprietarySession>
    connectProprietary(const std::string& host, const core::ProprietaryStrategy& strategy,
                       const core::Credential& credential);

    std::shared_ptr<CameraSession> open(core::CameraDescriptor& descriptor,
                                        const core::Credential& credential,
                                        const core::ProtocolStrategy& strategy);
    std::shared_ptr<CameraSession> openAutoFallback(core::CameraDescriptor& descriptor,
                                                    const core::Credential& credential,
                                                    const core::AutoFallbackStrategy& strategy);

    std::string resolveMediaUrl(const std::string& host, uint16_t mediaPort);

    static void applyStandards(core::CameraDescriptor& descriptor, const StandardsHandle& handle);
    void recordHits(const std::string& host, const std::optional<StandardsHandle>& standards,
                    std::optional<uint16_t> proprietaryPort);

    AsioContext& context_;
    core::ITransportFactory& transport_;
    core::IHttpClient& http_;
    ConnectionOptions options_;
    DiscoveryCache* cache_;
    OnvifClient onvif_;
    RtspClient rtsp_;
    ProprietaryClient proprietary_;
    std::map<SessionKey, std::shared_ptr<CameraSession>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace camlink::infra
