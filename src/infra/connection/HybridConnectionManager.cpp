#include "infra/connection/HybridConnectionManager.hpp"

#include "core/discovery/MulticastMessages.hpp"
#include "core/types/CameraPorts.hpp"
#include "core/types/Errors.hpp"
#include "infra/discovery/DiscoveryCache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace camlink::infra {

HybridConnectionManager::HybridConnectionManager(AsioContext& context,
                                                 core::ITransportFactory& transport,
                                                 core::IHttpClient& http,
                                                 ConnectionOptions options, DiscoveryCache* cache)
    : context_(context), transport_(transport), http_(http), options_(std::move(options)),
      cache_(cache), onvif_(http), rtsp_(transport), proprietary_(transport, options_.constants) {}

std::string HybridConnectionManager::resolveMediaUrl(const std::string& host,
                                                     uint16_t mediaPort) {
    auto url = rtsp_.resolveStreamUrl(host, mediaPort, core::CameraPorts::streamPaths(),
                                      options_.pathTimeout);
    if (!url) {
        spdlog::warn("No known stream path answered on {}:{}, media URL left unset", host,
                     mediaPort);
        return {};
    }
    return *url;
}

HybridConnectionManager::~HybridConnectionManager() {
    disconnectAll();
}

std::optional<StandardsHandle>
HybridConnectionManager::connectStandards(const std::string& host,
                                          const core::StandardsStrategy& strategy,
                                          const core::Credential& credential) {
    auto timeout = options_.pathTimeout;

    auto capabilities = onvif_.getCapabilities(host, strategy.controlPort, credential, timeout);
    if (capabilities) {
        StandardsHandle handle;
        handle.onvif = true;
        handle.controlPort = strategy.controlPort;
        handle.mediaPort = strategy.mediaPort;

        std::optional<std::string> uri;
        if (capabilities->mediaXAddr) {
            auto mediaPort = core::multicast::portFromUrl(*capabilities->mediaXAddr,
                                                          strategy.controlPort);
            uri = onvif_.getStreamUri(host, mediaPort,
                                      OnvifClient::pathFromUrl(*capabilities->mediaXAddr),
                                      credential, timeout);
        }
        if (uri) {
            handle.mediaPort = core::multicast::portFromUrl(*uri, strategy.mediaPort);
            handle.mediaUrl = *uri;
        } else {
            handle.mediaUrl = resolveMediaUrl(host, strategy.mediaPort);
        }

        spdlog::info("ONVIF path to {}:{} up, media {}", host, strategy.controlPort,
                     handle.mediaUrl);
        return handle;
    }

    auto rtsp = rtsp_.options(host, strategy.mediaPort, timeout);
    if (rtsp.success) {
        StandardsHandle handle;
        handle.mediaPort = strategy.mediaPort;
        handle.mediaUrl = resolveMediaUrl(host, strategy.mediaPort);
        spdlog::info("RTSP path to {}:{} up", host, strategy.mediaPort);
        return handle;
    }

    spdlog::debug("Standards path to {} (control {}, media {}) unavailable", host,
                  strategy.controlPort, strategy.mediaPort);
    return std::nullopt;
}

std::unique_ptr<ProprietarySession>
HybridConnectionManager::connectProprietary(const std::string& host,
                                            const core::ProprietaryStrategy& strategy,
                                            const core::Credential& credential) {
    try {
        return proprietary_.login(host, strategy.port, credential, options_.pathTimeout);
    } catch (const core::NetworkError& e) {
        spdlog::debug("Vendor path to {}:{} unavailable: {}", host, strategy.port, e.what());
    } catch (const core::ProtocolError& e) {
        spdlog::warn("Vendor path to {}:{} answered malformed data: {}", host, strategy.port,
                     e.what());
    }
    return nullptr;
}

void HybridConnectionManager::applyStandards(core::CameraDescriptor& descriptor,
                                             const StandardsHandle& handle) {
    if (handle.onvif) {
        descriptor.controlPort = handle.controlPort;
    }
    descriptor.mediaPort = handle.mediaPort;
}

void HybridConnectionManager::recordHits(const std::string& host,
                                         const std::optional<StandardsHandle>& standards,
                                         std::optional<uint16_t> proprietaryPort) {
    if (!cache_) {
        return;
    }
    if (standards) {
        if (standards->onvif) {
            cache_->recordHit(host, standards->controlPort, core::ProtocolKind::Standards);
        } else {
            cache_->recordHit(host, standards->mediaPort, core::ProtocolKind::Media);
        }
    }
    if (proprietaryPort) {
        cache_->recordHit(host, *proprietaryPort, core::ProtocolKind::Proprietary);
    }
}

std::shared_ptr<CameraSession>
HybridConnectionManager::openAutoFallback(core::CameraDescriptor& descriptor,
                                          const core::Credential& credential,
                                          const core::AutoFallbackStrategy& strategy) {
    const auto& host = descriptor.host;

    auto standardsFuture = std::async(std::launch::async, [&] {
        return connectStandards(host, strategy.standards, credential);
    });
    auto proprietaryFuture = std::async(std::launch::async, [&] {
        return connectProprietary(host, strategy.proprietary, credential);
    });

    std::optional<StandardsHandle> standards;
    std::unique_ptr<ProprietarySession> proprietary;
    std::exception_ptr authFailure;

    try {
        standards = standardsFuture.get();
    } catch (const core::AuthenticationError&) {
        authFailure = std::current_exception();
    }
    try {
        proprietary = proprietaryFuture.get();
    } catch (const core::AuthenticationError&) {
        if (!authFailure) {
            authFailure = std::current_exception();
        }
    }

    if (!standards && !proprietary && authFailure) {
        std::rethrow_exception(authFailure);
    }
    if (authFailure) {
        spdlog::warn("{}: one protocol path rejected the credential, keeping the other", host);
    }

    if (standards && proprietary) {
        descriptor.protocolType = core::ProtocolType::Hybrid;
    } else if (standards) {
        descriptor.protocolType = core::ProtocolType::Standards;
    } else if (proprietary) {
        descriptor.protocolType = core::ProtocolType::Proprietary;
    } else {
        for (auto port : strategy.fallbackPorts) {
            if (port == strategy.standards.controlPort || port == strategy.proprietary.port) {
                continue;
            }
            spdlog::debug("{}: trying fallback port {}", host, port);
            standards = connectStandards(host, core::StandardsStrategy{port, port}, credential);
            if (standards) {
                descriptor.protocolType = core::ProtocolType::Standards;
                break;
            }
        }
    }

    if (!standards && !proprietary) {
        throw core::ConnectionError(fmt::format("No protocol path to {} answered", host));
    }

    if (standards) {
        applyStandards(descriptor, *standards);
    }
    std::optional<uint16_t> proprietaryPort;
    if (proprietary) {
        descriptor.proprietaryPort = strategy.proprietary.port;
        proprietaryPort = strategy.proprietary.port;
    }
    recordHits(host, standards, proprietaryPort);

    return std::make_shared<CameraSession>(transport_, http_, descriptor, credential.username,
                                           std::move(standards), std::move(proprietary));
}

std::shared_ptr<CameraSession>
HybridConnectionManager::open(core::CameraDescriptor& descriptor,
                              const core::Credential& credential,
                              const core::ProtocolStrategy& strategy) {
    const auto& host = descriptor.host;

    return std::visit(
        core::Overloaded{
            [&](const core::StandardsStrategy& s) -> std::shared_ptr<CameraSession> {
                auto standards = connectStandards(host, s, credential);
                if (!standards) {
                    throw core::ConnectionError(
                        fmt::format("Standards path to {} unavailable", host));
                }
                applyStandards(descriptor, *standards);
                recordHits(host, standards, std::nullopt);
                return std::make_shared<CameraSession>(transport_, http_, descriptor,
                                                       credential.username,
                                                       std::move(standards), nullptr);
            },
            [&](const core::ProprietaryStrategy& s) -> std::shared_ptr<CameraSession> {
                auto session = connectProprietary(host, s, credential);
                if (!session) {
                    throw core::ConnectionError(
                        fmt::format("Vendor path to {}:{} unavailable", host, s.port));
                }
                descriptor.proprietaryPort = s.port;
                recordHits(host, std::nullopt, s.port);
                return std::make_shared<CameraSession>(transport_, http_, descriptor,
                                                       credential.username, std::nullopt,
                                                       std::move(session));
            },
            [&](const core::HybridStrategy& s) -> std::shared_ptr<CameraSession> {
                auto standards = connectStandards(host, s.standards, credential);
                if (!standards) {
                    throw core::ConnectionError(
                        fmt::format("Standards path of hybrid camera {} unavailable", host));
                }
                auto session = connectProprietary(host, s.proprietary, credential);
                if (!session) {
                    throw core::ConnectionError(
                        fmt::format("Vendor path of hybrid camera {} unavailable", host));
                }
                applyStandards(descriptor, *standards);
                descriptor.proprietaryPort = s.proprietary.port;
                recordHits(host, standards, s.proprietary.port);
                return std::make_shared<CameraSession>(transport_, http_, descriptor,
                                                       credential.username,
                                                       std::move(standards), std::move(session));
            },
            [&](const core::AutoFallbackStrategy& s) {
                return openAutoFallback(descriptor, credential, s);
            },
        },
        strategy);
}

std::shared_ptr<core::ICameraSession>
HybridConnectionManager::connect(core::CameraDescriptor& descriptor,
                                 const core::Credential& credential) {
    SessionKey key{descriptor.host, credential.username};
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(key);
        if (it != sessions_.end()) {
            if (it->second->isOpen()) {
                spdlog::debug("Reusing session to {} as {}", key.first, key.second);
                descriptor = it->second->descriptor();
                return it->second;
            }
            sessions_.erase(it);
        }
    }

    auto strategy = core::selectStrategy(descriptor);
    spdlog::info("Connecting to {} with {} strategy", descriptor.host,
                 core::strategyName(strategy));

    std::shared_ptr<CameraSession> session;
    try {
        session = open(descriptor, credential, strategy);
    } catch (const core::AuthenticationError& e) {
        spdlog::error("Authentication to {} failed: {}", descriptor.host, e.what());
        throw;
    }

    std::lock_guard lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(key, session);
    if (!inserted) {
        if (it->second->isOpen()) {
            // A concurrent connect for the same key finished first
            session->close();
            descriptor = it->second->descriptor();
            return it->second;
        }
        it->second = session;
    }

    spdlog::info("Connected to {} as {} ({})", descriptor.host, credential.username,
                 core::protocolTypeToString(descriptor.protocolType));
    return session;
}

std::future<std::pair<std::shared_ptr<core::ICameraSession>, core::CameraDescriptor>>
HybridConnectionManager::connectAsync(core::CameraDescriptor descriptor,
                                      core::Credential credential) {
    return context_.submit(
        [this, descriptor = std::move(descriptor), credential = std::move(credential)]() mutable {
            auto session = connect(descriptor, credential);
            return std::make_pair(session, descriptor);
        });
}

void HybridConnectionManager::disconnect(const std::shared_ptr<core::ICameraSession>& session) {
    if (!session) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find({session->descriptor().host, session->username()});
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
    }

    if (session->isOpen()) {
        session->close();
        spdlog::info("Disconnected from {}", session->descriptor().host);
    }
}

void HybridConnectionManager::disconnectAll() {
    std::map<SessionKey, std::shared_ptr<CameraSession>> sessions;
    {
        std::lock_guard lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [key, session] : sessions) {
        session->close();
    }
}

std::shared_ptr<CameraSession> HybridConnectionManager::find(const std::string& host,
                                                             const std::string& username) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find({host, username});
    if (it == sessions_.end() || !it->second->isOpen()) {
        return nullptr;
    }
    return it->second;
}

size_t HybridConnectionManager::activeSessions() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(),
                                             [](const auto& entry) {
                                                 return entry.second->isOpen();
                                             }));
}

} // namespace camlink::infra
