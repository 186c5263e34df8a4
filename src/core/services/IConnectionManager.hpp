/**
 * @file IConnectionManager.hpp
 * @brief Interfaces for live camera sessions and the manager that opens them.
 */

#pragma once

#include "core/types/CameraDescriptor.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace camlink::core {

/**
 * @brief An authenticated connection to one camera.
 *
 * Holds the standards handle, the vendor protocol handle, or both.
 */
class ICameraSession {
public:
    virtual ~ICameraSession() = default;

    virtual const CameraDescriptor& descriptor() const = 0;
    virtual const std::string& username() const = 0;

    /**
     * @brief Media URL for the video-rendering collaborator.
     * @return RTSP URL, or nullopt when only the vendor path is live.
     */
    virtual std::optional<std::string> mediaUrl() const = 0;

    /**
     * @brief Vendor protocol session token.
     * @return Token, or nullopt when only the standards path is live.
     */
    virtual std::optional<std::string> sessionToken() const = 0;

    virtual bool hasStandards() const = 0;
    virtual bool hasProprietary() const = 0;

    /**
     * @brief Checks the live handles.
     * @param timeout Time budget of the check.
     * @return True if every live handle answered.
     */
    virtual bool checkHealth(std::chrono::milliseconds timeout) = 0;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

/**
 * @brief Opens and tracks camera sessions.
 */
class IConnectionManager {
public:
    virtual ~IConnectionManager() = default;

    /**
     * @brief Connects to a camera.
     * @param descriptor Camera to connect to (protocol type and ports updated).
     * @param credential Credential to authenticate with.
     * @return Live session, possibly shared with an earlier connect.
     * @throws ConnectionError if no protocol path could be established.
     * @throws AuthenticationError if the camera rejected the credential.
     */
    virtual std::shared_ptr<ICameraSession> connect(CameraDescriptor& descriptor,
                                                    const Credential& credential) = 0;

    /**
     * @brief Closes a session and evicts it. Idempotent.
     */
    virtual void disconnect(const std::shared_ptr<ICameraSession>& session) = 0;
};

} // namespace camlink::core
