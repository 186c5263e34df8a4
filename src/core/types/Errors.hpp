/**
 * @file Errors.hpp
 * @brief Exception hierarchy shared by discovery, protocol and connection code.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace camlink::core {

/**
 * @brief Base class for all CamLink errors.
 */
class CamLinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief No up, non-loopback IPv4 interface was found.
 */
class NoActiveInterfaceError : public CamLinkError {
public:
    NoActiveInterfaceError() : CamLinkError("No active network interface") {}
};

/**
 * @brief Transport level failure (timeout, refused, unreachable).
 *
 * Recovered locally by falling back to the next candidate port or protocol.
 */
class NetworkError : public CamLinkError {
public:
    using CamLinkError::CamLinkError;
};

class TimeoutError : public NetworkError {
public:
    using NetworkError::NetworkError;
};

class ConnectionRefusedError : public NetworkError {
public:
    using NetworkError::NetworkError;
};

/**
 * @brief The peer answered with something that is not a valid protocol message.
 *
 * The offending frame is dropped and logged, never retried verbatim.
 */
class ProtocolError : public CamLinkError {
public:
    using CamLinkError::CamLinkError;
};

/**
 * @brief Buffer too short, wrong magic, or declared length exceeds the data.
 */
class FrameMalformedError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

/**
 * @brief Frame payload is not valid JSON.
 */
class PayloadInvalidError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

class UnsupportedCommandError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

/**
 * @brief Credentials were rejected by the device.
 *
 * Surfaced to the caller immediately and never retried with the same credentials.
 */
class AuthenticationError : public CamLinkError {
public:
    using CamLinkError::CamLinkError;
};

/**
 * @brief No protocol path could be established to a camera.
 */
class ConnectionError : public CamLinkError {
public:
    using CamLinkError::CamLinkError;
};

/**
 * @brief SQLite open, prepare, bind or step failure in the cache store.
 */
class StorageError : public CamLinkError {
public:
    using CamLinkError::CamLinkError;
};

/**
 * @brief Device responded but is not a camera.
 */
class ClassificationError : public CamLinkError {
public:
    using CamLinkError::CamLinkError;
};

} // namespace camlink::core
