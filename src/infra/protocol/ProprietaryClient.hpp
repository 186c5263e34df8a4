#pragma once

#include "core/protocol/BinaryProtocolCodec.hpp"
#include "core/services/ITransport.hpp"
#include "core/types/CameraDescriptor.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace camlink::infra {

/**
 * @brief Authenticated session over the vendor binary protocol.
 *
 * Owns the TCP stream. Commands are serialised; every command payload
 * carries the session token. A malformed or overdue reply closes the
 * session, since later replies could no longer be matched to requests.
 */
class ProprietarySession {
public:
    ProprietarySession(std::unique_ptr<core::IByteStream> stream, core::BinaryProtocolCodec codec,
                       std::string token);
    ~ProprietarySession();

    ProprietarySession(const ProprietarySession&) = delete;
    ProprietarySession& operator=(const ProprietarySession&) = delete;

    [[nodiscard]] const std::string& token() const { return token_; }

    /**
     * @brief Sends a command and waits for its reply.
     * @param commandId Command to send.
     * @param params Command parameters (SessionID is added).
     * @param timeout Budget for the write and for the reply.
     * @return Reply payload.
     * @throws PayloadInvalidError if params cannot be serialized (nothing is sent).
     * @throws ProtocolError if the reply is malformed or reports failure.
     * @throws NetworkError if the stream fails.
     */
    nlohmann::json sendCommand(core::CommandId commandId, nlohmann::json params,
                               std::chrono::milliseconds timeout);

    /**
     * @brief Sends an extension command (id >= 2000).
     */
    nlohmann::json sendExtension(uint32_t commandId, nlohmann::json params,
                                 std::chrono::milliseconds timeout);

    /**
     * @brief Sends a keep-alive.
     * @return True if the camera acknowledged it.
     */
    bool keepAlive(std::chrono::milliseconds timeout);

    nlohmann::json systemInfo(std::chrono::milliseconds timeout);

    /**
     * @brief Lists recordings in a time range ("YYYY-MM-DD HH:MM:SS").
     */
    nlohmann::json listRecordings(const std::string& beginTime, const std::string& endTime,
                                  int channel, std::chrono::milliseconds timeout);

    nlohmann::json startPlayback(const std::string& fileName, int channel,
                                 std::chrono::milliseconds timeout);

    /**
     * @brief Sends a PTZ command (e.g. "DirectionUp", "ZoomTile").
     */
    nlohmann::json ptzControl(const std::string& command, int speed, int channel,
                              std::chrono::milliseconds timeout);

    [[nodiscard]] bool isOpen() const;
    void close();

private:
    nlohmann::json exchange(uint32_t commandId, nlohmann::json params,
                            std::chrono::milliseconds timeout);

    std::unique_ptr<core::IByteStream> stream_;
    core::BinaryProtocolCodec codec_;
    std::string token_;
    mutable std::mutex mutex_;
};

/**
 * @brief Opens vendor binary protocol sessions.
 */
class ProprietaryClient {
public:
    explicit ProprietaryClient(core::ITransportFactory& transport,
                               core::ProtocolConstants constants = {});

    /**
     * @brief Connects and performs the login handshake.
     *
     * The password is sent as the lower-case hex MD5 digest of the secret.
     *
     * @return Authenticated session.
     * @throws AuthenticationError if the camera rejects the credential.
     * @throws NetworkError if the camera is unreachable.
     * @throws ProtocolError if the camera answers with a malformed frame.
     */
    std::unique_ptr<ProprietarySession> login(const std::string& host, uint16_t port,
                                              const core::Credential& credential,
                                              std::chrono::milliseconds timeout);

    /**
     * @brief Writes one frame and reads one reply frame.
     * @throws FrameMalformedError, PayloadInvalidError, NetworkError.
     */
    static core::ProtocolFrame exchange(core::IByteStream& stream,
                                        const core::BinaryProtocolCodec& codec, uint32_t commandId,
                                        const nlohmann::json& payload,
                                        std::chrono::milliseconds timeout);

    /**
     * @brief Reads one complete frame from a stream.
     */
    static core::ProtocolFrame readFrame(core::IByteStream& stream,
                                         const core::BinaryProtocolCodec& codec,
                                         std::chrono::milliseconds timeout);

    [[nodiscard]] const core::BinaryProtocolCodec& codec() const { return codec_; }

private:
    core::ITransportFactory& transport_;
    core::BinaryProtocolCodec codec_;
};

} // namespace camlink::infra
