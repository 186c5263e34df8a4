#include "infra/protocol/ProprietaryClient.hpp"

#include "core/types/Errors.hpp"
#include "infra/crypto/Digest.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

ProprietarySession::ProprietarySession(std::unique_ptr<core::IByteStream> stream,
                                       core::BinaryProtocolCodec codec, std::string token)
    : stream_(std::move(stream)), codec_(std::move(codec)), token_(std::move(token)) {}

ProprietarySession::~ProprietarySession() {
    close();
}

nlohmann::json ProprietarySession::exchange(uint32_t commandId, nlohmann::json params,
                                            std::chrono::milliseconds timeout) {
    std::lock_guard lock(mutex_);
    if (!stream_ || !stream_->isOpen()) {
        throw core::NetworkError("Proprietary session is closed");
    }

    auto payload = core::BinaryProtocolCodec::makeCommandPayload(token_, std::move(params));
    auto request = codec_.encode(commandId, payload);

    // A half-read or garbled reply leaves the stream out of step with the frames
    core::ProtocolFrame frame;
    try {
        stream_->write(request, timeout);
        frame = ProprietaryClient::readFrame(*stream_, codec_, timeout);
    } catch (const core::ProtocolError& e) {
        spdlog::warn("Closing vendor session {}: {}", token_, e.what());
        stream_->close();
        throw;
    } catch (const core::TimeoutError& e) {
        spdlog::warn("Closing vendor session {}: {}", token_, e.what());
        stream_->close();
        throw;
    }

    if (!codec_.isSuccess(frame.payload)) {
        throw core::ProtocolError(fmt::format("{} failed with Ret {}",
                                              core::commandIdToString(commandId),
                                              frame.payload["Ret"].dump()));
    }
    return frame.payload;
}

nlohmann::json ProprietarySession::sendCommand(core::CommandId commandId, nlohmann::json params,
                                               std::chrono::milliseconds timeout) {
    return exchange(static_cast<uint32_t>(commandId), std::move(params), timeout);
}

nlohmann::json ProprietarySession::sendExtension(uint32_t commandId, nlohmann::json params,
                                                 std::chrono::milliseconds timeout) {
    if (commandId < core::EXTENSION_COMMAND_BASE) {
        throw core::UnsupportedCommandError(
            fmt::format("{} is not an extension command", commandId));
    }
    return exchange(commandId, std::move(params), timeout);
}

bool ProprietarySession::keepAlive(std::chrono::milliseconds timeout) {
    try {
        sendCommand(core::CommandId::KeepAlive, {{"Name", "KeepAlive"}}, timeout);
        return true;
    } catch (const core::CamLinkError& e) {
        spdlog::debug("Keep-alive failed: {}", e.what());
        return false;
    }
}

nlohmann::json ProprietarySession::systemInfo(std::chrono::milliseconds timeout) {
    return sendCommand(core::CommandId::SystemInfo, {{"Name", "SystemInfo"}}, timeout);
}

nlohmann::json ProprietarySession::listRecordings(const std::string& beginTime,
                                                  const std::string& endTime, int channel,
                                                  std::chrono::milliseconds timeout) {
    nlohmann::json params;
    params["Name"] = "OPFileQuery";
    params["OPFileQuery"] = {{"BeginTime", beginTime},
                             {"EndTime", endTime},
                             {"Channel", channel},
                             {"Type", "h264"}};
    return sendCommand(core::CommandId::ListRecordings, std::move(params), timeout);
}

nlohmann::json ProprietarySession::startPlayback(const std::string& fileName, int channel,
                                                 std::chrono::milliseconds timeout) {
    nlohmann::json params;
    params["Name"] = "OPPlayBack";
    params["OPPlayBack"] = {{"Action", "Claim"},
                            {"Parameter", {{"FileName", fileName}, {"Channel", channel}}}};
    return sendCommand(core::CommandId::StartPlayback, std::move(params), timeout);
}

nlohmann::json ProprietarySession::ptzControl(const std::string& command, int speed, int channel,
                                              std::chrono::milliseconds timeout) {
    nlohmann::json params;
    params["Name"] = "OPPTZControl";
    params["OPPTZControl"] = {{"Command", command},
                              {"Parameter", {{"Channel", channel}, {"Step", speed}}}};
    return sendCommand(core::CommandId::PtzControl, std::move(params), timeout);
}

bool ProprietarySession::isOpen() const {
    std::lock_guard lock(mutex_);
    return stream_ && stream_->isOpen();
}

void ProprietarySession::close() {
    std::lock_guard lock(mutex_);
    if (stream_) {
        stream_->close();
    }
}

ProprietaryClient::ProprietaryClient(core::ITransportFactory& transport,
                                     core::ProtocolConstants constants)
    : transport_(transport), codec_(std::move(constants)) {}

core::ProtocolFrame ProprietaryClient::readFrame(core::IByteStream& stream,
                                                 const core::BinaryProtocolCodec& codec,
                                                 std::chrono::milliseconds timeout) {
    auto bytes = stream.readExactly(core::BinaryProtocolCodec::HEADER_SIZE, timeout);
    auto header = codec.parseHeader(bytes.data(), bytes.size());

    auto payload = stream.readExactly(header.payloadLength, timeout);
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    return codec.decodeFrame(bytes);
}

core::ProtocolFrame ProprietaryClient::exchange(core::IByteStream& stream,
                                                const core::BinaryProtocolCodec& codec,
                                                uint32_t commandId, const nlohmann::json& payload,
                                                std::chrono::milliseconds timeout) {
    stream.write(codec.encode(commandId, payload), timeout);
    return readFrame(stream, codec, timeout);
}

std::unique_ptr<ProprietarySession> ProprietaryClient::login(const std::string& host,
                                                             uint16_t port,
                                                             const core::Credential& credential,
                                                             std::chrono::milliseconds timeout) {
    auto stream = transport_.connect(host, port, timeout);

    auto payload = codec_.makeLoginPayload(credential.username, Digest::md5Hex(credential.secret));
    auto reply = exchange(*stream, codec_, static_cast<uint32_t>(core::CommandId::Login), payload,
                          timeout);

    std::string token;
    try {
        token = codec_.parseLoginResponse(reply.payload);
    } catch (const core::AuthenticationError&) {
        stream->close();
        spdlog::warn("Login to {}:{} as {} rejected", host, port, credential.username);
        throw;
    }

    spdlog::info("Logged in to {}:{} as {} (session {})", host, port, credential.username, token);
    return std::make_unique<ProprietarySession>(std::move(stream), codec_, std::move(token));
}

} // namespace camlink::infra
