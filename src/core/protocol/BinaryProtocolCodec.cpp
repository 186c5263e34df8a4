#include "core/protocol/BinaryProtocolCodec.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace camlink::core {

namespace {

void writeLittleEndian(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void writeBigEndian(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t readLittleEndian(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint32_t readBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // namespace

BinaryProtocolCodec::BinaryProtocolCodec(ProtocolConstants constants)
    : constants_(std::move(constants)) {}

std::vector<uint8_t> BinaryProtocolCodec::encode(uint32_t commandId,
                                                 const nlohmann::json& payload) const {
    if (!isSupportedCommand(commandId)) {
        throw UnsupportedCommandError(fmt::format("Unsupported command id {}", commandId));
    }

    std::string body;
    try {
        body = payload.dump();
    } catch (const nlohmann::json::exception& e) {
        throw PayloadInvalidError(std::string("Payload cannot be serialized: ") + e.what());
    }
    if (body.size() > constants_.maxPayloadSize) {
        throw FrameMalformedError(fmt::format("Payload of {} bytes exceeds limit of {}",
                                              body.size(), constants_.maxPayloadSize));
    }

    std::vector<uint8_t> frame;
    frame.reserve(HEADER_SIZE + body.size());
    writeBigEndian(frame, constants_.magic);
    writeLittleEndian(frame, commandId);
    writeLittleEndian(frame, static_cast<uint32_t>(body.size()));
    writeLittleEndian(frame, 0);
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

std::vector<uint8_t> BinaryProtocolCodec::encode(CommandId commandId,
                                                 const nlohmann::json& payload) const {
    return encode(static_cast<uint32_t>(commandId), payload);
}

FrameHeader BinaryProtocolCodec::parseHeader(const uint8_t* data, size_t size) const {
    if (data == nullptr || size < HEADER_SIZE) {
        throw FrameMalformedError(
            fmt::format("Frame too short: {} bytes, need {}", size, HEADER_SIZE));
    }

    FrameHeader header;
    header.magic = readBigEndian(data);
    header.commandId = readLittleEndian(data + 4);
    header.payloadLength = readLittleEndian(data + 8);
    header.reserved = readLittleEndian(data + 12);

    if (header.magic != constants_.magic) {
        throw FrameMalformedError(fmt::format("Magic mismatch: got {:#010x}, expected {:#010x}",
                                              header.magic, constants_.magic));
    }
    if (header.payloadLength > constants_.maxPayloadSize) {
        throw FrameMalformedError(fmt::format("Declared payload length {} exceeds limit of {}",
                                              header.payloadLength, constants_.maxPayloadSize));
    }
    return header;
}

ProtocolFrame BinaryProtocolCodec::decodeFrame(const std::vector<uint8_t>& bytes) const {
    auto header = parseHeader(bytes.data(), bytes.size());

    size_t available = bytes.size() - HEADER_SIZE;
    if (header.payloadLength > available) {
        throw FrameMalformedError(fmt::format("Declared payload length {} exceeds {} available",
                                              header.payloadLength, available));
    }

    auto begin = bytes.begin() + HEADER_SIZE;
    std::string body(begin, begin + header.payloadLength);

    // Some firmware pads the payload with a trailing NUL
    while (!body.empty() && (body.back() == '\0' || body.back() == '\n')) {
        body.pop_back();
    }

    ProtocolFrame frame;
    frame.commandId = header.commandId;
    try {
        frame.payload = body.empty() ? nlohmann::json::object() : nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw PayloadInvalidError(std::string("Payload is not valid JSON: ") + e.what());
    }
    return frame;
}

nlohmann::json BinaryProtocolCodec::decode(const std::vector<uint8_t>& bytes) const {
    return decodeFrame(bytes).payload;
}

nlohmann::json BinaryProtocolCodec::makeLoginPayload(const std::string& username,
                                                     const std::string& passwordDigest) const {
    return nlohmann::json{{"EncryptType", "MD5"},
                          {"LoginType", constants_.loginType},
                          {"PassWord", passwordDigest},
                          {"UserName", username}};
}

std::string BinaryProtocolCodec::parseLoginResponse(const nlohmann::json& payload) const {
    if (!payload.is_object() || !payload.contains("Ret") || !payload["Ret"].is_number_integer()) {
        throw PayloadInvalidError("Login response carries no numeric Ret field");
    }

    int ret = payload["Ret"].get<int>();
    if (ret != constants_.successCode) {
        throw AuthenticationError(fmt::format("Login rejected with code {}", ret));
    }

    if (!payload.contains("SessionID")) {
        throw PayloadInvalidError("Login response carries no SessionID");
    }

    const auto& session = payload["SessionID"];
    if (session.is_string()) {
        return session.get<std::string>();
    }
    if (session.is_number_integer()) {
        return fmt::format("{:#010x}", session.get<uint32_t>());
    }
    throw PayloadInvalidError("SessionID has unexpected type");
}

nlohmann::json BinaryProtocolCodec::makeCommandPayload(const std::string& sessionToken,
                                                       nlohmann::json params) {
    nlohmann::json payload = params.is_object() ? std::move(params) : nlohmann::json::object();
    payload["SessionID"] = sessionToken;
    return payload;
}

bool BinaryProtocolCodec::isSuccess(const nlohmann::json& payload) const {
    if (!payload.is_object() || !payload.contains("Ret")) {
        return true;
    }
    return payload["Ret"].is_number_integer() && payload["Ret"].get<int>() == constants_.successCode;
}

} // namespace camlink::core
