/**
 * @file BinaryProtocolCodec.hpp
 * @brief Framing and login handshake of the vendor binary command protocol.
 *
 * Wire layout of a frame:
 * @code
 * offset 0  : magic constant, 4 bytes, big-endian
 * offset 4  : command id, 4 bytes, little-endian
 * offset 8  : payload length N, 4 bytes, little-endian
 * offset 12 : reserved, 4 bytes, zero
 * offset 16 : N bytes of UTF-8 JSON
 * @endcode
 */

#pragma once

#include "core/protocol/CommandId.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief Values that differ between firmware families.
 */
struct ProtocolConstants {
    uint32_t magic{0xFF010000};         ///< Frame magic, written big-endian
    int successCode{100};               ///< "Ret" value signalling success
    std::string loginType{"DVRIP-Web"}; ///< "LoginType" sent on login
    size_t maxPayloadSize{1024 * 1024}; ///< Largest accepted payload
};

/**
 * @brief Decoded 16-byte frame header.
 */
struct FrameHeader {
    uint32_t magic{0};
    uint32_t commandId{0};
    uint32_t payloadLength{0};
    uint32_t reserved{0};
};

/**
 * @brief A decoded frame. Immutable once constructed.
 */
struct ProtocolFrame {
    uint32_t commandId{0};
    nlohmann::json payload;
};

/**
 * @brief Encodes and decodes vendor protocol frames.
 *
 * Stateless apart from its constants, safe to share between threads.
 */
class BinaryProtocolCodec {
public:
    static constexpr size_t HEADER_SIZE = 16;

    explicit BinaryProtocolCodec(ProtocolConstants constants = {});

    /**
     * @brief Serializes a payload into a frame.
     * @param commandId Catalog command or extension id.
     * @param payload JSON payload.
     * @return Header followed by the UTF-8 JSON bytes.
     * @throws UnsupportedCommandError if the id is neither catalog nor extension.
     * @throws FrameMalformedError if the payload exceeds maxPayloadSize.
     * @throws PayloadInvalidError if a string in the payload is not valid UTF-8.
     */
    [[nodiscard]] std::vector<uint8_t> encode(uint32_t commandId,
                                              const nlohmann::json& payload) const;
    [[nodiscard]] std::vector<uint8_t> encode(CommandId commandId,
                                              const nlohmann::json& payload) const;

    /**
     * @brief Decodes the payload of a frame.
     * @param bytes Received buffer, starting at the header.
     * @return Parsed JSON payload.
     * @throws FrameMalformedError on short buffer, magic mismatch or bad length.
     * @throws PayloadInvalidError if the payload is not JSON.
     */
    [[nodiscard]] nlohmann::json decode(const std::vector<uint8_t>& bytes) const;

    /**
     * @brief Decodes command id and payload of a frame.
     * @see decode
     */
    [[nodiscard]] ProtocolFrame decodeFrame(const std::vector<uint8_t>& bytes) const;

    /**
     * @brief Validates and parses a header.
     *
     * Checks size, magic and the payload cap. Does not check that the
     * payload bytes are present.
     *
     * @param data Pointer to at least HEADER_SIZE bytes.
     * @param size Number of readable bytes.
     * @return Parsed header.
     * @throws FrameMalformedError on any violation.
     */
    [[nodiscard]] FrameHeader parseHeader(const uint8_t* data, size_t size) const;

    /**
     * @brief Builds the login payload.
     * @param username Account name.
     * @param passwordDigest Lower-case hex MD5 digest of the secret.
     * @return {EncryptType, LoginType, PassWord, UserName}.
     */
    [[nodiscard]] nlohmann::json makeLoginPayload(const std::string& username,
                                                  const std::string& passwordDigest) const;

    /**
     * @brief Extracts the session token from a login response.
     * @param payload Decoded login response.
     * @return Session token.
     * @throws AuthenticationError if Ret differs from the success code.
     * @throws PayloadInvalidError if Ret or SessionID is missing.
     */
    [[nodiscard]] std::string parseLoginResponse(const nlohmann::json& payload) const;

    /**
     * @brief Attaches the session token to a command payload.
     * @param sessionToken Token returned by login.
     * @param params Command parameters (object), merged into the result.
     * @return Payload carrying "SessionID".
     */
    [[nodiscard]] static nlohmann::json makeCommandPayload(const std::string& sessionToken,
                                                           nlohmann::json params = nlohmann::json::object());

    /**
     * @brief Checks a command response for the success code.
     * @param payload Decoded response.
     * @return True if Ret equals the success code (or is absent).
     */
    [[nodiscard]] bool isSuccess(const nlohmann::json& payload) const;

    [[nodiscard]] const ProtocolConstants& constants() const { return constants_; }

private:
    ProtocolConstants constants_;
};

} // namespace camlink::core
