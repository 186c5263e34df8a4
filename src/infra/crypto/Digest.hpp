#pragma once

#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Message digests used by camera authentication schemes (OpenSSL EVP).
 */
class Digest {
public:
    /**
     * @brief Computes the MD5 digest of a string.
     * @return Lower-case hexadecimal digest (32 characters).
     */
    static std::string md5Hex(const std::string& input);

    /**
     * @brief Computes the raw SHA-1 digest of a byte sequence.
     * @return 20 digest bytes.
     */
    static std::vector<unsigned char> sha1(const std::vector<unsigned char>& input);

    /**
     * @brief Computes a Base64-encoded SHA-1 digest.
     */
    static std::string sha1Base64(const std::vector<unsigned char>& input);

    /**
     * @brief Computes an RFC 2617 digest response (no qop) for HTTP and RTSP.
     * @return Lower-case hexadecimal response value.
     */
    static std::string httpDigestResponse(const std::string& username, const std::string& realm,
                                          const std::string& password, const std::string& method,
                                          const std::string& uri, const std::string& nonce);

    /**
     * @brief Formats bytes as lower-case hexadecimal.
     */
    static std::string toHex(const std::vector<unsigned char>& bytes);
};

} // namespace camlink::infra
