#pragma once

#include "core/types/CameraDescriptor.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Symmetric encryption of camera credentials at rest (libsodium secretbox).
 *
 * The key is generated on first use and persisted next to the configuration
 * with owner-only permissions.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    /**
     * @brief Constructs a SecureStorage.
     * @param keyPath Path to the key file (created if missing).
     */
    explicit SecureStorage(const std::filesystem::path& keyPath);

    /**
     * @brief Destructor. Zeroes key material.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    [[nodiscard]] bool isReady() const { return initialized_; }

    /**
     * @brief Encrypts plaintext.
     * @return Base64 of nonce followed by ciphertext, or empty string on failure.
     */
    std::string encrypt(const std::string& plaintext);

    /**
     * @brief Decrypts a value produced by encrypt().
     * @return Plaintext, or nullopt if the value is corrupt or was sealed with another key.
     */
    std::optional<std::string> decrypt(const std::string& ciphertext);

    /**
     * @brief Seals a credential into a single opaque string.
     */
    std::string sealCredential(const core::Credential& credential);

    /**
     * @brief Opens a credential sealed by sealCredential().
     */
    std::optional<core::Credential> openCredential(const std::string& sealed);

    /**
     * @brief Returns cryptographically random bytes.
     */
    static std::vector<unsigned char> randomBytes(size_t count);

private:
    bool loadOrGenerateKey();
    bool saveKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
    bool initialized_{false};
};

/**
 * @brief Encodes binary data as standard Base64.
 */
std::string base64Encode(const std::vector<unsigned char>& data);

/**
 * @brief Decodes standard Base64.
 * @return Decoded bytes, or empty if the input is not valid Base64.
 */
std::vector<unsigned char> base64Decode(const std::string& encoded);

} // namespace camlink::infra
