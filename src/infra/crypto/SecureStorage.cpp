#include "infra/crypto/SecureStorage.hpp"

#include <nlohmann/json.hpp>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace camlink::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t MAC_SIZE = crypto_secretbox_MACBYTES;

} // namespace

SecureStorage::SecureStorage(const std::filesystem::path& keyPath) : keyPath_(keyPath) {
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed, credentials cannot be stored");
        return;
    }

    key_.resize(KEY_SIZE);
    initialized_ = loadOrGenerateKey();
}

SecureStorage::~SecureStorage() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

bool SecureStorage::loadOrGenerateKey() {
    if (std::filesystem::exists(keyPath_)) {
        std::ifstream file(keyPath_, std::ios::binary);
        file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
        if (file.gcount() == static_cast<std::streamsize>(KEY_SIZE)) {
            spdlog::debug("Loaded credential key from {}", keyPath_.string());
            return true;
        }
        spdlog::warn("Credential key {} is truncated, stored credentials become unreadable",
                     keyPath_.string());
    }

    randombytes_buf(key_.data(), KEY_SIZE);
    return saveKey();
}

bool SecureStorage::saveKey() {
    std::error_code ec;
    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Cannot write credential key {}", keyPath_.string());
        return false;
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();

    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 ec);
    if (ec) {
        spdlog::warn("Cannot restrict permissions of {}: {}", keyPath_.string(), ec.message());
    }

    spdlog::info("Generated credential key {}", keyPath_.string());
    return true;
}

std::string SecureStorage::encrypt(const std::string& plaintext) {
    if (!initialized_) {
        spdlog::error("SecureStorage not initialized");
        return {};
    }

    std::vector<unsigned char> combined(NONCE_SIZE + MAC_SIZE + plaintext.size());
    randombytes_buf(combined.data(), NONCE_SIZE);

    if (crypto_secretbox_easy(combined.data() + NONCE_SIZE,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              plaintext.size(), combined.data(), key_.data()) != 0) {
        spdlog::error("Encryption failed");
        return {};
    }

    return base64Encode(combined);
}

std::optional<std::string> SecureStorage::decrypt(const std::string& ciphertext) {
    if (!initialized_) {
        spdlog::error("SecureStorage not initialized");
        return std::nullopt;
    }

    auto combined = base64Decode(ciphertext);
    if (combined.size() < NONCE_SIZE + MAC_SIZE) {
        spdlog::warn("Sealed value too short");
        return std::nullopt;
    }

    std::string plaintext(combined.size() - NONCE_SIZE - MAC_SIZE, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()),
                                   combined.data() + NONCE_SIZE, combined.size() - NONCE_SIZE,
                                   combined.data(), key_.data()) != 0) {
        spdlog::warn("Sealed value failed authentication");
        return std::nullopt;
    }

    return plaintext;
}

std::string SecureStorage::sealCredential(const core::Credential& credential) {
    nlohmann::json j;
    j["username"] = credential.username;
    j["secret"] = credential.secret;
    auto plaintext = j.dump();
    auto sealed = encrypt(plaintext);
    sodium_memzero(plaintext.data(), plaintext.size());
    return sealed;
}

std::optional<core::Credential> SecureStorage::openCredential(const std::string& sealed) {
    auto plaintext = decrypt(sealed);
    if (!plaintext) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(*plaintext, nullptr, false);
    sodium_memzero(plaintext->data(), plaintext->size());
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Sealed credential is not a credential record");
        return std::nullopt;
    }

    core::Credential credential;
    credential.username = j.value("username", "");
    credential.secret = j.value("secret", "");
    return credential;
}

std::vector<unsigned char> SecureStorage::randomBytes(size_t count) {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
    std::vector<unsigned char> bytes(count);
    randombytes_buf(bytes.data(), count);
    return bytes;
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return {};
    }

    size_t encodedLen = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encodedLen, '\0');
    sodium_bin2base64(encoded.data(), encodedLen, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    // encoded_len counts the terminator
    while (!encoded.empty() && encoded.back() == '\0') {
        encoded.pop_back();
    }
    return encoded;
}

std::vector<unsigned char> base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    std::vector<unsigned char> decoded(encoded.size());
    size_t decodedLen = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(), " \r\n",
                          &decodedLen, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return {};
    }

    decoded.resize(decodedLen);
    return decoded;
}

} // namespace camlink::infra
