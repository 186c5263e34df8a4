#include "infra/crypto/Digest.hpp"

#include "infra/crypto/SecureStorage.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace camlink::infra {

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::vector<unsigned char> compute(const EVP_MD* algorithm, const unsigned char* data,
                                   size_t size) {
    std::unique_ptr<EVP_MD_CTX, MdContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    if (EVP_DigestInit_ex(ctx.get(), algorithm, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("Digest computation failed");
    }

    digest.resize(length);
    return digest;
}

} // namespace

std::string Digest::md5Hex(const std::string& input) {
    return toHex(compute(EVP_md5(), reinterpret_cast<const unsigned char*>(input.data()),
                         input.size()));
}

std::vector<unsigned char> Digest::sha1(const std::vector<unsigned char>& input) {
    return compute(EVP_sha1(), input.data(), input.size());
}

std::string Digest::sha1Base64(const std::vector<unsigned char>& input) {
    return base64Encode(sha1(input));
}

std::string Digest::httpDigestResponse(const std::string& username, const std::string& realm,
                                       const std::string& password, const std::string& method,
                                       const std::string& uri, const std::string& nonce) {
    auto ha1 = md5Hex(username + ":" + realm + ":" + password);
    auto ha2 = md5Hex(method + ":" + uri);
    return md5Hex(ha1 + ":" + nonce + ":" + ha2);
}

std::string Digest::toHex(const std::vector<unsigned char>& bytes) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        hex.push_back(DIGITS[b >> 4]);
        hex.push_back(DIGITS[b & 0x0F]);
    }
    return hex;
}

} // namespace camlink::infra
