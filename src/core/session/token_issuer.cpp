#include "core/session/token_issuer.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace vault {
namespace core {

namespace {

constexpr std::size_t kTokenBytes = 32;
constexpr std::size_t kSessionIdLength = 32; // 会话ID取摘要前32个十六进制字符

std::string ToHex(const unsigned char* data, std::size_t length) {
    std::stringstream ss;
    for (std::size_t i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace

vault::common::StatusOr<std::string> RandomHex(std::size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        return vault::common::Status::Internal("RAND_bytes failed");
    }
    return vault::common::StatusOr<std::string>(ToHex(buffer.data(), buffer.size()));
}

std::string Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        return "";
    }
    return ToHex(digest, digest_length);
}

OpenSslTokenIssuer::OpenSslTokenIssuer(std::string fingerprint_salt)
    : fingerprint_salt_(std::move(fingerprint_salt)) {}

vault::common::StatusOr<TokenPair> OpenSslTokenIssuer::GenerateTokenPair(const UserSnapshot& /*user*/,
                                                                          std::int64_t expires_in) {
    auto access = RandomHex(kTokenBytes);
    if (!access.IsOk()) {
        return access.GetStatus();
    }
    auto refresh = RandomHex(kTokenBytes);
    if (!refresh.IsOk()) {
        return refresh.GetStatus();
    }
    TokenPair pair;
    pair.access_token = std::move(access).Value();
    pair.refresh_token = std::move(refresh).Value();
    pair.expires_in = expires_in;
    return vault::common::StatusOr<TokenPair>(std::move(pair));
}

std::string OpenSslTokenIssuer::SessionIdFromToken(const std::string& token) const {
    return Sha256Hex(token).substr(0, kSessionIdLength);
}

std::string OpenSslTokenIssuer::Fingerprint(const std::string& token) const {
    return Sha256Hex(token + fingerprint_salt_);
}

} // namespace core
} // namespace vault
