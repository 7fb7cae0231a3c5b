#pragma once

#include "common/status_or.hpp"
#include "core/session/session_record.hpp"

#include <cstdint>
#include <string>

namespace vault {
namespace core {

struct TokenPair {
    std::string access_token;
    std::string refresh_token;
    std::int64_t expires_in = 0; // access token 有效期 (秒)
};

// 令牌签发接口: 生成令牌对, 并从令牌推导稳定的会话ID
class TokenIssuer {
public:
    virtual ~TokenIssuer() = default;

    virtual vault::common::StatusOr<TokenPair> GenerateTokenPair(const UserSnapshot& user,
                                                                  std::int64_t expires_in) = 0;
    // 相同的令牌总是得到相同的会话ID
    virtual std::string SessionIdFromToken(const std::string& token) const = 0;
};

// 基于 OpenSSL 的默认实现: 随机令牌 + SHA-256 派生ID
class OpenSslTokenIssuer : public TokenIssuer {
public:
    explicit OpenSslTokenIssuer(std::string fingerprint_salt = "");

    vault::common::StatusOr<TokenPair> GenerateTokenPair(const UserSnapshot& user,
                                                          std::int64_t expires_in) override;
    std::string SessionIdFromToken(const std::string& token) const override;

    // 令牌指纹, 持久层保存它而不是明文令牌用于审计
    std::string Fingerprint(const std::string& token) const;

private:
    std::string fingerprint_salt_;
};

// 生成 bytes 字节随机数的十六进制串
vault::common::StatusOr<std::string> RandomHex(std::size_t bytes);
// SHA-256 十六进制摘要
std::string Sha256Hex(const std::string& data);

} // namespace core
} // namespace vault
