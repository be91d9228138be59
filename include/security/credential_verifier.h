#pragma once
#include <optional>
#include <string>

// 通过校验的调用方
struct Principal {
    std::string subject;
};

// 可替换的凭据校验能力，下载管线只依赖这个接口
class CredentialVerifier{
public:
    virtual ~CredentialVerifier() = default;

    // 返回调用方身份，凭据无效时返回 std::nullopt
    virtual std::optional<Principal> verify(const std::string& credential) const = 0;
};

// 与单个静态令牌比较，仅作为占位实现；生产环境应换成令牌签发/内省方案
class StaticTokenVerifier : public CredentialVerifier{
public:
    explicit StaticTokenVerifier(std::string expected_token, std::string subject = "static-token-client");

    std::optional<Principal> verify(const std::string& credential) const override;

private:
    const std::string expected_token_;
    const std::string subject_;
};
