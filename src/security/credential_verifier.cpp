#include "security/credential_verifier.h"
#include <openssl/crypto.h>
#include <utility>

StaticTokenVerifier::StaticTokenVerifier(std::string expected_token, std::string subject)
    : expected_token_(std::move(expected_token)), subject_(std::move(subject)) {}

std::optional<Principal> StaticTokenVerifier::verify(const std::string& credential) const {
    // 未配置令牌时拒绝一切，避免空串匹配空串
    if(expected_token_.empty() || credential.size() != expected_token_.size()){
        return std::nullopt;
    }
    // 常量时间比较，不通过耗时泄露前缀匹配长度
    if(CRYPTO_memcmp(credential.data(), expected_token_.data(), credential.size()) != 0){
        return std::nullopt;
    }
    return Principal{subject_};
}
