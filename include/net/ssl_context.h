#pragma once
#include "utils/noncopyable.h"
#include <openssl/ssl.h>
#include <string>

// 服务端 TLS 全局上下文，证书或私钥加载失败时构造函数抛出 std::runtime_error
class SslContext : NonCopyable{
public:
    SslContext(const std::string& cert_path, const std::string& key_path);
    ~SslContext();

    SSL_CTX* get() const { return ctx_; }
private:
    SSL_CTX* ctx_;
};
