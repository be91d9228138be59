#include "net/ssl_context.h"
#include <openssl/err.h>
#include <stdexcept>

namespace {

std::string lastSslError(const std::string& what){
    char err_buf[256] = {0};
    unsigned long code = ERR_get_error();
    if(code != 0){
        ERR_error_string_n(code, err_buf, sizeof(err_buf));
    }
    ERR_clear_error();
    return what + (code != 0 ? ": " + std::string(err_buf) : std::string());
}

} // namespace

SslContext::SslContext(const std::string& cert_path, const std::string& key_path)
    : ctx_(SSL_CTX_new(TLS_server_method())){
    if(!ctx_){
        throw std::runtime_error(lastSslError("SSL_CTX_new failed"));
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    // 输出缓冲区会移动，重试 SSL_write 时地址可能不同
    SSL_CTX_set_mode(ctx_, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    // Session ID Context 用于会话复用
    static const unsigned char kSessionIdContext[] = "guide_server";
    SSL_CTX_set_session_id_context(ctx_, kSessionIdContext, sizeof(kSessionIdContext) - 1);

    if(SSL_CTX_use_certificate_chain_file(ctx_, cert_path.c_str()) <= 0){
        SSL_CTX_free(ctx_);
        throw std::runtime_error(lastSslError("cannot load certificate " + cert_path));
    }
    if(SSL_CTX_use_PrivateKey_file(ctx_, key_path.c_str(), SSL_FILETYPE_PEM) <= 0){
        SSL_CTX_free(ctx_);
        throw std::runtime_error(lastSslError("cannot load private key " + key_path));
    }
    if(!SSL_CTX_check_private_key(ctx_)){
        SSL_CTX_free(ctx_);
        throw std::runtime_error(lastSslError("private key does not match the certificate"));
    }
}

SslContext::~SslContext(){
    SSL_CTX_free(ctx_);
}
