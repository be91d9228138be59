#pragma once
#include "utils/config.h"
#include "utils/logger.h"
#include <cstdint>
#include <string>

// 启动时由 Config 构造一次，之后只读，显式传给需要的组件
struct ServerSettings {
    static const uint16_t kDefaultPort = 8080;
    static const uint16_t kDefaultSslPort = 8443;

    // 用户手册
    std::string user_guide_dir = "./userguides";
    std::string user_guide_file = "user-guide.pdf";

    // 不经过校验的可信内容
    std::string public_document = "./public/user-guide.pdf";
    std::string static_dir = "./static";

    // 占位的静态 Bearer token，生产环境必须替换为真正的令牌校验
    std::string auth_token = "valid-oauth-token";

    uint16_t port = kDefaultPort;
    int threads = 0;
    int idle_timeout_sec = 60;

    // 为空时日志输出到 stdout
    std::string log_basename;
    Logger::LogLevel log_level = Logger::INFO;
    int log_roll_size_mb = 500;
    int log_flush_interval_sec = 3;

    bool ssl_enabled = false;
    uint16_t ssl_port = kDefaultSslPort;
    std::string ssl_cert_path;
    std::string ssl_key_path;

    static ServerSettings fromConfig(const Config& config);
};
