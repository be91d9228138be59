#include "http/handlers.h"
#include "http/http_router.h"
#include "http/http_server.h"
#include "net/event_loop.h"
#include "security/credential_verifier.h"
#include "utils/async_logging.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/server_settings.h"
#include <csignal>
#include <filesystem>
#include <memory>
#include <system_error>

namespace {

std::unique_ptr<AsyncLogging> g_async_log;
EventLoop* g_main_loop = nullptr;

void asyncOutput(const char* msg, int len) {
    if (g_async_log) {
        g_async_log->append(msg, len);
    }
}

void asyncFlush() {
    if (g_async_log) {
        g_async_log->flush();
    }
}

// 只写原子变量，epoll_wait 被 EINTR 打断后 loop 自行退出
void onTerminate(int) {
    if (g_main_loop) {
        g_main_loop->quit();
    }
}

void setupLogging(const ServerSettings& settings) {
    Logger::setLogLevel(settings.log_level);
    if (settings.log_basename.empty()) {
        return;
    }
    off_t roll_size = static_cast<off_t>(settings.log_roll_size_mb) * 1024 * 1024;
    g_async_log = std::make_unique<AsyncLogging>(settings.log_basename, roll_size, settings.log_flush_interval_sec);
    g_async_log->start();
    Logger::setOutput(asyncOutput);
    Logger::setFlush(asyncFlush);
}

bool prepareUserGuideDir(const std::string& dir) {
    if (dir.empty()) {
        LOG_ERROR << "User guide path cannot be empty";
        return false;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    if (!std::filesystem::create_directories(dir, ec) && ec) {
        LOG_ERROR << "Failed to create user guide directory " << dir << ": " << ec.message();
        return false;
    }
    LOG_INFO << "Created user guide directory " << dir;
    return true;
}

void logEndpoints(const ServerSettings& settings, uint16_t http_port, uint16_t https_port) {
    LOG_INFO << "HTTP server listening on port " << http_port;
    if (https_port != 0) {
        LOG_INFO << "HTTPS server listening on port " << https_port;
    }
    LOG_INFO << "User guides directory: " << settings.user_guide_dir;
    LOG_INFO << "Configured user guide file: " << settings.user_guide_file;
    LOG_INFO << "Public document: " << settings.public_document;
    LOG_INFO << "Static directory: " << settings.static_dir;
    LOG_INFO << "Available endpoints:";
    LOG_INFO << "  GET /public/download     - Download the public document";
    LOG_INFO << "  GET /protected/download  - Download the configured user guide (Bearer token)";
    LOG_INFO << "  GET /download/userguide  - Same as /protected/download";
    LOG_INFO << "  GET /health              - Health check";
    LOG_INFO << "  GET /static/<path>       - Static files";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file = argc > 1 ? argv[1] : "application.properties";

    Config config;
    bool config_loaded = config.load(config_file);
    ServerSettings settings = ServerSettings::fromConfig(config);

    try {
        setupLogging(settings);
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to start logging: " << e.what();
        return 1;
    }

    if (!config_loaded) {
        LOG_WARN << "Config file " << config_file << " not found, using defaults";
    } else {
        LOG_INFO << "Loaded " << config.size() << " settings from " << config_file;
    }

    if (!prepareUserGuideDir(settings.user_guide_dir)) {
        Logger::setOutput(Logger::OutputFunc());
        Logger::setFlush(Logger::FlushFunc());
        g_async_log.reset();
        return 1;
    }

    // 对端重置后写 socket 不应杀死进程
    ::signal(SIGPIPE, SIG_IGN);

    int exit_code = 0;
    try {
        auto verifier = std::make_shared<StaticTokenVerifier>(settings.auth_token);
        DownloadHandlers handlers(settings, verifier);
        auto router = std::make_shared<HttpRouter>();
        handlers.registerRoutes(router.get());

        EventLoop loop;
        g_main_loop = &loop;
        ::signal(SIGINT, onTerminate);
        ::signal(SIGTERM, onTerminate);

        HttpServer http_server(&loop, "http", settings.port, settings.idle_timeout_sec,
                               settings.threads, router);
        http_server.start();

        std::unique_ptr<HttpServer> https_server;
        if (settings.ssl_enabled) {
            https_server = std::make_unique<HttpServer>(&loop, "https", settings.ssl_port,
                                                        settings.idle_timeout_sec, settings.threads, router);
            https_server->enableSsl(settings.ssl_cert_path, settings.ssl_key_path);
            https_server->start();
        }

        logEndpoints(settings, http_server.port(), https_server ? https_server->port() : 0);
        loop.loop();
        LOG_INFO << "Shutting down";

        https_server.reset();
    } catch (const std::exception& e) {
        LOG_ERROR << "Server failed: " << e.what();
        exit_code = 1;
    }
    g_main_loop = nullptr;

    Logger::setOutput(Logger::OutputFunc());
    Logger::setFlush(Logger::FlushFunc());
    g_async_log.reset();
    return exit_code;
}
