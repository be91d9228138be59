#include "utils/server_settings.h"

namespace {

uint16_t readPort(const Config& config, const std::string& key, uint16_t default_port) {
    int port = config.getInt(key, default_port);
    if (port <= 0 || port > 65535) {
        LOG_WARN << "Config: '" << key << "' = " << port << " is not a valid port, using " << default_port;
        return default_port;
    }
    return static_cast<uint16_t>(port);
}

int readNonNegative(const Config& config, const std::string& key, int default_value) {
    int value = config.getInt(key, default_value);
    if (value < 0) {
        LOG_WARN << "Config: '" << key << "' must not be negative, using " << default_value;
        return default_value;
    }
    return value;
}

} // namespace

ServerSettings ServerSettings::fromConfig(const Config& config) {
    ServerSettings s;
    s.user_guide_dir = config.getString("userguide.path", s.user_guide_dir);
    s.user_guide_file = config.getString("userguide.filename", s.user_guide_file);
    s.public_document = config.getString("public.document", s.public_document);
    s.static_dir = config.getString("static.path", s.static_dir);
    s.auth_token = config.getString("auth.static_token", s.auth_token);

    s.port = readPort(config, "server.port", kDefaultPort);
    s.threads = readNonNegative(config, "server.threads", s.threads);
    s.idle_timeout_sec = readNonNegative(config, "server.idle_timeout_sec", s.idle_timeout_sec);
    if (s.idle_timeout_sec == 0) {
        s.idle_timeout_sec = 60;
    }

    s.log_basename = config.getString("logging.basename", s.log_basename);
    s.log_level = Logger::parseLevel(config.getString("logging.level", "INFO"));
    s.log_roll_size_mb = readNonNegative(config, "logging.roll_size_mb", s.log_roll_size_mb);
    s.log_flush_interval_sec = readNonNegative(config, "logging.flush_interval_sec", s.log_flush_interval_sec);

    s.ssl_enabled = config.getBool("ssl.enabled", false);
    s.ssl_port = readPort(config, "ssl.port", kDefaultSslPort);
    s.ssl_cert_path = config.getString("ssl.cert_path");
    s.ssl_key_path = config.getString("ssl.key_path");
    return s;
}
