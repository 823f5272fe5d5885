#include "backend/responder/ResponderOptions.h"
#include "backend/common/Config.h"
#include "backend/common/Logger.h"

namespace backend {
namespace responder {

namespace {

bool ReadInt(const backend::common::Config& conf, const char* section, const char* key, int* out) {
    if (conf.LookupInt(section, key, out)) {
        return true;
    }
    LOG_ERROR << "[" << section << "] " << key << " is not a valid integer: " << conf.GetString(section, key);
    return false;
}

bool ReadDouble(const backend::common::Config& conf, const char* section, const char* key, double* out) {
    if (conf.LookupDouble(section, key, out)) {
        return true;
    }
    LOG_ERROR << "[" << section << "] " << key << " is not a valid number: " << conf.GetString(section, key);
    return false;
}

} // namespace

std::string ResponderOptions::DefaultIdentifier(uint16_t port) {
    return "BACKEND_" + std::to_string(port);
}

std::string ResponderOptions::EffectiveIdentifier() const {
    return identifier.empty() ? DefaultIdentifier(port) : identifier;
}

std::optional<ResponderOptions> ResponderOptions::FromConfig(const backend::common::Config& conf) {
    ResponderOptions opts;

    opts.host = conf.GetString("backend", "host", opts.host);
    int port = opts.port;
    if (!ReadInt(conf, "backend", "port", &port)) {
        return std::nullopt;
    }
    if (port < 0 || port > 65535) {
        LOG_ERROR << "[backend] port out of range: " << port;
        return std::nullopt;
    }
    opts.port = static_cast<uint16_t>(port);

    opts.identifier = conf.GetString("backend", "identifier", "");
    opts.contentType = conf.GetString("backend", "content_type", opts.contentType);
    if (opts.contentType.empty()) {
        LOG_ERROR << "[backend] content_type must not be empty";
        return std::nullopt;
    }
    int reusePort = 0;
    if (!ReadInt(conf, "backend", "reuse_port", &reusePort)) {
        return std::nullopt;
    }
    opts.reusePort = reusePort != 0;

    if (!ReadInt(conf, "backend", "delay_ms", &opts.delayMs)) {
        return std::nullopt;
    }
    if (opts.delayMs < 0) {
        LOG_ERROR << "[backend] delay_ms must be >= 0, got " << opts.delayMs;
        return std::nullopt;
    }

    opts.healthPath = conf.GetString("backend", "health_path", "");
    if (!opts.healthPath.empty() && opts.healthPath[0] != '/') {
        LOG_ERROR << "[backend] health_path must start with '/': " << opts.healthPath;
        return std::nullopt;
    }
    int accessLog = 0;
    if (!ReadInt(conf, "backend", "access_log", &accessLog)) {
        return std::nullopt;
    }
    opts.accessLog = accessLog != 0;

    if (!ReadInt(conf, "global", "threads", &opts.threads)) {
        return std::nullopt;
    }
    if (opts.threads < 0) {
        LOG_ERROR << "[global] threads must be >= 0, got " << opts.threads;
        return std::nullopt;
    }

    if (!ReadDouble(conf, "connection", "idle_timeout_sec", &opts.idleTimeoutSec) ||
        !ReadDouble(conf, "connection", "cleanup_interval_sec", &opts.cleanupIntervalSec) ||
        !ReadInt(conf, "connection", "max_connections", &opts.maxConnections)) {
        return std::nullopt;
    }
    if (opts.idleTimeoutSec < 0.0 || opts.maxConnections < 0) {
        LOG_ERROR << "[connection] idle_timeout_sec and max_connections must be >= 0";
        return std::nullopt;
    }
    return opts;
}

} // namespace responder
} // namespace backend
