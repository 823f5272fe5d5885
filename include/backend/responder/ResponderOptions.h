#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace backend {
namespace common {
class Config;
} // namespace common

namespace responder {

// Startup-time settings of one backend instance. Never changed after Start().
struct ResponderOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8082;
    // body of every GET; empty means "BACKEND_<port>"
    std::string identifier;
    std::string contentType = "text/plain";
    int threads = 0;
    bool reusePort = false;
    int delayMs = 0;
    // empty disables the liveness path
    std::string healthPath;
    bool accessLog = false;
    double idleTimeoutSec = 0.0;
    double cleanupIntervalSec = 1.0;
    int maxConnections = 0;

    std::string EffectiveIdentifier() const;

    // Reads [global], [backend] and [connection]. Logs and returns nullopt on
    // values that are not numbers, overflow, or are out of range.
    static std::optional<ResponderOptions> FromConfig(const backend::common::Config& conf);

    static std::string DefaultIdentifier(uint16_t port);
};

} // namespace responder
} // namespace backend
