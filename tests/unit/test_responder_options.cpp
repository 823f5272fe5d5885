#include "backend/responder/ResponderOptions.h"
#include "backend/common/Config.h"
#include "backend/common/Logger.h"

#include <cassert>

using namespace backend::responder;
using namespace backend::common;

int main() {
    Logger::Instance().SetLevel(LogLevel::FATAL);
    Config& conf = Config::Instance();

    // Defaults with an empty configuration.
    {
        conf.Clear();
        auto opts = ResponderOptions::FromConfig(conf);
        assert(opts);
        assert(opts->host == "0.0.0.0");
        assert(opts->port == 8082);
        assert(opts->EffectiveIdentifier() == "BACKEND_8082");
        assert(opts->contentType == "text/plain");
        assert(opts->threads == 0);
        assert(!opts->reusePort);
        assert(opts->delayMs == 0);
        assert(opts->healthPath.empty());
        assert(!opts->accessLog);
        assert(opts->idleTimeoutSec == 0.0);
        assert(opts->maxConnections == 0);
    }

    // Identifier follows the port unless set explicitly.
    {
        conf.Clear();
        conf.SetString("backend", "port", "8084");
        auto opts = ResponderOptions::FromConfig(conf);
        assert(opts && opts->EffectiveIdentifier() == "BACKEND_8084");

        conf.SetString("backend", "identifier", "custom-id");
        opts = ResponderOptions::FromConfig(conf);
        assert(opts && opts->EffectiveIdentifier() == "custom-id");
    }

    // Full configuration.
    {
        conf.Clear();
        assert(conf.LoadFromString(
            "[global]\nthreads = 3\n"
            "[backend]\nhost = 127.0.0.1\nport = 8083\nidentifier = BACKEND_8083\n"
            "content_type = text/plain; charset=utf-8\nreuse_port = 1\ndelay_ms = 100\n"
            "health_path = /health\naccess_log = 1\n"
            "[connection]\nidle_timeout_sec = 30\ncleanup_interval_sec = 2\nmax_connections = 64\n"));
        auto opts = ResponderOptions::FromConfig(conf);
        assert(opts);
        assert(opts->host == "127.0.0.1");
        assert(opts->port == 8083);
        assert(opts->identifier == "BACKEND_8083");
        assert(opts->contentType == "text/plain; charset=utf-8");
        assert(opts->threads == 3);
        assert(opts->reusePort);
        assert(opts->delayMs == 100);
        assert(opts->healthPath == "/health");
        assert(opts->accessLog);
        assert(opts->idleTimeoutSec == 30.0);
        assert(opts->cleanupIntervalSec == 2.0);
        assert(opts->maxConnections == 64);
    }

    // Rejected values.
    {
        const char* invalid[][3] = {
            {"backend", "port", "70000"},
            {"backend", "port", "-1"},
            {"backend", "port", "4294975378"},
            {"backend", "port", "80x"},
            {"backend", "delay_ms", "18446744073709551616"},
            {"backend", "access_log", "yes"},
            {"global", "threads", "4294967297"},
            {"connection", "cleanup_interval_sec", "soon"},
            {"backend", "delay_ms", "-5"},
            {"backend", "health_path", "health"},
            {"backend", "content_type", ""},
            {"global", "threads", "-2"},
            {"connection", "max_connections", "-1"},
            {"connection", "idle_timeout_sec", "-0.5"},
        };
        for (const auto& kv : invalid) {
            conf.Clear();
            conf.SetString(kv[0], kv[1], kv[2]);
            assert(!ResponderOptions::FromConfig(conf));
        }
    }

    conf.Clear();
    return 0;
}
