#include "backend/responder/BackendResponder.h"
#include "backend/responder/ResponderOptions.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"
#include "backend/common/Config.h"

#include <unistd.h>
#include <getopt.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

backend::network::EventLoop* g_loop = nullptr;

void HandleStopSignal(int) {
    if (g_loop) {
        g_loop->Quit();
    }
}

void PrintUsage(const char* prog) {
    std::printf("Usage: %s [-c config_file] [-p port] [-i identifier] [-C]\n", prog);
    std::printf("  -c  INI config file (built-in defaults if omitted)\n");
    std::printf("  -p  listen port, overrides [backend] port\n");
    std::printf("  -i  response body, overrides [backend] identifier\n");
    std::printf("  -C  check config and exit\n");
}

bool ParsePort(const char* text, int* port) {
    char* endp = nullptr;
    long v = std::strtol(text, &endp, 10);
    if (endp == text || *endp != '\0' || v < 0 || v > 65535) {
        return false;
    }
    *port = static_cast<int>(v);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace backend;

    std::string configFile;
    std::string identifierOverride;
    int portOverride = -1;
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:p:i:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'p':
                if (!ParsePort(optarg, &portOverride)) {
                    std::fprintf(stderr, "invalid port: %s\n", optarg);
                    return 1;
                }
                break;
            case 'i':
                identifierOverride = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile;
        return 1;
    }
    if (portOverride >= 0) {
        conf.SetString("backend", "port", std::to_string(portOverride));
    }
    if (!identifierOverride.empty()) {
        conf.SetString("backend", "identifier", identifierOverride);
    }

    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    auto options = responder::ResponderOptions::FromConfig(conf);
    if (!options) {
        LOG_ERROR << "Invalid configuration" << (configFile.empty() ? "" : " in " + configFile);
        return 1;
    }

    if (checkOnly) {
        std::printf("OK\n");
        return 0;
    }

    // A client that hangs up mid-write must not kill the process.
    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    responder::BackendResponder backendResponder(&loop, *options);
    if (!backendResponder.Start()) {
        LOG_ERROR << "Backend " << backendResponder.identifier() << " failed to start";
        return 1;
    }

    g_loop = &loop;
    ::signal(SIGINT, HandleStopSignal);
    ::signal(SIGTERM, HandleStopSignal);

    loop.Loop();

    g_loop = nullptr;
    LOG_INFO << "Backend " << backendResponder.identifier() << " stopped after "
             << backendResponder.requestsServed() << " requests";
    return 0;
}
