#include "backend/responder/BackendResponder.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"
#include "HttpTestClient.h"

#include <csignal>
#include <cassert>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace backend::responder;
using namespace backend::network;
using namespace backend::common;
using namespace testing_support;

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger::Instance().SetLevel(LogLevel::FATAL);

    EventLoop loop;
    const char* identifiers[] = {"BACKEND_8082", "BACKEND_8083", "BACKEND_8084"};
    std::vector<std::unique_ptr<BackendResponder>> responders;
    std::vector<uint16_t> ports;
    for (const char* id : identifiers) {
        ResponderOptions opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        opts.identifier = id;
        responders.emplace_back(new BackendResponder(&loop, opts));
        assert(responders.back()->Start());
        ports.push_back(responders.back()->port());
    }
    assert(ports[0] != ports[1] && ports[1] != ports[2] && ports[0] != ports[2]);

    // A second instance on a port already in use fails to start.
    {
        ResponderOptions clash;
        clash.host = "127.0.0.1";
        clash.port = ports[0];
        BackendResponder duplicate(&loop, clash);
        assert(!duplicate.Start());
    }

    // An unparsable host is rejected before any socket is bound.
    {
        ResponderOptions bad;
        bad.host = "not-an-ip";
        bad.port = 0;
        BackendResponder broken(&loop, bad);
        assert(broken.port() == 0);
        assert(!broken.Start());
        assert(broken.port() == 0);
    }

    std::thread client([&]() {
        // Interleave traffic; each port only ever answers with its own identifier.
        for (int round = 0; round < 10; ++round) {
            for (size_t i = 0; i < ports.size(); ++i) {
                ParsedResponse resp = fetch(ports[i], "GET", "/round/" + std::to_string(round));
                assert(resp.status == 200);
                assert(resp.body == identifiers[i]);
            }
        }
        // Hammer one instance; the others are unaffected.
        for (int i = 0; i < 30; ++i) {
            assert(fetch(ports[1], "GET", "/").body == "BACKEND_8083");
        }
        assert(fetch(ports[0], "GET", "/").body == "BACKEND_8082");
        assert(fetch(ports[2], "GET", "/").body == "BACKEND_8084");

        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();

    assert(responders[0]->requestsServed() == 11);
    assert(responders[1]->requestsServed() == 40);
    assert(responders[2]->requestsServed() == 11);
    return 0;
}
