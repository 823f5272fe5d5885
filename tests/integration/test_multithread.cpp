#include "backend/protocol/HttpServer.h"
#include "backend/protocol/HttpRequest.h"
#include "backend/protocol/HttpResponse.h"
#include "backend/responder/BackendResponder.h"
#include "backend/network/EventLoop.h"
#include "backend/network/InetAddress.h"
#include "backend/common/Logger.h"
#include "HttpTestClient.h"

#include <atomic>
#include <csignal>
#include <cassert>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace backend::protocol;
using namespace backend::responder;
using namespace backend::network;
using namespace backend::common;
using namespace testing_support;

// Requests land on the worker loops, never on the accepting loop.
static void testHttpServerWorkers() {
    EventLoop loop;
    HttpServer server(&loop, InetAddress(0, true), "MT-HttpServer");

    std::mutex mu;
    std::set<std::thread::id> threads;
    const std::thread::id mainThread = std::this_thread::get_id();
    constexpr int kRequests = 6;

    server.setHttpCallback([&](const HttpRequest& req, HttpResponse* resp) {
        {
            std::lock_guard<std::mutex> lk(mu);
            threads.insert(std::this_thread::get_id());
        }
        resp->setStatusCode(HttpResponse::k200Ok);
        resp->setContentType("text/plain");
        resp->setBody(req.path());
    });
    server.setThreadNum(3);
    assert(server.start());
    const uint16_t port = server.port();

    std::thread client([&]() {
        for (int i = 0; i < kRequests; ++i) {
            const std::string path = "/r" + std::to_string(i);
            ParsedResponse resp = fetch(port, "GET", path);
            assert(resp.status == 200);
            assert(resp.body == path);
        }
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();

    assert(threads.size() == 3);
    assert(threads.count(mainThread) == 0);
    LOG_INFO << "HttpServer worker threads PASS";
}

// Concurrent clients against a threaded responder all get the identifier.
static void testConcurrentClients() {
    EventLoop loop;
    ResponderOptions opts;
    opts.host = "127.0.0.1";
    opts.port = 0;
    opts.identifier = "BACKEND_8084";
    opts.threads = 4;
    BackendResponder responder(&loop, opts);
    assert(responder.Start());
    const uint16_t port = responder.port();

    constexpr int kClients = 8;
    constexpr int kPerClient = 25;
    std::atomic<int> ok{0};

    std::thread driver([&]() {
        std::vector<std::thread> clients;
        for (int c = 0; c < kClients; ++c) {
            clients.emplace_back([&, c]() {
                int fd = connectTo(port);
                std::string pending;
                for (int i = 0; i < kPerClient; ++i) {
                    sendAll(fd, "GET /c" + std::to_string(c) + "/" + std::to_string(i) + " HTTP/1.1\r\nHost: x\r\n\r\n");
                    ParsedResponse resp = readResponse(fd, &pending);
                    if (resp.status == 200 && resp.body == "BACKEND_8084") {
                        ++ok;
                    }
                }
                ::close(fd);
            });
        }
        for (auto& t : clients) t.join();
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });

    loop.Loop();
    driver.join();

    assert(ok == kClients * kPerClient);
    assert(responder.requestsServed() == static_cast<uint64_t>(kClients * kPerClient));
    LOG_INFO << "Concurrent clients PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger::Instance().SetLevel(LogLevel::INFO);
    testHttpServerWorkers();
    testConcurrentClients();
    return 0;
}
