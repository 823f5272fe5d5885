#include "backend/responder/BackendResponder.h"
#include "backend/network/EventLoop.h"
#include "backend/common/Logger.h"
#include "HttpTestClient.h"

#include <csignal>
#include <cassert>
#include <sstream>
#include <string>
#include <thread>

using namespace backend::responder;
using namespace backend::network;
using namespace backend::common;
using namespace testing_support;

static void serveSome(EventLoop* loop, uint16_t port) {
    std::thread client([loop, port]() {
        assert(fetch(port, "GET", "/").status == 200);
        assert(fetch(port, "GET", "/anything").status == 200);
        assert(fetch(port, "GET", "/?x=1").status == 200);

        // keep-alive and a malformed request too
        int fd = connectTo(port);
        sendAll(fd, "GET /a HTTP/1.1\r\n\r\nGET /b HTTP/1.1\r\n\r\n");
        std::string pending;
        readResponse(fd, &pending);
        readResponse(fd, &pending);
        ::close(fd);

        fd = connectTo(port);
        sendAll(fd, "garbage\r\n\r\n");
        recvUntilClose(fd);
        ::close(fd);

        loop->QueueInLoop([loop]() { loop->Quit(); });
    });
    loop->Loop();
    client.join();
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger& logger = Logger::Instance();
    std::ostringstream captured;
    logger.SetColor(false);
    logger.SetLevel(LogLevel::INFO);

    // Default settings: nothing is logged while requests are served.
    {
        EventLoop loop;
        ResponderOptions opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        BackendResponder responder(&loop, opts);
        assert(responder.Start());

        logger.SetOutput(&captured);
        serveSome(&loop, responder.port());
        logger.SetOutput(nullptr);

        assert(responder.requestsServed() == 5);
        assert(captured.str().empty());
    }

    // With access_log one line per handled request.
    {
        captured.str("");
        EventLoop loop;
        ResponderOptions opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        opts.accessLog = true;
        BackendResponder responder(&loop, opts);
        assert(responder.Start());

        logger.SetOutput(&captured);
        serveSome(&loop, responder.port());
        logger.SetOutput(nullptr);

        const std::string out = captured.str();
        size_t lines = 0;
        for (char c : out) {
            if (c == '\n') ++lines;
        }
        assert(lines == 5);
        assert(out.find("GET /?x=1 -> 200") != std::string::npos);
        assert(out.find("GET /anything -> 200") != std::string::npos);
    }
    return 0;
}
