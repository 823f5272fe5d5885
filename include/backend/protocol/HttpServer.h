#pragma once

#include "backend/network/TcpServer.h"
#include "backend/common/noncopyable.h"
#include <functional>

namespace backend {
namespace protocol {

class HttpRequest;
class HttpResponse;

// HTTP/1.x on top of TcpServer. Keep-alive and pipelined requests are
// answered in arrival order on each connection.
class HttpServer : backend::common::noncopyable {
public:
    using HttpCallback = std::function<void(const HttpRequest&, HttpResponse*)>;

    HttpServer(backend::network::EventLoop* loop,
               const backend::network::InetAddress& listenAddr,
               const std::string& name,
               backend::network::TcpServer::Option option = backend::network::TcpServer::kNoReusePort);

    const std::string& hostport() const { return server_.hostport(); }
    uint16_t port() const { return server_.port(); }

    void setHttpCallback(const HttpCallback& cb) {
        httpCallback_ = cb;
    }

    void setThreadNum(int numThreads) {
        server_.SetThreadNum(numThreads);
    }

    void setMaxConnections(int maxConnections) {
        server_.SetMaxConnections(maxConnections);
    }

    void setIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec) {
        server_.SetIdleTimeout(idleTimeoutSec, cleanupIntervalSec);
    }

    // Responses are written this long after the request was parsed (0: immediately).
    void setResponseDelay(double delaySec) { responseDelaySec_ = delaySec; }

    bool start();

private:
    void onConnection(const backend::network::TcpConnectionPtr& conn);
    void onMessage(const backend::network::TcpConnectionPtr& conn,
                   backend::network::Buffer* buf);
    // Returns true if the connection is to be closed after this response.
    bool onRequest(const backend::network::TcpConnectionPtr&, const HttpRequest&);
    void sendResponse(const backend::network::TcpConnectionPtr& conn, const HttpResponse& response);

    backend::network::TcpServer server_;
    HttpCallback httpCallback_;
    double responseDelaySec_{0.0};
};

} // namespace protocol
} // namespace backend
