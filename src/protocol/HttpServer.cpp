#include "backend/protocol/HttpServer.h"
#include "backend/protocol/HttpContext.h"
#include "backend/protocol/HttpRequest.h"
#include "backend/protocol/HttpResponse.h"
#include "backend/network/Buffer.h"
#include "backend/network/EventLoop.h"
#include "backend/network/TcpConnection.h"
#include "backend/common/Logger.h"

namespace backend {
namespace protocol {

namespace {

// Per-connection state kept in the TcpConnection context.
struct HttpSession {
    HttpContext context;
    // set once a response carrying "Connection: close" has been produced
    bool closing = false;
};

bool WantsClose(const HttpRequest& req) {
    const std::string connection = req.getHeader("Connection");
    if (HttpRequest::iequals(connection, "close")) {
        return true;
    }
    return req.getVersion() == HttpRequest::kHttp10 && !HttpRequest::iequals(connection, "Keep-Alive");
}

} // namespace

HttpServer::HttpServer(backend::network::EventLoop* loop,
                       const backend::network::InetAddress& listenAddr,
                       const std::string& name,
                       backend::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2));
}

bool HttpServer::start() {
    if (!server_.Start()) {
        LOG_ERROR << "HttpServer[" << server_.name() << "] failed to listen on " << server_.hostport();
        return false;
    }
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    return true;
}

void HttpServer::onConnection(const backend::network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(HttpSession());
    }
}

void HttpServer::onMessage(const backend::network::TcpConnectionPtr& conn,
                           backend::network::Buffer* buf) {
    HttpSession* session = std::any_cast<HttpSession>(conn->GetMutableContext());
    if (session == nullptr || session->closing) {
        buf->RetrieveAll();
        return;
    }

    // Drain every complete request in the buffer; pipelined requests are answered in order.
    while (buf->ReadableBytes() > 0) {
        if (!session->context.parseRequest(buf)) {
            LOG_DEBUG << "HttpServer: bad request from " << conn->peerAddress().toIpPort();
            HttpResponse response(true);
            response.setStatusCode(HttpResponse::k400BadRequest);
            response.setContentType("text/plain");
            response.setBody("Bad Request");
            session->closing = true;
            buf->RetrieveAll();
            sendResponse(conn, response);
            return;
        }
        if (!session->context.gotAll()) {
            return;
        }
        const bool close = onRequest(conn, session->context.request());
        session->context.reset();
        if (close) {
            session->closing = true;
            buf->RetrieveAll();
            return;
        }
    }
}

bool HttpServer::onRequest(const backend::network::TcpConnectionPtr& conn, const HttpRequest& req) {
    HttpResponse response(WantsClose(req));
    if (httpCallback_) {
        httpCallback_(req, &response);
    } else {
        response.setStatusCode(HttpResponse::k404NotFound);
    }
    if (response.statusCode() == HttpResponse::kUnknown) {
        response.setStatusCode(HttpResponse::k500InternalServerError);
    }

    sendResponse(conn, response);
    return response.closeConnection();
}

void HttpServer::sendResponse(const backend::network::TcpConnectionPtr& conn, const HttpResponse& response) {
    backend::network::Buffer buf;
    response.appendToBuffer(&buf);
    const bool close = response.closeConnection();

    if (responseDelaySec_ <= 0.0) {
        conn->Send(buf.RetrieveAllAsString());
        if (close) {
            conn->Shutdown();
        }
        return;
    }

    // Timers due at the same time fire in insertion order, so pipelined
    // responses still leave in request order.
    std::string data = buf.RetrieveAllAsString();
    conn->getLoop()->RunAfter(responseDelaySec_, [conn, data, close]() {
        conn->Send(data);
        if (close) {
            conn->Shutdown();
        }
    });
}

} // namespace protocol
} // namespace backend
