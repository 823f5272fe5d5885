#include "backend/protocol/HttpResponse.h"
#include "backend/network/Buffer.h"
#include "backend/common/Logger.h"
#include <cassert>
#include <string>

using namespace backend::protocol;
using namespace backend::network;
using namespace backend::common;

void testKeepAliveResponse() {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.setBody("BACKEND_8082");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string expected =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 12\r\n"
        "Connection: Keep-Alive\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "BACKEND_8082";
    assert(buf.RetrieveAllAsString() == expected);
    LOG_INFO << "Keep-Alive Response PASS";
}

void testCloseResponse() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k501NotImplemented);
    resp.setBody("Unsupported method ('POST')");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string out = buf.RetrieveAllAsString();
    assert(out.compare(0, 30, "HTTP/1.1 501 Not Implemented\r\n") == 0);
    assert(out.find("Connection: close\r\n") != std::string::npos);
    assert(out.find("Content-Length: 27\r\n") != std::string::npos);
    LOG_INFO << "Close Response PASS";
}

void testEmptyBody() {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k404NotFound);

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string out = buf.RetrieveAllAsString();
    assert(out.compare(0, 22, "HTTP/1.1 404 Not Found\r\n") == 0);
    assert(out.find("Content-Length: 0\r\n") != std::string::npos);
    assert(out.size() >= 4 && out.compare(out.size() - 4, 4, "\r\n\r\n") == 0);
    LOG_INFO << "Empty Body PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    assert(std::string(HttpResponse::DefaultReason(HttpResponse::k400BadRequest)) == "Bad Request");
    assert(std::string(HttpResponse::DefaultReason(HttpResponse::k501NotImplemented)) == "Not Implemented");
    testKeepAliveResponse();
    testCloseResponse();
    testEmptyBody();
    return 0;
}
