#pragma once

#include "backend/protocol/HttpRequest.h"

#include <cstddef>

namespace backend {
namespace network {
class Buffer;
} // namespace network

namespace protocol {

// Incremental HTTP/1.x request parser, one per connection. Feed it whatever
// bytes arrived; it consumes what it can and keeps its place between calls.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static const size_t kMaxHeaderBytes = 64 * 1024;
    static const size_t kMaxBodyBytes = 8 * 1024 * 1024;

    HttpContext()
        : state_(kExpectRequestLine) {}

    // Lines may end in CRLF or a bare LF.
    // return false if the input is malformed or exceeds the limits
    bool parseRequest(backend::network::Buffer* buf);

    bool gotAll() const { return state_ == kGotAll; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeaders(backend::network::Buffer* buf, bool* hasMore);
    bool beginBody();
    bool processChunkedBody(backend::network::Buffer* buf);
    void processFixedBody(backend::network::Buffer* buf);

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t headerBytes_{0};
    // first Content-Length seen; a later one must repeat it
    std::string contentLength_;
    bool sawContentLength_{false};

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
};

} // namespace protocol
} // namespace backend
