#pragma once

#include <map>
#include <string>

namespace backend {
namespace network {
class Buffer;
} // namespace network

namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k500InternalServerError = 500,
        k501NotImplemented = 501,
    };

    // close selects "Connection: close" over keep-alive.
    explicit HttpResponse(bool close) : status_(kUnknown), close_(close) {}

    void setStatusCode(HttpStatusCode code) { status_ = code; }
    HttpStatusCode statusCode() const { return status_; }
    bool closeConnection() const { return close_; }

    void setContentType(const std::string& type) { fields_["Content-Type"] = type; }
    void addHeader(const std::string& name, const std::string& value) { fields_[name] = value; }
    const std::map<std::string, std::string>& headers() const { return fields_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // Status line, then Content-Length and Connection, then the added
    // fields in name order.
    void appendToBuffer(backend::network::Buffer* output) const;

    // Empty for codes without a reason phrase.
    static const char* DefaultReason(HttpStatusCode code);

private:
    HttpStatusCode status_;
    bool close_;
    std::map<std::string, std::string> fields_;
    std::string body_;
};

} // namespace protocol
} // namespace backend
