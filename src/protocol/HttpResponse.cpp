#include "backend/protocol/HttpResponse.h"
#include "backend/network/Buffer.h"

namespace backend {
namespace protocol {

namespace {

struct Reason {
    HttpResponse::HttpStatusCode code;
    const char* text;
};

const Reason kReasons[] = {
    {HttpResponse::k200Ok, "OK"},
    {HttpResponse::k400BadRequest, "Bad Request"},
    {HttpResponse::k404NotFound, "Not Found"},
    {HttpResponse::k500InternalServerError, "Internal Server Error"},
    {HttpResponse::k501NotImplemented, "Not Implemented"},
};

} // namespace

const char* HttpResponse::DefaultReason(HttpStatusCode code) {
    for (const Reason& r : kReasons) {
        if (r.code == code) {
            return r.text;
        }
    }
    return "";
}

void HttpResponse::appendToBuffer(backend::network::Buffer* output) const {
    std::string head;
    head.reserve(128 + 32 * fields_.size());
    head += "HTTP/1.1 ";
    head += std::to_string(static_cast<int>(status_));
    head += ' ';
    head += DefaultReason(status_);
    head += "\r\nContent-Length: ";
    head += std::to_string(body_.size());
    head += close_ ? "\r\nConnection: close\r\n" : "\r\nConnection: Keep-Alive\r\n";
    for (const auto& field : fields_) {
        head += field.first;
        head += ": ";
        head += field.second;
        head += "\r\n";
    }
    head += "\r\n";
    output->Append(head);
    output->Append(body_);
}

} // namespace protocol
} // namespace backend
