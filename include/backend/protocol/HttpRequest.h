#pragma once

#include <cctype>
#include <cstddef>
#include <cstring>
#include <map>
#include <string>
#include <utility>

namespace backend {
namespace protocol {

// One parsed request. Filled in by HttpContext.
class HttpRequest {
public:
    enum Method { kInvalid, kGet, kHead, kPost, kOther };
    enum Version { kUnknown, kHttp10, kHttp11 };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    // Any RFC 7230 token is a method; names other than GET, HEAD and POST
    // become kOther and keep their spelling in methodString().
    bool setMethod(const char* start, const char* end) {
        methodName_.assign(start, end);
        method_ = kInvalid;
        if (methodName_.empty()) {
            return false;
        }
        for (char c : methodName_) {
            if (!IsTokenChar(c)) {
                return false;
            }
        }
        if (methodName_ == "GET") {
            method_ = kGet;
        } else if (methodName_ == "HEAD") {
            method_ = kHead;
        } else if (methodName_ == "POST") {
            method_ = kPost;
        } else {
            method_ = kOther;
        }
        return true;
    }
    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodName_; }

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Starts with the '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    // [start, colon) is the name, (colon, end) the value with surrounding
    // whitespace dropped. A repeated name keeps the last value.
    void addHeader(const char* start, const char* colon, const char* end) {
        const char* first = colon + 1;
        const char* last = end;
        while (first < last && std::isspace(static_cast<unsigned char>(*first))) ++first;
        while (last > first && std::isspace(static_cast<unsigned char>(last[-1]))) --last;
        headers_[Lower(std::string(start, colon))].assign(first, last);
    }

    // Empty when absent. Names compare case-insensitively.
    std::string getHeader(const std::string& field) const {
        const auto it = headers_.find(Lower(field));
        return it == headers_.end() ? std::string() : it->second;
    }

    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodName_.swap(that.methodName_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

    static bool iequals(const std::string& a, const std::string& b) {
        return a.size() == b.size() && Lower(a) == Lower(b);
    }

private:
    static std::string Lower(std::string s) {
        for (char& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }

    static bool IsTokenChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               (c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr);
    }

    Method method_;
    Version version_;
    std::string methodName_;
    std::string path_;
    std::string query_;
    // Keyed by lower-cased field name.
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace backend
