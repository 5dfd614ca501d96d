#pragma once

#include <cctype>
#include <cstddef>
#include <map>
#include <string>

namespace relay {
namespace protocol {

// Orders header names case-insensitively so lookups ignore case.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            const int ca = std::tolower(static_cast<unsigned char>(a[i]));
            const int cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions, kPatch, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any RFC 7230 token is accepted; unlisted ones map to kOther.
    bool setMethod(const char* start, const char* end) {
        methodString_.assign(start, end);
        if (methodString_.empty()) {
            method_ = kInvalid;
            return false;
        }
        for (char c : methodString_) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.' &&
                c != '!' && c != '#' && c != '$' && c != '%' && c != '&' && c != '\'' &&
                c != '*' && c != '+' && c != '^' && c != '`' && c != '|' && c != '~') {
                method_ = kInvalid;
                return false;
            }
        }
        if (methodString_ == "GET") method_ = kGet;
        else if (methodString_ == "POST") method_ = kPost;
        else if (methodString_ == "HEAD") method_ = kHead;
        else if (methodString_ == "PUT") method_ = kPut;
        else if (methodString_ == "DELETE") method_ = kDelete;
        else if (methodString_ == "OPTIONS") method_ = kOptions;
        else if (methodString_ == "PATCH") method_ = kPatch;
        else method_ = kOther;
        return true;
    }

    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodString_; }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    // Repeated fields are joined with ", ".
    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.pop_back();
        }
        auto it = headers_.find(field);
        if (it == headers_.end()) {
            headers_.emplace(std::move(field), std::move(value));
        } else {
            it->second += ", " + value;
        }
    }

    bool hasHeader(const std::string& field) const { return headers_.count(field) != 0; }

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it == headers_.end() ? std::string() : it->second;
    }

    void setHeader(const std::string& field, const std::string& value) { headers_[field] = value; }

    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodString_.swap(that.methodString_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    Method method_;
    Version version_;
    std::string methodString_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace relay
