#pragma once

#include "relay/network/Buffer.h"

#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        k200Ok = 200,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k422UnprocessableEntity = 422,
        k500InternalServerError = 500,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(k200Ok), closeConnection_(close) {}

    // Any three-digit code is accepted; relayed upstream statuses pass through unchanged.
    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    // Empty means the standard reason phrase for the code.
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    // Replaces an existing field of the same name (case-insensitive).
    void setHeader(const std::string& key, const std::string& value);
    void addHeader(const std::string& key, const std::string& value) { headers_.emplace_back(key, value); }
    std::string getHeader(const std::string& key) const;
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }

    void setBody(std::string body) { body_ = std::move(body); }
    const std::string& body() const { return body_; }

    // Serializes status line, Connection, Content-Length, headers and body.
    // withBody=false keeps Content-Length but omits the payload (HEAD).
    void appendToBuffer(relay::network::Buffer* output, bool withBody = true) const;

    static const char* ReasonPhrase(int code);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace relay
