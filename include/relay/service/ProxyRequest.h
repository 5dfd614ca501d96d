#pragma once

#include "relay/common/Json.h"

#include <string>
#include <vector>

namespace relay {
namespace service {

// One body validation failure, reported to the client as an entry of a 422 "detail" list.
struct ValidationIssue {
    std::string type;                         // json_invalid, missing, string_type, ...
    std::vector<relay::common::JsonValue> loc;  // path into the request, strings and numbers
    std::string msg;
};

// Body of POST /proxy-download.
struct ProxyRequest {
    std::string url;
    std::string key{"unknown"};

    // Decodes the JSON body. contentType is the request's Content-Type (may be empty);
    // a non-JSON media type means the body is not parsed. Returns false and fills
    // *issues when the body does not describe a request.
    static bool Decode(const std::string& contentType,
                       const std::string& body,
                       ProxyRequest* out,
                       std::vector<ValidationIssue>* issues);

    static bool IsJsonMediaType(const std::string& contentType);
};

// {"detail":[{"type":...,"loc":[...],"msg":...}, ...]}
std::string RenderValidationErrors(const std::vector<ValidationIssue>& issues);

} // namespace service
} // namespace relay
