#include "relay/service/ProxyRequest.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace relay::service;
using namespace relay::common;

static std::string decodeError(const std::string& contentType, const std::string& body) {
    ProxyRequest req;
    std::vector<ValidationIssue> issues;
    const bool ok = ProxyRequest::Decode(contentType, body, &req, &issues);
    assert(!ok);
    (void)ok;
    assert(!issues.empty());
    return RenderValidationErrors(issues);
}

void testValidBodies() {
    ProxyRequest req;
    std::vector<ValidationIssue> issues;

    assert(ProxyRequest::Decode("application/json", "{\"url\":\"https://s3/x\",\"key\":\"datasites/a.txt\"}", &req, &issues));
    assert(req.url == "https://s3/x");
    assert(req.key == "datasites/a.txt");

    assert(ProxyRequest::Decode("", "{\"url\":\"http://h/\"}", &req, &issues));
    assert(req.key == "unknown");

    assert(ProxyRequest::Decode("application/json; charset=utf-8", "{\"url\":\"u\",\"key\":null,\"extra\":[1,2]}", &req, &issues));
    assert(req.url == "u");
    assert(req.key == "unknown");

    assert(ProxyRequest::Decode("application/vnd.api+json", "{\"url\":\"\",\"key\":\"\"}", &req, &issues));
    assert(req.url.empty());
    assert(req.key.empty());
    LOG_INFO << "Valid Bodies PASS";
}

void testMediaTypes() {
    assert(ProxyRequest::IsJsonMediaType("application/json"));
    assert(ProxyRequest::IsJsonMediaType("Application/JSON ; charset=utf-8"));
    assert(ProxyRequest::IsJsonMediaType("application/problem+json"));
    assert(!ProxyRequest::IsJsonMediaType("text/plain"));
    assert(!ProxyRequest::IsJsonMediaType("application/x-www-form-urlencoded"));
    assert(!ProxyRequest::IsJsonMediaType("json"));
    LOG_INFO << "Media Types PASS";
}

void testValidationErrors() {
    assert(decodeError("application/json", "") ==
           "{\"detail\":[{\"type\":\"missing\",\"loc\":[\"body\"],\"msg\":\"Field required\"}]}");

    assert(decodeError("application/json", "{\"url\": }") ==
           "{\"detail\":[{\"type\":\"json_invalid\",\"loc\":[\"body\",8],\"msg\":\"JSON decode error\"}]}");

    assert(decodeError("application/json", "[\"https://x\"]") ==
           "{\"detail\":[{\"type\":\"model_attributes_type\",\"loc\":[\"body\"],"
           "\"msg\":\"Input should be a valid dictionary or object to extract fields from\"}]}");

    assert(decodeError("text/plain", "{\"url\":\"https://x\"}") ==
           "{\"detail\":[{\"type\":\"model_attributes_type\",\"loc\":[\"body\"],"
           "\"msg\":\"Input should be a valid dictionary or object to extract fields from\"}]}");

    assert(decodeError("application/json", "{\"key\":\"k\"}") ==
           "{\"detail\":[{\"type\":\"missing\",\"loc\":[\"body\",\"url\"],\"msg\":\"Field required\"}]}");

    assert(decodeError("application/json", "{\"url\":5,\"key\":[]}") ==
           "{\"detail\":["
           "{\"type\":\"string_type\",\"loc\":[\"body\",\"url\"],\"msg\":\"Input should be a valid string\"},"
           "{\"type\":\"string_type\",\"loc\":[\"body\",\"key\"],\"msg\":\"Input should be a valid string\"}]}");

    assert(decodeError("application/json", "{\"url\":null}") ==
           "{\"detail\":[{\"type\":\"string_type\",\"loc\":[\"body\",\"url\"],\"msg\":\"Input should be a valid string\"}]}");
    LOG_INFO << "Validation Errors PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testValidBodies();
    testMediaTypes();
    testValidationErrors();
    return 0;
}
