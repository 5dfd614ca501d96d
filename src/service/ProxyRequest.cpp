#include "relay/service/ProxyRequest.h"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace relay {
namespace service {

using relay::common::JsonValue;

namespace {

const char* const kFieldRequired = "Field required";
const char* const kStringType = "Input should be a valid string";

ValidationIssue MakeIssue(const char* type, std::vector<JsonValue> loc, const char* msg) {
    ValidationIssue issue;
    issue.type = type;
    issue.loc = std::move(loc);
    issue.msg = msg;
    return issue;
}

std::vector<JsonValue> BodyLoc(const std::string& field) {
    std::vector<JsonValue> loc;
    loc.push_back(JsonValue::MakeString("body"));
    if (!field.empty()) loc.push_back(JsonValue::MakeString(field));
    return loc;
}

std::string RenderLocPart(const JsonValue& v) {
    if (v.type() == JsonValue::Type::kNumber) {
        const double d = v.asNumber();
        char buf[64];
        if (std::floor(d) == d && std::fabs(d) < 1e15) {
            std::snprintf(buf, sizeof buf, "%lld", static_cast<long long>(d));
        } else {
            std::snprintf(buf, sizeof buf, "%.17g", d);
        }
        return buf;
    }
    return "\"" + relay::common::JsonEscape(v.asString()) + "\"";
}

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

bool ProxyRequest::IsJsonMediaType(const std::string& contentType) {
    std::string mediaType = Trim(contentType.substr(0, contentType.find(';')));
    for (auto& c : mediaType) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    const size_t slash = mediaType.find('/');
    if (slash == std::string::npos) return false;
    if (mediaType.compare(0, slash, "application") != 0) return false;
    const std::string subtype = mediaType.substr(slash + 1);
    return subtype == "json" ||
           (subtype.size() > 5 && subtype.compare(subtype.size() - 5, 5, "+json") == 0);
}

bool ProxyRequest::Decode(const std::string& contentType,
                          const std::string& body,
                          ProxyRequest* out,
                          std::vector<ValidationIssue>* issues) {
    issues->clear();

    if (body.empty()) {
        issues->push_back(MakeIssue("missing", BodyLoc(""), kFieldRequired));
        return false;
    }

    // A declared non-JSON media type leaves the body as raw bytes, which is never an object.
    if (!contentType.empty() && !IsJsonMediaType(contentType)) {
        issues->push_back(MakeIssue("model_attributes_type", BodyLoc(""),
                                    "Input should be a valid dictionary or object to extract fields from"));
        return false;
    }

    size_t errorOffset = 0;
    std::optional<JsonValue> doc = relay::common::ParseJson(body, &errorOffset);
    if (!doc) {
        std::vector<JsonValue> loc = BodyLoc("");
        loc.push_back(JsonValue::MakeNumber(static_cast<double>(errorOffset)));
        issues->push_back(MakeIssue("json_invalid", std::move(loc), "JSON decode error"));
        return false;
    }
    if (!doc->isObject()) {
        issues->push_back(MakeIssue("model_attributes_type", BodyLoc(""),
                                    "Input should be a valid dictionary or object to extract fields from"));
        return false;
    }

    ProxyRequest req;
    const JsonValue* url = doc->find("url");
    if (!url) {
        issues->push_back(MakeIssue("missing", BodyLoc("url"), kFieldRequired));
    } else if (!url->isString()) {
        issues->push_back(MakeIssue("string_type", BodyLoc("url"), kStringType));
    } else {
        req.url = url->asString();
    }

    const JsonValue* key = doc->find("key");
    if (key && !key->isNull()) {
        if (key->isString()) {
            req.key = key->asString();
        } else {
            issues->push_back(MakeIssue("string_type", BodyLoc("key"), kStringType));
        }
    }

    if (!issues->empty()) return false;
    *out = std::move(req);
    return true;
}

std::string RenderValidationErrors(const std::vector<ValidationIssue>& issues) {
    std::string json = "{\"detail\":[";
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) json += ",";
        const ValidationIssue& issue = issues[i];
        json += "{\"type\":\"" + relay::common::JsonEscape(issue.type) + "\",\"loc\":[";
        for (size_t j = 0; j < issue.loc.size(); ++j) {
            if (j > 0) json += ",";
            json += RenderLocPart(issue.loc[j]);
        }
        json += "],\"msg\":\"" + relay::common::JsonEscape(issue.msg) + "\"}";
    }
    json += "]}";
    return json;
}

} // namespace service
} // namespace relay
