#include "relay/common/Json.h"

#include <cstdlib>
#include <cstring>

namespace relay {
namespace common {

JsonValue JsonValue::MakeBool(bool b) {
    JsonValue v;
    v.type_ = Type::kBool;
    v.bool_ = b;
    return v;
}

JsonValue JsonValue::MakeNumber(double d) {
    JsonValue v;
    v.type_ = Type::kNumber;
    v.number_ = d;
    return v;
}

JsonValue JsonValue::MakeString(std::string s) {
    JsonValue v;
    v.type_ = Type::kString;
    v.string_ = std::move(s);
    return v;
}

JsonValue JsonValue::MakeArray(Array a) {
    JsonValue v;
    v.type_ = Type::kArray;
    v.array_ = std::move(a);
    return v;
}

JsonValue JsonValue::MakeObject(Object o) {
    JsonValue v;
    v.type_ = Type::kObject;
    v.object_ = std::move(o);
    return v;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type_ != Type::kObject) return nullptr;
    for (auto it = object_.rbegin(); it != object_.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

namespace {

const int kMaxDepth = 256;

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    bool parseDocument(JsonValue* out) {
        skipWs();
        if (!parseValue(out, 0)) return false;
        skipWs();
        return pos_ == s_.size();
    }

    size_t pos() const { return pos_; }

private:
    void skipWs() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                ++pos_;
            } else {
                break;
            }
        }
    }

    bool consumeLiteral(const char* lit) {
        const size_t n = std::strlen(lit);
        if (s_.compare(pos_, n, lit) != 0) return false;
        pos_ += n;
        return true;
    }

    bool parseValue(JsonValue* out, int depth) {
        if (depth > kMaxDepth || pos_ >= s_.size()) return false;
        const char c = s_[pos_];
        if (c == '{') return parseObject(out, depth);
        if (c == '[') return parseArray(out, depth);
        if (c == '"') {
            std::string str;
            if (!parseString(&str)) return false;
            *out = JsonValue::MakeString(std::move(str));
            return true;
        }
        if (c == 't') {
            if (!consumeLiteral("true")) return false;
            *out = JsonValue::MakeBool(true);
            return true;
        }
        if (c == 'f') {
            if (!consumeLiteral("false")) return false;
            *out = JsonValue::MakeBool(false);
            return true;
        }
        if (c == 'n') {
            if (!consumeLiteral("null")) return false;
            *out = JsonValue();
            return true;
        }
        return parseNumber(out);
    }

    bool parseObject(JsonValue* out, int depth) {
        ++pos_; // '{'
        JsonValue::Object members;
        skipWs();
        if (pos_ < s_.size() && s_[pos_] == '}') {
            ++pos_;
            *out = JsonValue::MakeObject(std::move(members));
            return true;
        }
        while (true) {
            skipWs();
            if (pos_ >= s_.size() || s_[pos_] != '"') return false;
            std::string key;
            if (!parseString(&key)) return false;
            skipWs();
            if (pos_ >= s_.size() || s_[pos_] != ':') return false;
            ++pos_;
            skipWs();
            JsonValue v;
            if (!parseValue(&v, depth + 1)) return false;
            members.emplace_back(std::move(key), std::move(v));
            skipWs();
            if (pos_ >= s_.size()) return false;
            if (s_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (s_[pos_] == '}') {
                ++pos_;
                break;
            }
            return false;
        }
        *out = JsonValue::MakeObject(std::move(members));
        return true;
    }

    bool parseArray(JsonValue* out, int depth) {
        ++pos_; // '['
        JsonValue::Array items;
        skipWs();
        if (pos_ < s_.size() && s_[pos_] == ']') {
            ++pos_;
            *out = JsonValue::MakeArray(std::move(items));
            return true;
        }
        while (true) {
            skipWs();
            JsonValue v;
            if (!parseValue(&v, depth + 1)) return false;
            items.push_back(std::move(v));
            skipWs();
            if (pos_ >= s_.size()) return false;
            if (s_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (s_[pos_] == ']') {
                ++pos_;
                break;
            }
            return false;
        }
        *out = JsonValue::MakeArray(std::move(items));
        return true;
    }

    bool parseHex4(unsigned* out) {
        if (pos_ + 4 > s_.size()) return false;
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = s_[pos_++];
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(c - 'A' + 10);
            else return false;
        }
        *out = v;
        return true;
    }

    static void appendUtf8(unsigned cp, std::string* out) {
        if (cp < 0x80) {
            out->push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool parseString(std::string* out) {
        ++pos_; // opening quote
        out->clear();
        while (pos_ < s_.size()) {
            const unsigned char c = static_cast<unsigned char>(s_[pos_]);
            if (c == '"') {
                ++pos_;
                return true;
            }
            if (c < 0x20) return false;
            if (c != '\\') {
                out->push_back(static_cast<char>(c));
                ++pos_;
                continue;
            }
            ++pos_;
            if (pos_ >= s_.size()) return false;
            const char e = s_[pos_++];
            switch (e) {
                case '"': out->push_back('"'); break;
                case '\\': out->push_back('\\'); break;
                case '/': out->push_back('/'); break;
                case 'b': out->push_back('\b'); break;
                case 'f': out->push_back('\f'); break;
                case 'n': out->push_back('\n'); break;
                case 'r': out->push_back('\r'); break;
                case 't': out->push_back('\t'); break;
                case 'u': {
                    unsigned cp = 0;
                    if (!parseHex4(&cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // High surrogate: combine with a following low surrogate if present.
                        const size_t save = pos_;
                        unsigned lo = 0;
                        if (pos_ + 1 < s_.size() && s_[pos_] == '\\' && s_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            if (parseHex4(&lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            } else {
                                pos_ = save;
                            }
                        }
                    }
                    appendUtf8(cp, out);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }

    bool parseNumber(JsonValue* out) {
        const size_t start = pos_;
        if (pos_ < s_.size() && s_[pos_] == '-') ++pos_;
        if (pos_ >= s_.size()) return false;
        if (s_[pos_] == '0') {
            ++pos_;
        } else if (s_[pos_] >= '1' && s_[pos_] <= '9') {
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
        } else {
            return false;
        }
        if (pos_ < s_.size() && s_[pos_] == '.') {
            ++pos_;
            const size_t digits = pos_;
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
            if (pos_ == digits) return false;
        }
        if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
            const size_t digits = pos_;
            while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
            if (pos_ == digits) return false;
        }
        const std::string lit = s_.substr(start, pos_ - start);
        *out = JsonValue::MakeNumber(std::strtod(lit.c_str(), nullptr));
        return true;
    }

    const std::string& s_;
    size_t pos_{0};
};

} // namespace

std::optional<JsonValue> ParseJson(const std::string& text, size_t* errorOffset) {
    Parser p(text);
    JsonValue v;
    if (!p.parseDocument(&v)) {
        if (errorOffset) *errorOffset = p.pos();
        return std::nullopt;
    }
    return v;
}

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

} // namespace common
} // namespace relay
