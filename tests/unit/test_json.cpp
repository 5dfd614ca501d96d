#include "relay/common/Json.h"
#include "relay/common/Logger.h"

#include <cassert>
#include <string>

using namespace relay::common;

void testParseObject() {
    auto doc = ParseJson(" {\"url\": \"https://a.example/x?y=1\", \"key\": \"k1\", \"n\": -1.5e2, \"ok\": true, \"nil\": null} ");
    assert(doc);
    assert(doc->isObject());
    assert(doc->asObject().size() == 5);
    assert(doc->find("url")->asString() == "https://a.example/x?y=1");
    assert(doc->find("key")->asString() == "k1");
    assert(doc->find("n")->asNumber() == -150.0);
    assert(doc->find("ok")->asBool());
    assert(doc->find("nil")->isNull());
    assert(doc->find("missing") == nullptr);
    LOG_INFO << "Parse Object PASS";
}

void testDuplicateKeysLastWins() {
    auto doc = ParseJson("{\"key\":\"first\",\"key\":\"second\"}");
    assert(doc);
    assert(doc->find("key")->asString() == "second");
    LOG_INFO << "Duplicate Keys PASS";
}

void testStringEscapes() {
    auto doc = ParseJson("\"a\\/b\\\\c\\\"d\\n\\u0026\\u00e9\\ud83d\\ude00\"");
    assert(doc);
    assert(doc->isString());
    assert(doc->asString() == "a/b\\c\"d\n&\xC3\xA9\xF0\x9F\x98\x80");
    LOG_INFO << "String Escapes PASS";
}

void testNested() {
    auto doc = ParseJson("{\"a\":[1,[2,{\"b\":[]}],\"s\"],\"o\":{}}");
    assert(doc);
    const JsonValue* a = doc->find("a");
    assert(a && a->type() == JsonValue::Type::kArray);
    assert(a->asArray().size() == 3);
    assert(a->asArray()[1].asArray()[1].find("b")->asArray().empty());
    assert(doc->find("o")->isObject());
    LOG_INFO << "Nested PASS";
}

void testErrors() {
    size_t off = 0;
    assert(!ParseJson("", &off));
    assert(off == 0);

    assert(!ParseJson("{\"url\": }", &off));
    assert(off == 8);

    assert(!ParseJson("{\"a\":1,}", &off));
    assert(!ParseJson("[1 2]", &off));
    assert(!ParseJson("{\"a\":1} trailing", &off));
    assert(off == 8);
    assert(!ParseJson("\"unterminated", &off));
    assert(!ParseJson("\"bad \\x escape\"", &off));
    assert(!ParseJson("\"raw\ncontrol\"", &off));
    assert(!ParseJson("01", &off));
    assert(!ParseJson("nul", &off));

    std::string deep(300, '[');
    deep += std::string(300, ']');
    assert(!ParseJson(deep, &off));
    LOG_INFO << "Parse Errors PASS";
}

void testScalarsAtTopLevel() {
    assert(ParseJson("42")->asNumber() == 42.0);
    assert(ParseJson("\"s\"")->asString() == "s");
    assert(ParseJson("false")->type() == JsonValue::Type::kBool);
    assert(ParseJson(" null ")->isNull());
    LOG_INFO << "Top-level Scalars PASS";
}

void testEscape() {
    assert(JsonEscape("plain") == "plain");
    assert(JsonEscape("q\"b\\") == "q\\\"b\\\\");
    assert(JsonEscape("a\nb\tc\x01") == "a\\nb\\tc\\u0001");
    assert(JsonEscape("\xC3\xA9") == "\xC3\xA9");
    LOG_INFO << "Escape PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseObject();
    testDuplicateKeysLastWins();
    testStringEscapes();
    testNested();
    testErrors();
    testScalarsAtTopLevel();
    testEscape();
    return 0;
}
