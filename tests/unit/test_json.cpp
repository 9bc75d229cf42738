#include "edgelog/common/Json.h"
#include "edgelog/common/Logger.h"

#include <cassert>
#include <string>
#include <vector>

using namespace edgelog::common;

static void testEscape() {
    assert(JsonQuote("plain") == "\"plain\"");
    assert(JsonEscape("a\"b\\c") == "a\\\"b\\\\c");
    assert(JsonEscape("line\nnext\ttab\r") == "line\\nnext\\ttab\\r");
    assert(JsonEscape(std::string("\x01", 1)) == "\\u0001");
    // UTF-8 passes through untouched
    assert(JsonEscape("caf\xc3\xa9") == "caf\xc3\xa9");
    LOG_INFO << "JSON escape PASS";
}

static void testParseObject() {
    JsonObject obj;
    std::string err;
    bool ok = ParseJsonObject(
        "{\"time\":\"2024-01-15T10:30:00Z\",\"level\":\"info\",\"connIndex\":2,"
        "\"ok\":true,\"none\":null,\"nested\":{\"a\":[1,2,\"}\"]},\"esc\":\"a\\\"b\\u00e9\"}",
        &obj, &err);
    assert(ok);
    assert(JsonGetString(obj, "time") == "2024-01-15T10:30:00Z");
    assert(obj["connIndex"].type == JsonValue::kNumber);
    assert(obj["connIndex"].text == "2");
    assert(JsonGetString(obj, "connIndex").empty());
    assert(JsonGetBool(obj, "ok", false));
    assert(JsonGetBool(obj, "missing", true));
    assert(obj["none"].type == JsonValue::kNull);
    assert(obj["nested"].type == JsonValue::kObject);
    assert(obj["nested"].text == "{\"a\":[1,2,\"}\"]}");
    assert(JsonGetString(obj, "esc") == "a\"b\xc3\xa9");
    LOG_INFO << "JSON parse object PASS";
}

static void testParseErrors() {
    JsonObject obj;
    std::string err;
    assert(!ParseJsonObject("", &obj, &err));
    assert(!err.empty());
    err.clear();
    assert(!ParseJsonObject("{\"a\":1", &obj, &err));
    assert(!ParseJsonObject("{\"a\":1} trailing", &obj, &err));
    assert(err.find("trailing") != std::string::npos);
    assert(!ParseJsonObject("[1,2]", &obj, &err));
    assert(!ParseJsonObject("{\"a\":\"unterminated}", &obj, &err));
    assert(!ParseJsonObject("{\"a\":tru}", &obj, &err));
    LOG_INFO << "JSON parse errors PASS";
}

static void testObjectArray() {
    std::vector<std::string> items;
    std::string err;
    assert(SplitJsonObjectArray(" [ {\"host\":\"a\"} , {\"host\":\"b]\"} ] ", &items, &err));
    assert(items.size() == 2);
    assert(items[0] == "{\"host\":\"a\"}");
    assert(items[1] == "{\"host\":\"b]\"}");

    assert(SplitJsonObjectArray("[]", &items, &err));
    assert(items.empty());

    assert(!SplitJsonObjectArray("[1]", &items, &err));
    assert(!SplitJsonObjectArray("{\"host\":\"a\"}", &items, &err));
    assert(!SplitJsonObjectArray("[{\"host\":\"a\"}", &items, &err));
    LOG_INFO << "JSON object array PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testEscape();
    testParseObject();
    testParseErrors();
    testObjectArray();
    return 0;
}
