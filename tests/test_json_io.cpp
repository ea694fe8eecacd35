#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include "test_common.hpp"
#include <limits>
#include <sstream>
#include <string>

using namespace astra;

static std::string parse_error(const std::string& text) {
    try {
        JsonReader::parse(text);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void runParseValues() {
    JsonValue root = JsonReader::parse(
        "{ \"name\": \"Apophis\", \"diameter\": 370, \"velocity\": -1.5e3,\n"
        "  \"custom\": false, \"mass\": null, \"tags\": [\"neo\", 2, true] }");

    REQUIRE(root.is_object(), "object root");
    REQUIRE(root["name"].as_string() == "Apophis", "string member");
    REQUIRE(root["diameter"].as_int() == 370, "integer member");
    REQUIRE(root["velocity"].as_number() == -1500.0, "exponent");
    REQUIRE(root["custom"].is_bool() && !root["custom"].as_bool(), "bool member");
    REQUIRE(root["mass"].is_null() && root.has("mass"), "explicit null is present");
    REQUIRE(root["tags"].size() == 3, "array size");
    REQUIRE(root["tags"][0].as_string() == "neo", "array element");
    REQUIRE(root["tags"][2].as_bool(), "mixed array");
    REQUIRE(root["tags"][7].is_null(), "out of range index gives null");

    REQUIRE(!root.has("missing"), "absent member");
    REQUIRE(root["missing"]["deeper"].get_number(7.0) == 7.0, "lenient fallback through nulls");
    REQUIRE(root["name"].get_number(3.0) == 3.0, "lenient fallback on type mismatch");
    REQUIRE(root["diameter"].get_string("x") == "x", "lenient string fallback");

    JsonValue esc = JsonReader::parse("\"a\\\"b\\\\c\\n\\u00e9\\/\"");
    REQUIRE(esc.as_string() == "a\"b\\c\n\xC3\xA9/", "escapes decoded");
    pass("parse values");
}

static void runStrictAccessors() {
    JsonValue root = JsonReader::parse("{\"n\": 1, \"s\": \"x\"}");
    REQUIRE_THROWS(root["n"].as_string(), "number is not a string");
    REQUIRE_THROWS(root["s"].as_number(), "string is not a number");
    REQUIRE_THROWS(root["missing"].as_bool(), "null is not a bool");

    try {
        root["n"].as_string();
    } catch (const std::runtime_error& e) {
        REQUIRE(contains(e.what(), "expected string, found number"),
                "mismatch message names both types (got " << e.what() << ")");
    }

    JsonValue nums = JsonReader::parse("{\"trl\": 7, \"huge\": 1e12, \"neg\": -3.9}");
    REQUIRE(nums["trl"].as_int() == 7, "int in range");
    REQUIRE(nums["neg"].as_int() == -3, "truncates toward zero");
    REQUIRE_THROWS(nums["huge"].as_int(), "outside int range throws");
    REQUIRE(nums["huge"].get_int(4) == 4, "lenient int falls back outside the range");
    REQUIRE(nums["trl"].get_int(4) == 7, "lenient int in range");
    pass("strict accessors");
}

static void runMemberOrder() {
    JsonValue root = JsonReader::parse("{\"z\": 1, \"a\": 2, \"m\": 3}");
    REQUIRE((root.keys() == std::vector<std::string>{"z", "a", "m"}), "document order kept");

    JsonValue dup = JsonReader::parse("{\"a\": 1, \"b\": 2, \"a\": 3}");
    REQUIRE((dup.keys() == std::vector<std::string>{"a", "b"}), "duplicate keeps first position");
    REQUIRE(dup["a"].as_number() == 3.0, "duplicate takes the later value");
    REQUIRE(dup.size() == 2, "object size counts members");
    pass("member order");
}

static void runParseErrors() {
    std::string e = parse_error("{\n  \"a\": tru\n}");
    REQUIRE(contains(e, "line 2"), "error carries the line (got " << e << ")");
    REQUIRE(contains(e, "column"), "error carries the column");

    REQUIRE(contains(parse_error("{} x"), "Trailing characters"), "trailing garbage rejected");
    REQUIRE(contains(parse_error(""), "Unexpected end of input"), "empty input");
    REQUIRE(contains(parse_error("{\"a\": 1,}"), "Expected member name"), "trailing comma");
    REQUIRE(contains(parse_error("[1 2]"), "Expected ',' or ']'"), "missing comma");
    REQUIRE(contains(parse_error("\"abc"), "Unterminated string"), "unterminated string");
    REQUIRE(contains(parse_error("\"a\nb\""), "Control character"), "raw newline in string");
    REQUIRE(contains(parse_error("\"\\q\""), "Unknown escape"), "bad escape");
    REQUIRE(contains(parse_error("1."), "Expected digit after '.'"), "bad fraction");
    REQUIRE(contains(parse_error("@"), "Unexpected character"), "unexpected character");

    std::string deep(300, '[');
    deep += std::string(300, ']');
    REQUIRE(contains(parse_error(deep), "Nesting too deep"), "depth limit");

    std::string ok(200, '[');
    ok += std::string(200, ']');
    REQUIRE(parse_error(ok).empty(), "moderate nesting accepted");

    REQUIRE_THROWS(JsonReader::parse_file("/nonexistent/astra/scenario.json"), "missing file");
    pass("parse errors");
}

static void runBuildValues() {
    JsonValue obj = JsonValue::object();
    obj.add_member("id", JsonValue(std::string("bennu")));
    obj.add_member("diameter", JsonValue(492.0));
    JsonValue arr = JsonValue::array();
    arr.add_element(JsonValue(true));
    obj.add_member("flags", std::move(arr));

    REQUIRE(obj["id"].as_string() == "bennu", "built string");
    REQUIRE(obj["diameter"].as_number() == 492.0, "built number");
    REQUIRE(obj["flags"][0].as_bool(), "built array");
    REQUIRE(obj.keys().size() == 3, "three members");
    REQUIRE(std::string(json_type_name(obj.type)) == "object", "type name");
    pass("build values");
}

static void runWriterCompact() {
    std::ostringstream out;
    JsonWriter w(out, 0);
    w.begin_object();
    w.kv("name", "x");
    w.kv("n", 1);
    w.key("list").begin_array();
    w.value(1.5);
    w.value(true);
    w.end_array();
    w.key("none").null_value();
    w.kv("nan", std::numeric_limits<double>::quiet_NaN());
    w.kv("big", static_cast<int64_t>(8000000000LL));
    w.key("empty").begin_object().end_object();
    w.kv("opt", std::optional<double>());
    w.end_object();

    REQUIRE(out.str() == "{\"name\":\"x\",\"n\":1,\"list\":[1.5,true],\"none\":null,"
                         "\"nan\":null,\"big\":8000000000,\"empty\":{},\"opt\":null}",
            "compact output (got " << out.str() << ")");
    pass("writer compact");
}

static void runWriterIndented() {
    std::ostringstream out;
    JsonWriter w(out);
    w.begin_object();
    w.kv("a", 1);
    w.string_array("effects", {"fires"});
    w.end_object();

    REQUIRE(out.str() == "{\n  \"a\": 1,\n  \"effects\": [\n    \"fires\"\n  ]\n}",
            "indented output (got " << out.str() << ")");
    pass("writer indented");
}

static void runWriterReadback() {
    const std::string tricky = "quote\" back\\slash\nnew\ttab\x01";

    std::ostringstream out;
    JsonWriter w(out);
    w.begin_object();
    w.kv("text", tricky);
    w.kv("pi", 3.141592653589793);
    w.kv("small", 1e-12);
    w.end_object();

    JsonValue back = JsonReader::parse(out.str());
    REQUIRE(back["text"].as_string() == tricky, "escaped string reads back");
    REQUIRE(near(back["pi"].as_number(), 3.141592653589793, 1e-13), "15 significant digits");
    REQUIRE(near_rel(back["small"].as_number(), 1e-12), "exponent form");
    pass("writer readback");
}

int main() {
    runParseValues();
    runStrictAccessors();
    runMemberOrder();
    runParseErrors();
    runBuildValues();
    runWriterCompact();
    runWriterIndented();
    runWriterReadback();
    return 0;
}
