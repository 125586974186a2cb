#include <JsonGuard/yyjson_input.hpp>

#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace JsonGuard;

// ============================================================================
// parse_json()
// ============================================================================

void test_scalars() {
    auto n = parse_json("42");
    Check(n.ok() && n.value() == Value(42), "integer becomes a number");
    auto neg = parse_json("-7");
    Check(neg.ok() && neg.value() == Value(-7), "signed integer");
    auto big = parse_json("18446744073709551615");
    Check(big.ok() && big.value().is_number(), "unsigned integer");
    auto real = parse_json("2.5e-3");
    Check(real.ok() && real.value() == Value(0.0025), "real");
    auto s = parse_json(R"("a\nb")");
    Check(s.ok() && s.value() == Value("a\nb"), "escapes are decoded");
    auto t = parse_json("true");
    Check(t.ok() && t.value() == Value(true), "boolean");
    auto null = parse_json("null");
    Check(null.ok() && null.value().is_null(), "null");
}

// Number text kept raw by yyjson still arrives as a number
void test_raw_numbers() {
    auto big = parse_json("18446744073709551616", YYJSON_READ_BIGNUM_AS_RAW);
    Check(big.ok() && big.value() == Value(18446744073709551616.0), "big integer read as raw text");
    if (big.ok()) {
        Check(DecodesTo(number(), big.value(), 18446744073709551616.0), "raw big integer decodes as a number");
        Check(FailsWith(string(), big.value(), "18446744073709552000 is not a valid string"),
              "raw big integer is not a string");
    }

    auto all_raw = parse_json(R"([1, -2.5, 3e2])", YYJSON_READ_NUMBER_AS_RAW);
    Check(all_raw.ok() && all_raw.value() == Value(Array{1, -2.5, 300}), "every number read as raw text");

    auto huge = parse_json("1e400", YYJSON_READ_NUMBER_AS_RAW);
    Check(huge.ok() && huge.value().is_number(), "out of range raw number stays a number");
    if (huge.ok() && huge.value().is_number()) {
        Check(render(huge.value()) == "null", "out of range raw number is infinite");
    }
}

void test_composites() {
    auto doc = parse_json(R"({"b": [1, "x", null], "a": {"c": false}})");
    Check(doc.ok(), "object parses");
    if (!doc.ok()) return;
    Check(render(doc.value()) == R"({"b":[1,"x",null],"a":{"c":false}})", "document order is kept");

    auto dup = parse_json(R"({"k": 1, "j": 2, "k": 3})");
    Check(dup.ok() && render(dup.value()) == R"({"k":3,"j":2})", "duplicate key: last value at the first position");
}

void test_parse_errors() {
    auto bad = parse_json(R"({"a": 1,})");
    Check(!bad.ok(), "trailing comma is rejected");
    if (!bad.ok()) {
        Check(bad.error().rfind("JSON parse error at position ", 0) == 0, "parse error message prefix");
    }
    Check(!parse_json("").ok(), "empty text is rejected");
    Check(!parse_json("[1, 2").ok(), "unterminated array is rejected");
}

// ============================================================================
// from_yyjson()
// ============================================================================

void test_from_yyjson() {
    Check(from_yyjson(nullptr).is_undefined(), "missing node is the absent sentinel");

    const char text[] = R"({"name": "Ann", "tags": ["x"]})";
    yyjson_doc* doc = yyjson_read(text, sizeof(text) - 1, 0);
    Check(doc != nullptr, "yyjson reads the document");
    if (!doc) return;
    yyjson_val* root = yyjson_doc_get_root(doc);
    Value name = from_yyjson(yyjson_obj_get(root, "name"));
    Value missing = from_yyjson(yyjson_obj_get(root, "missing"));
    yyjson_doc_free(doc);

    Check(name == Value("Ann"), "object member node");
    Check(missing.is_undefined(), "missing member node");
}

// ============================================================================
// Decoding parsed documents
// ============================================================================

struct Server {
    std::string host;
    double port = 0;
};

void test_decode_parsed() {
    auto server = object<Server>(fields_of<Server>(string(), number()), "Server");
    auto doc = parse_json(R"({"host": "localhost", "port": 8080})");
    Check(doc.ok() && DecodesTo(server, doc.value(), Server{"localhost", 8080}), "parsed text decodes");

    auto wrong = parse_json(R"({"host": "localhost", "port": "8080"})");
    Check(wrong.ok() && FailsWith(server, wrong.value(),
                                  R"(<Server> decoder failed at key "port" with error: "8080" is not a valid number)"),
          "parsed text fails with a decoder error");
}

int main() {
    test_scalars();
    test_raw_numbers();
    test_composites();
    test_parse_errors();
    test_from_yyjson();
    test_decode_parsed();
    return Finish();
}
