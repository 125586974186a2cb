#include <memory>

#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace JsonGuard;

using StringOrNumber = std::variant<std::string, double>;

struct Circle {
    double radius = 0;
};

struct Label {
    std::string text;
};

using Shape = std::variant<Circle, Label>;

// ============================================================================
// Variant alternatives
// ============================================================================

void test_variant_alternatives() {
    auto decoder = one_of<StringOrNumber>({string(), number()}, "string | number");
    Check(DecodesTo(decoder, 1, StringOrNumber{1.0}), "number alternative");
    Check(DecodesTo(decoder, "hola", StringOrNumber{std::string("hola")}), "string alternative");
    Check(FailsWith(decoder, true,
                    "<string | number> decoder failed because true can't be decoded with any of the provided oneOf decoders"),
          "no alternative matches");
    Check(FailsWith(decoder, Undefined{},
                    "<string | number> decoder failed because undefined can't be decoded with any of the provided oneOf decoders"),
          "absent input");
}

// ============================================================================
// Candidates are tried in order
// ============================================================================

void test_candidate_order() {
    auto first_wins = one_of({constant(1.0), constant(2.0)}, "first");
    Check(DecodesTo(first_wins, Null{}, 1.0), "first success is kept");

    auto second = one_of({fail<double>("nope"), number(), constant(-1.0)}, "second");
    Check(DecodesTo(second, 5, 5.0), "failing candidates are skipped");
    Check(DecodesTo(second, "x", -1.0), "later candidates run after earlier failures");

    auto calls = std::make_shared<int>(0);
    auto counting = Decoder<double>([calls](const Value& json) -> Result<double> {
        ++*calls;
        return number().decode(json);
    });
    auto stops = one_of({number(), counting}, "stops");
    Check(DecodesTo(stops, 1, 1.0), "first candidate matches");
    Check(*calls == 0, "candidates after a match are not tried");
    Check(Fails(stops, "x") && *calls == 1, "later candidate runs after a failure");
}

// ============================================================================
// Record alternatives
// ============================================================================

void test_record_alternatives() {
    Decoder<Circle> circle = object<Circle>(fields_of<Circle>(number()), "Circle");
    Decoder<Label> label = object<Label>(fields_of<Label>(string()), "Label");
    auto shape = one_of<Shape>({circle, label}, "Shape");

    Check(DecodesTo(shape, Object{{"radius", 2}}, Shape{Circle{2}}), "first record alternative");
    Check(DecodesTo(shape, Object{{"text", "hi"}}, Shape{Label{"hi"}}), "second record alternative");
    Check(FailsWith(shape, Object{{"radius", "2"}},
                    R"(<Shape> decoder failed because {"radius":"2"} can't be decoded with any of the provided oneOf decoders)"),
          "candidate messages are not included");
}

int main() {
    test_variant_alternatives();
    test_candidate_order();
    test_record_alternatives();
    return Finish();
}
