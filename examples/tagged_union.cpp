// Tagged union: read the "type" tag, then decode the matching alternative
// of a std::variant from the same input.

#include <JsonGuard/decoders.hpp>
#include <JsonGuard/yyjson_input.hpp>
#include <iostream>
#include <string>
#include <variant>

using namespace JsonGuard;

struct Square {
    double side;
};

struct Rectangle {
    double width;
    double height;
};

using Shape = std::variant<Square, Rectangle>;

struct Tag {
    std::string type;
};

Decoder<Shape> shape_decoder() {
    auto tag = object<Tag>(fields_of<Tag>(string()), "Tag").map([](Tag t) { return t.type; });
    return tag.then([](const std::string& type) -> Decoder<Shape> {
        if (type == "square") {
            return object<Square>(fields_of<Square>(number()), "Square");
        }
        if (type == "rectangle") {
            return object<Rectangle>(fields_of<Rectangle>(number(), number()), "Rectangle");
        }
        return fail<Shape>("unknown shape type \"" + type + "\"");
    });
}

double area(const Shape& shape) {
    if (const auto* s = std::get_if<Square>(&shape)) return s->side * s->side;
    const auto& r = std::get<Rectangle>(shape);
    return r.width * r.height;
}

int main() {
    auto shapes = array(shape_decoder(), "shapes");
    auto doc = parse_json(R"([
        {"type": "square", "side": 3},
        {"type": "rectangle", "width": 2, "height": 5},
        {"type": "circle", "radius": 1}
    ])");
    if (!doc) {
        std::cerr << doc.error() << std::endl;
        return 1;
    }

    for (const Value& item : doc.value().as_array()) {
        shape_decoder().on_decode(
            item,
            [](Shape shape) { std::cout << "area " << area(shape) << std::endl; },
            [](const std::string& error) { std::cout << "skipped: " << error << std::endl; });
    }

    auto all = shapes.decode(doc.value());
    if (!all) {
        std::cout << all.error() << std::endl;
    }
    return 0;
}
