// Recursive shapes through lazy(): a category tree of unbounded depth.

#include <JsonGuard/decoders.hpp>
#include <JsonGuard/yyjson_input.hpp>
#include <future>
#include <iostream>
#include <string>
#include <vector>

using namespace JsonGuard;

struct Category {
    std::string name;
    std::vector<Category> children;
};

Decoder<Category> category_decoder() {
    return object_strict<Category>({
        field(&Category::name, "name", string()),
        field(&Category::children, "children",
              one_of({array(lazy([] { return category_decoder(); }), "children"),
                      is_undefined(std::vector<Category>{})}, "children or nothing")),
    }, "Category");
}

void print(const Category& c, int depth = 0) {
    std::cout << std::string(depth * 2, ' ') << c.name << std::endl;
    for (const auto& child : c.children) {
        print(child, depth + 1);
    }
}

int main() {
    auto doc = parse_json(R"({
        "name": "root",
        "children": [
            {"name": "books", "children": [{"name": "fiction"}, {"name": "poetry"}]},
            {"name": "music"}
        ]
    })");
    if (!doc) {
        std::cerr << doc.error() << std::endl;
        return 1;
    }

    std::future<Category> tree = category_decoder().decode_future(doc.value());
    try {
        print(tree.get());
    } catch (const DecodeError& e) {
        std::cerr << "Decode error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
