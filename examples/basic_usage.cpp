// Basic JsonGuard usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lyyjson -o basic_usage

#include <JsonGuard/decoders.hpp>
#include <JsonGuard/yyjson_input.hpp>
#include <iostream>
#include <string>

using namespace JsonGuard;

struct Server {
    std::string host;
    double port;
};

struct Config {
    std::string app_name;
    double version;
    bool debug_mode;
    Server server;
};

Decoder<Config> config_decoder() {
    auto server = object<Server>(fields_of<Server>(string(), number()), "Server");
    return object<Config>(fields_of<Config>(string(), number(), failover(false, boolean()), server), "Config");
}

int report(const char* json) {
    auto doc = parse_json(json);
    if (!doc) {
        std::cout << doc.error() << std::endl;
        return 1;
    }

    return config_decoder().on_decode(
        doc.value(),
        [](Config config) {
            std::cout << "Successfully decoded!" << std::endl;
            std::cout << "App: " << config.app_name << std::endl;
            std::cout << "Version: " << config.version << std::endl;
            std::cout << "Debug: " << (config.debug_mode ? "ON" : "OFF") << std::endl;
            std::cout << "Server: " << config.server.host << ":" << config.server.port << std::endl;
            return 0;
        },
        [](const std::string& error) {
            std::cout << "Decode error: " << error << std::endl;
            return 1;
        });
}

int main() {
    const char* json = R"({
        "app_name": "MyApp",
        "version": 1,
        "debug_mode": true,
        "server": {
            "host": "localhost",
            "port": 8080
        }
    })";

    const char* broken = R"({
        "app_name": "MyApp",
        "version": 1,
        "server": {
            "host": "localhost",
            "port": "8080"
        }
    })";

    // The second document is expected to be rejected
    return (report(json) == 0 && report(broken) == 1) ? 0 : 1;
}
