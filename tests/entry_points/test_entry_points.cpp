#include <chrono>
#include <future>

#include "test_helpers.hpp"
using namespace TestHelpers;
using namespace JsonGuard;

// ============================================================================
// decode()
// ============================================================================

void test_decode() {
    Result<double> ok = number().decode(3);
    Check(ok.ok() && ok.value() == 3, "success carries the value");

    Result<double> bad = number().decode("3");
    Check(!bad && bad.error() == R"("3" is not a valid number)", "failure carries the message");
}

// ============================================================================
// on_decode()
// ============================================================================

void test_on_decode() {
    int ok_calls = 0;
    int err_calls = 0;
    std::string text = string().on_decode(
        "hi",
        [&](std::string s) { ++ok_calls; return "ok:" + s; },
        [&](const std::string& e) { ++err_calls; return "err:" + e; });
    Check(text == "ok:hi", "success continuation result is returned");
    Check(ok_calls == 1 && err_calls == 0, "only the success continuation runs");

    text = string().on_decode(
        5,
        [&](std::string s) { ++ok_calls; return "ok:" + s; },
        [&](const std::string& e) { ++err_calls; return "err:" + e; });
    Check(text == "err:5 is not a valid string", "failure continuation result is returned");
    Check(ok_calls == 1 && err_calls == 1, "only the failure continuation runs");

    std::size_t length = array(number(), "xs").on_decode(
        Array{1, 2, 3},
        [](std::vector<double> xs) { return xs.size(); },
        [](const std::string&) { return std::size_t{0}; });
    Check(length == 3, "continuations may return any type");
}

// ============================================================================
// decode_future()
// ============================================================================

void test_decode_future() {
    std::future<double> ok = number().decode_future(8);
    Check(ok.wait_for(std::chrono::seconds(0)) == std::future_status::ready, "future is already satisfied");
    Check(ok.get() == 8, "future holds the value");

    std::future<double> bad = number().decode_future(Null{});
    Check(bad.wait_for(std::chrono::seconds(0)) == std::future_status::ready, "failed future is already satisfied");
    try {
        (void)bad.get();
        Check(false, "failed future must throw");
    } catch (const DecodeError& e) {
        Check(std::string(e.what()) == "null is not a valid number", "DecodeError carries the message");
    }

    std::future<std::optional<std::string>> absent = optional(string()).decode_future(Undefined{});
    Check(!absent.get().has_value(), "future of an optional decoder");
}

int main() {
    test_decode();
    test_on_decode();
    test_decode_future();
    return Finish();
}
