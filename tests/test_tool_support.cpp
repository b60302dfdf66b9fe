// Tests for the shared tool handler helpers: argument coercion, dates,
// URL building and upstream failure messages.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "tool_handlers/tool_support.hpp"

using json = nlohmann::json;

namespace test_tool_support {

// Test: Integers are accepted as numbers, integral floats and numeric strings.
static bool test_read_integer_coercion() {
    json arguments = {{"n", 5}, {"f", 7.0}, {"s", " 42 "}, {"neg", "-3"}, {"empty", ""}, {"null", nullptr}};
    bool success = *tool_support::read_integer(arguments, "n").value == 5 &&
                   *tool_support::read_integer(arguments, "f").value == 7 &&
                   *tool_support::read_integer(arguments, "s").value == 42 &&
                   *tool_support::read_integer(arguments, "neg").value == -3 &&
                   !tool_support::read_integer(arguments, "empty").value.has_value() &&
                   !tool_support::read_integer(arguments, "null").value.has_value() &&
                   !tool_support::read_integer(arguments, "absent").value.has_value();

    if (success) {
        std::cout << "  OK: read_integer coerces numbers and numeric strings" << std::endl;
    } else {
        std::cout << "  FAIL: read_integer coercion" << std::endl;
    }
    return success;
}

// Test: Non-integral or non-numeric values are rejected with a message.
static bool test_read_integer_rejections() {
    json arguments = {{"fraction", 1.5}, {"word", "ten"}, {"mixed", "12abc"}, {"flag", true}, {"list", {1}}};
    bool success = true;
    for (const char *name : {"fraction", "word", "mixed", "flag", "list"}) {
        tool_support::IntegerArgument argument = tool_support::read_integer(arguments, name);
        if (argument.success || argument.error_message != std::string(name) + " must be an integer") {
            std::cout << "  FAIL: read_integer accepted " << name << std::endl;
            success = false;
        }
    }

    if (success) {
        std::cout << "  OK: read_integer rejects non-integers" << std::endl;
    }
    return success;
}

// Test: read_string treats "" and null as absent and rejects non-strings.
static bool test_read_string() {
    json arguments = {{"text", "abc"}, {"empty", ""}, {"number", 4}};
    tool_support::StringArgument number = tool_support::read_string(arguments, "number");
    bool success = *tool_support::read_string(arguments, "text").value == "abc" &&
                   !tool_support::read_string(arguments, "empty").value.has_value() && !number.success &&
                   number.error_message == "number must be a string";

    if (success) {
        std::cout << "  OK: read_string handles empty and wrong types" << std::endl;
    } else {
        std::cout << "  FAIL: read_string" << std::endl;
    }
    return success;
}

// Test: parse_date accepts real calendar days only.
static bool test_parse_date() {
    tool_support::CalendarDate date;
    bool success = tool_support::parse_date("2024-02-29", date) && date.year == 2024 && date.month == 2 &&
                   date.day == 29 && !tool_support::parse_date("2023-02-29", date) &&
                   !tool_support::parse_date("1900-02-29", date) && tool_support::parse_date("2000-02-29", date) &&
                   !tool_support::parse_date("2024-13-01", date) && !tool_support::parse_date("2024-1-01", date) &&
                   !tool_support::parse_date("2024/01/01", date) && !tool_support::parse_date("2024-01-01T00", date);

    if (success) {
        std::cout << "  OK: parse_date validates format and calendar" << std::endl;
    } else {
        std::cout << "  FAIL: parse_date" << std::endl;
    }
    return success;
}

// Test: days_since_epoch counts days across month and leap boundaries.
static bool test_days_since_epoch() {
    bool success = tool_support::days_since_epoch({1970, 1, 1}) == 0 &&
                   tool_support::days_since_epoch({2000, 3, 1}) == 11017 &&
                   tool_support::days_since_epoch({2024, 3, 1}) - tool_support::days_since_epoch({2024, 2, 28}) == 2;

    if (success) {
        std::cout << "  OK: days_since_epoch" << std::endl;
    } else {
        std::cout << "  FAIL: days_since_epoch" << std::endl;
    }
    return success;
}

// Test: URL building encodes values but keeps , : / readable.
static bool test_build_url() {
    std::string url = tool_support::build_url("https://host/path", {{"q", "a b&c"}, {"bbox", "-1,2:3/4"}});
    std::string existing = tool_support::build_url("https://host/path?x=1", {{"y", "2"}});
    std::string bare = tool_support::build_url("https://host/path", {});
    bool success = url == "https://host/path?q=a%20b%26c&bbox=-1,2:3/4" && existing == "https://host/path?x=1&y=2" &&
                   bare == "https://host/path";

    if (success) {
        std::cout << "  OK: build_url encodes query values" << std::endl;
    } else {
        std::cout << "  FAIL: build_url produced " << url << std::endl;
    }
    return success;
}

// Test: describe_failure covers timeouts, transport errors and statuses.
static bool test_describe_failure() {
    upstream::HttpResponse timed_out;
    timed_out.timed_out = true;

    upstream::HttpResponse refused;
    refused.error_detail = "connection refused";

    upstream::HttpResponse forbidden;
    forbidden.success = true;
    forbidden.status_code = 403;
    forbidden.body = R"({"msg":"bad key"})";

    upstream::HttpResponse plain;
    plain.success = true;
    plain.status_code = 502;
    plain.body = "<html>bad gateway</html>";

    bool success = tool_support::describe_failure(timed_out) == "Request timed out. Please try again." &&
                   tool_support::describe_failure(refused) == "Upstream request failed: connection refused" &&
                   tool_support::describe_failure(forbidden) == "HTTP 403: bad key" &&
                   tool_support::describe_failure(plain) == "HTTP 502";

    if (success) {
        std::cout << "  OK: describe_failure messages" << std::endl;
    } else {
        std::cout << "  FAIL: describe_failure" << std::endl;
    }
    return success;
}

// Test: Small text helpers.
static bool test_text_helpers() {
    json object = {{"s", "x"}, {"n", 3}, {"z", nullptr}};
    bool success = tool_support::text_field(object, "s", "-") == "x" && tool_support::text_field(object, "n", "-") == "3" &&
                   tool_support::text_field(object, "z", "-") == "-" &&
                   tool_support::text_field(object, "missing", "-") == "-" &&
                   tool_support::format_fixed(0.12345, 3) == "0.123" &&
                   tool_support::media_type("Image/PNG; charset=binary") == "image/png" &&
                   tool_support::image_type_for_url("https://x/a.PNG?size=1") == "image/png" &&
                   tool_support::image_type_for_url("https://x/a") == "image/jpeg" &&
                   tool_support::base64_encode("Man").data == "TWFu" && tool_support::base64_encode("Ma").data == "TWE=" &&
                   !tool_support::base64_encode("").success &&
                   tool_support::base64_encode("").error_message == "Image data is empty";

    if (success) {
        std::cout << "  OK: Text helpers" << std::endl;
    } else {
        std::cout << "  FAIL: Text helpers" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_read_integer_coercion();
    all_passed &= test_read_integer_rejections();
    all_passed &= test_read_string();
    all_passed &= test_parse_date();
    all_passed &= test_days_since_epoch();
    all_passed &= test_build_url();
    all_passed &= test_describe_failure();
    all_passed &= test_text_helpers();
    return all_passed;
}

} // namespace test_tool_support
