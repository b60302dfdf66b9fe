#include "tool_handlers/tool_support.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace tool_support {

static std::string trim(const std::string &text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

StringArgument read_string(const json &arguments, const std::string &name) {
    StringArgument argument;
    if (!arguments.is_object() || !arguments.contains(name) || arguments[name].is_null()) {
        return argument;
    }

    const json &value = arguments[name];
    if (!value.is_string()) {
        argument.success = false;
        argument.error_message = name + " must be a string";
        return argument;
    }

    std::string text = value.get<std::string>();
    if (!text.empty()) {
        argument.value = text;
    }
    return argument;
}

IntegerArgument read_integer(const json &arguments, const std::string &name) {
    IntegerArgument argument;
    if (!arguments.is_object() || !arguments.contains(name) || arguments[name].is_null()) {
        return argument;
    }

    const json &value = arguments[name];
    const std::string error_message = name + " must be an integer";

    if (value.is_number_unsigned()) {
        auto unsigned_value = value.get<unsigned long long>();
        if (unsigned_value > static_cast<unsigned long long>(LLONG_MAX)) {
            argument.success = false;
            argument.error_message = name + " is out of range";
            return argument;
        }
        argument.value = static_cast<long long>(unsigned_value);
        return argument;
    }

    if (value.is_number_integer()) {
        argument.value = value.get<long long>();
        return argument;
    }

    if (value.is_number_float()) {
        double number = value.get<double>();
        if (!std::isfinite(number) || std::floor(number) != number ||
            number < static_cast<double>(LLONG_MIN) || number > static_cast<double>(LLONG_MAX)) {
            argument.success = false;
            argument.error_message = error_message;
            return argument;
        }
        argument.value = static_cast<long long>(number);
        return argument;
    }

    if (value.is_string()) {
        std::string text = trim(value.get<std::string>());
        if (text.empty()) {
            return argument;
        }
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                argument.value = parsed;
                return argument;
            }
        } catch (const std::invalid_argument &) {
            // falls through to the error below
        } catch (const std::out_of_range &) {
            argument.success = false;
            argument.error_message = name + " is out of range";
            return argument;
        }
    }

    argument.success = false;
    argument.error_message = error_message;
    return argument;
}

static bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool parse_date(const std::string &text, CalendarDate &date) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (size_t index = 0; index < text.size(); ++index) {
        if (index == 4 || index == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(text[index]))) {
            return false;
        }
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    int month_length = days_in_month[month - 1] + ((month == 2 && is_leap_year(year)) ? 1 : 0);
    if (day > month_length) {
        return false;
    }

    date.year = year;
    date.month = month;
    date.day = day;
    return true;
}

long long days_since_epoch(const CalendarDate &date) {
    // Howard Hinnant's days_from_civil.
    long long year = date.year - (date.month <= 2 ? 1 : 0);
    long long era = (year >= 0 ? year : year - 399) / 400;
    long long year_of_era = year - era * 400;
    long long month_index = date.month + (date.month > 2 ? -3 : 9);
    long long day_of_year = (153 * month_index + 2) / 5 + date.day - 1;
    long long day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146097 + day_of_era - 719468;
}

std::string url_encode(const std::string &value) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char character : value) {
        if (std::isalnum(character) || character == '-' || character == '_' || character == '.' ||
            character == '~' || character == ',' || character == ':' || character == '/') {
            encoded += static_cast<char>(character);
        } else {
            encoded += '%';
            encoded += hex_digits[character >> 4];
            encoded += hex_digits[character & 0x0F];
        }
    }
    return encoded;
}

std::string build_url(const std::string &base_url, const QueryParameters &query) {
    std::string url = base_url;
    char separator = (base_url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto &parameter : query) {
        url += separator;
        url += url_encode(parameter.first);
        url += '=';
        url += url_encode(parameter.second);
        separator = '&';
    }
    return url;
}

// Pull a human-readable message out of an upstream error body, if any.
static std::string upstream_error_message(const std::string &body) {
    json document = json::parse(body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return "";
    }
    for (const char *key : {"msg", "error_message", "message"}) {
        if (document.contains(key) && document[key].is_string()) {
            return document[key].get<std::string>();
        }
    }
    if (document.contains("error") && document["error"].is_object()) {
        const json &error_object = document["error"];
        if (error_object.contains("message") && error_object["message"].is_string()) {
            return error_object["message"].get<std::string>();
        }
    }
    return "";
}

std::string describe_failure(const upstream::HttpResponse &response) {
    if (response.timed_out) {
        return "Request timed out. Please try again.";
    }
    if (response.cancelled) {
        return "Request cancelled";
    }
    if (!response.success) {
        return "Upstream request failed: " + response.error_detail;
    }
    std::string message = "HTTP " + std::to_string(response.status_code);
    std::string detail = upstream_error_message(response.body);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

FetchResult fetch(const ToolContext &context, const std::string &url,
                  const mcp_tools::CancellationFlag &cancellation) {
    FetchResult result;
    result.response = context.upstream.get(url, cancellation);
    if (result.response.success && result.response.status_code >= 200 && result.response.status_code < 300) {
        result.success = true;
        return result;
    }
    result.error_message = describe_failure(result.response);
    debug_log::log("fetch failed: " + result.error_message);
    return result;
}

JsonFetchResult fetch_json(const ToolContext &context, const std::string &url,
                           const mcp_tools::CancellationFlag &cancellation) {
    JsonFetchResult result;
    FetchResult fetched = fetch(context, url, cancellation);
    if (!fetched.success) {
        result.error_message = fetched.error_message;
        return result;
    }

    try {
        result.document = json::parse(fetched.response.body);
    } catch (const json::parse_error &error) {
        debug_log::log(std::string("upstream JSON parse error: ") + error.what());
        result.error_message = "Upstream returned invalid JSON";
        return result;
    }
    result.success = true;
    return result;
}

std::string text_field(const json &object, const std::string &key, const std::string &fallback) {
    if (!object.is_object() || !object.contains(key) || object[key].is_null()) {
        return fallback;
    }
    const json &value = object[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string format_fixed(double value, int precision) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return text;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

std::string media_type(const std::string &content_type) {
    return to_lower(trim(content_type.substr(0, content_type.find(';'))));
}

std::string image_type_for_url(const std::string &url) {
    std::string path = to_lower(url.substr(0, url.find_first_of("?#")));
    auto ends_with = [&path](const std::string &suffix) {
        return path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(".png")) {
        return "image/png";
    }
    if (ends_with(".gif")) {
        return "image/gif";
    }
    if (ends_with(".webp")) {
        return "image/webp";
    }
    return "image/jpeg";
}

EncodedImage base64_encode(const std::string &bytes) {
    EncodedImage result;
    if (bytes.empty()) {
        result.error_message = "Image data is empty";
        return result;
    }
    if (bytes.size() > static_cast<size_t>(INT_MAX / 4 * 3 - 4)) {
        result.error_message = "Image is too large to encode (" + std::to_string(bytes.size()) + " bytes)";
        return result;
    }
    std::string encoded(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int length = lws_b64_encode_string(bytes.data(), static_cast<int>(bytes.size()), &encoded[0],
                                       static_cast<int>(encoded.size()));
    if (length <= 0) {
        result.error_message = "Failed to encode image data";
        return result;
    }
    encoded.resize(static_cast<size_t>(length));
    result.success = true;
    result.data = std::move(encoded);
    return result;
}

} // namespace tool_support
