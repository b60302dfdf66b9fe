#include "protocol/json_rpc.hpp"

namespace json_rpc {

static bool is_valid_id(const json &id) {
    return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

ParseRequestResult parse_request(const json &message) {
    ParseRequestResult parsed;

    if (!message.is_object()) {
        parsed.error_message = "Request must be a JSON object";
        return parsed;
    }

    auto version_iterator = message.find("jsonrpc");
    if (version_iterator == message.end() || !version_iterator->is_string() ||
        version_iterator->get<std::string>() != JSONRPC_VERSION) {
        parsed.error_message = "jsonrpc must be \"2.0\"";
        return parsed;
    }

    auto method_iterator = message.find("method");
    if (method_iterator == message.end() || !method_iterator->is_string()) {
        parsed.error_message = "Missing or invalid 'method'";
        return parsed;
    }
    parsed.request.method = method_iterator->get<std::string>();

    auto params_iterator = message.find("params");
    if (params_iterator != message.end() && !params_iterator->is_null()) {
        if (!params_iterator->is_object() && !params_iterator->is_array()) {
            parsed.error_message = "params must be an object or an array";
            return parsed;
        }
        parsed.request.params = *params_iterator;
    }

    auto id_iterator = message.find("id");
    if (id_iterator != message.end()) {
        if (!is_valid_id(*id_iterator)) {
            parsed.error_message = "id must be a string, an integer or null";
            return parsed;
        }
        parsed.request.id = *id_iterator;
    }

    parsed.success = true;
    return parsed;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

std::string encode_response(const json &response) {
    // Replace rather than throw on invalid UTF-8 that slipped past sanitation.
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

DecodeResponseResult decode_response(const std::string &encoded) {
    DecodeResponseResult decoded;

    json message = json::parse(encoded, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        decoded.error_message = "Response is not a JSON object";
        return decoded;
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != JSONRPC_VERSION) {
        decoded.error_message = "jsonrpc must be \"2.0\"";
        return decoded;
    }

    bool has_result = message.contains("result");
    bool has_error = message.contains("error");
    if (has_result == has_error) {
        decoded.error_message = "Response must carry exactly one of result or error";
        return decoded;
    }

    decoded.response.id = get_id(message);
    if (has_result) {
        decoded.response.result = message["result"];
    } else {
        const json &error_object = message["error"];
        if (!error_object.is_object() || !error_object.contains("code") || !error_object["code"].is_number_integer() ||
            !error_object.contains("message") || !error_object["message"].is_string()) {
            decoded.error_message = "error must be an object with integer code and string message";
            return decoded;
        }
        decoded.response.is_error = true;
        decoded.response.error_code = error_object["code"].get<int>();
        decoded.response.error_message = error_object["message"].get<std::string>();
    }

    decoded.success = true;
    return decoded;
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

} // namespace json_rpc
