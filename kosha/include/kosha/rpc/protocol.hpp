#pragma once
// RPC Protocol: JSON-RPC 2.0 envelopes and error codes
//
// Standard codes for malformed traffic; -32010..-32015 for engine errors,
// with data.kind naming the ErrorKind.

#include "../error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace kosha::rpc {

using json = nlohmann::json;

// Replace invalid UTF-8 with U+FFFD so payload bytes survive json::dump
inline std::string sanitize_utf8(const std::string& input) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());

    auto continuation = [&](size_t at) {
        return at < input.size() && (static_cast<unsigned char>(input[at]) & 0xC0) == 0x80;
    };

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool valid = len > 0;
        for (size_t k = 1; valid && k < len; ++k) valid = continuation(i + k);

        if (valid) {
            output.append(input, i, len);
            i += len;
        } else {
            output += REPLACEMENT;
            ++i;
        }
    }
    return output;
}

namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Engine errors
    constexpr int VALIDATION = -32010;
    constexpr int NOT_FOUND = -32011;
    constexpr int CONSISTENCY_GAP = -32012;
    constexpr int RESOURCE_EXHAUSTED = -32013;
    constexpr int DEPENDENCY_FAILURE = -32014;
    constexpr int IO_ERROR = -32015;
}

inline int error_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return error::VALIDATION;
        case ErrorKind::NotFound: return error::NOT_FOUND;
        case ErrorKind::ConsistencyGap: return error::CONSISTENCY_GAP;
        case ErrorKind::ResourceExhaustion: return error::RESOURCE_EXHAUSTED;
        case ErrorKind::DependencyFailure: return error::DEPENDENCY_FAILURE;
        case ErrorKind::Io: return error::IO_ERROR;
        case ErrorKind::Internal: return error::INTERNAL_ERROR;
    }
    return error::INTERNAL_ERROR;
}

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message,
                       const json& data = json()) {
    json err = {
        {"code", code},
        {"message", sanitize_utf8(message)}
    };
    if (!data.is_null()) err["data"] = data;
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", err}
    };
}

inline json make_error(const json& id, const Error& e) {
    return make_error(id, error_code_for(e.kind), e.message,
                      {{"kind", error_kind_name(e.kind)}});
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("params") && !request["params"].is_object()) {
        error_msg = "params must be an object";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

} // namespace kosha::rpc
