#include "engine/errors.hpp"

#include <nlohmann/json.hpp>

std::string fw::engine::to_string(const ErrorType type) {
    switch (type) {
        case ErrorType::SecurityError: return "SecurityError";
        case ErrorType::NotFoundError: return "NotFoundError";
        case ErrorType::NotADirectoryError: return "NotADirectoryError";
        case ErrorType::IOError: return "IOError";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::InvalidRequest: return "InvalidRequest";
        case ErrorType::InternalError: return "InternalError";
        default: return "UnknownError";
    }
}

void fw::engine::to_json(nlohmann::json& j, const Error& e) {
    j = {
        {"error", true},
        {"error_type", to_string(e.type)},
        {"error_message", e.message}
    };
}
