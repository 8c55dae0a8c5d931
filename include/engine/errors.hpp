#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fw::engine {

enum class ErrorType {
    SecurityError,
    NotFoundError,
    NotADirectoryError,
    IOError,
    ConfigError,
    InvalidRequest,
    InternalError
};

std::string to_string(ErrorType type);

struct Error {
    ErrorType type{ErrorType::InternalError};
    std::string message;
};

void to_json(nlohmann::json& j, const Error& e);

class EngineError : public std::runtime_error {
public:
    EngineError(const ErrorType type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    [[nodiscard]] ErrorType type() const { return type_; }
    [[nodiscard]] Error toError() const { return {type_, what()}; }

private:
    ErrorType type_;
};

struct SecurityError final : EngineError {
    explicit SecurityError(const std::string& message) : EngineError(ErrorType::SecurityError, message) {}
};

struct NotFoundError final : EngineError {
    explicit NotFoundError(const std::string& message) : EngineError(ErrorType::NotFoundError, message) {}
};

struct NotADirectoryError final : EngineError {
    explicit NotADirectoryError(const std::string& message) : EngineError(ErrorType::NotADirectoryError, message) {}
};

struct IOError final : EngineError {
    explicit IOError(const std::string& message) : EngineError(ErrorType::IOError, message) {}
};

struct ConfigError final : EngineError {
    explicit ConfigError(const std::string& message) : EngineError(ErrorType::ConfigError, message) {}
};

struct InvalidRequestError final : EngineError {
    explicit InvalidRequestError(const std::string& message) : EngineError(ErrorType::InvalidRequest, message) {}
};

}
