#pragma once

#include "engine/errors.hpp"

#include <utility>
#include <variant>

namespace fw::engine {

// Either the tagged result of an operation or a structured error. Never both.
template <typename T>
class Outcome {
public:
    Outcome(T value) : state_(std::move(value)) {}
    Outcome(Error error) : state_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const T& value() const { return std::get<T>(state_); }
    [[nodiscard]] T& value() { return std::get<T>(state_); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(state_); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    std::variant<T, Error> state_;
};

}
