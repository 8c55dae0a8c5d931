#pragma once

#include "engine/errors.hpp"

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace fw::protocols::rpc::model {

using json = nlohmann::json;

enum class Status { OK, ERROR };

struct Response {
    std::string cmd;
    json request_id{}, data{};
    Status status = Status::OK;
    std::optional<engine::Error> error{};

    [[nodiscard]] json toJson() const;

    static Response SUCCESS(std::string cmd, json requestId, json&& data);

    static Response ERROR(std::string cmd, json requestId, engine::Error error);
};

std::string to_string(const Status& status);

}
