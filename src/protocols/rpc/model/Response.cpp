#include "protocols/rpc/model/Response.hpp"

using namespace fw::protocols::rpc::model;

json Response::toJson() const {
    json response = {
        {"command", cmd},
        {"status", to_string(status)}
    };

    if (!request_id.is_null()) response["request_id"] = request_id;
    if (status == Status::OK) response["data"] = data;
    if (error) response.update(json(*error));

    return response;
}

Response Response::SUCCESS(std::string cmd, json requestId, json&& data) {
    return {std::move(cmd), std::move(requestId), std::move(data), Status::OK, std::nullopt};
}

Response Response::ERROR(std::string cmd, json requestId, engine::Error error) {
    return {std::move(cmd), std::move(requestId), json{}, Status::ERROR, std::move(error)};
}

std::string fw::protocols::rpc::model::to_string(const Status& status) {
    switch (status) {
        case Status::OK: return "ok";
        case Status::ERROR: return "error";
        default: return "unknown";
    }
}
