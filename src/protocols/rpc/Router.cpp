#include "protocols/rpc/Router.hpp"
#include "protocols/rpc/model/Response.hpp"
#include "engine/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace fw::protocols::rpc;
using namespace fw::protocols::rpc::model;
using namespace fw::engine;

void Router::registerPayload(const std::string& cmd, RawPayloadHandler fn) {
    handlers_[cmd] = std::move(fn);
}

std::vector<std::string> Router::commands() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [cmd, _] : handlers_) out.push_back(cmd);
    std::ranges::sort(out);
    return out;
}

json Router::routeMessage(const json& msg) const {
    std::string command = "unknown";
    json requestId{};

    try {
        log::Registry::rpc()->debug("[Router] Routing message: {}", msg.dump());

        if (!msg.is_object()) throw InvalidRequestError("Request must be a JSON object");
        if (msg.contains("request_id")) requestId = msg["request_id"];
        if (!msg.contains("command") || !msg["command"].is_string()) throw InvalidRequestError("Request has no command");
        command = msg["command"].get<std::string>();

        const auto it = handlers_.find(command);
        if (it == handlers_.end()) {
            log::Registry::rpc()->warn("[Router] Unknown command: {}", command);
            throw InvalidRequestError("Unknown command: " + command);
        }

        const json payload = msg.contains("payload") ? msg["payload"] : json::object();
        if (!payload.is_object()) throw InvalidRequestError("payload must be a JSON object");

        return Response::SUCCESS(command, requestId, it->second(payload)).toJson();
    } catch (const EngineError& e) {
        return Response::ERROR(command, requestId, e.toError()).toJson();
    } catch (const json::exception& e) {
        log::Registry::rpc()->warn("[Router] Malformed payload for {}: {}", command, e.what());
        return Response::ERROR(command, requestId, {ErrorType::InvalidRequest, e.what()}).toJson();
    } catch (const std::exception& e) {
        log::Registry::rpc()->error("[Router] Error routing {}: {}", command, e.what());
        return Response::ERROR(command, requestId, {ErrorType::InternalError, e.what()}).toJson();
    }
}

json Router::routeLine(const std::string& line) const {
    const auto msg = json::parse(line, nullptr, false);
    if (msg.is_discarded()) {
        log::Registry::rpc()->warn("[Router] Discarding request that is not valid JSON");
        return Response::ERROR("unknown", json{}, {ErrorType::InvalidRequest, "Request is not valid JSON"}).toJson();
    }
    return routeMessage(msg);
}
