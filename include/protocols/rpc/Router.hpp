#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace fw::protocols::rpc {

using json = nlohmann::json;

// Routes {"command", "payload", "request_id"?} requests to payload handlers and wraps
// whatever they return (or throw) into a response document.
class Router {
  public:
    using RawPayloadHandler = std::function<json(const json& payload)>;

    void registerPayload(const std::string& cmd, RawPayloadHandler fn);

    // Payload: json Obj::method(const json&) const
    template <class Obj>
    void registerPayload(std::string cmd, const Obj* obj, json (Obj::*mf)(const json&) const) {
        registerPayload(std::move(cmd),
            [obj, mf](const json& payload) {
                return (obj->*mf)(payload);
            });
    }

    // Payload: json fn(const json&)
    void registerPayload(const std::string& cmd, json (*fn)(const json& payload)) {
        registerPayload(cmd, RawPayloadHandler{[fn](const json& payload) {
            return fn(payload);
        }});
    }

    [[nodiscard]] json routeMessage(const json& msg) const;

    // One request per line; a line that is not JSON yields an InvalidRequest response.
    [[nodiscard]] json routeLine(const std::string& line) const;

    [[nodiscard]] bool hasCommand(const std::string& cmd) const { return handlers_.contains(cmd); }
    [[nodiscard]] std::vector<std::string> commands() const;

  private:
    std::unordered_map<std::string, RawPayloadHandler> handlers_;
};

}
