#pragma once

#include <nlohmann/json_fwd.hpp>

namespace fw::engine { class Engine; }

namespace fw::protocols::rpc { class Router; }

namespace fw::protocols::rpc::handler {

using json = nlohmann::json;

// Payload handlers for every Engine operation. A failed Outcome is rethrown as the
// matching EngineError so the Router can report its type.
class Folders {
public:
    explicit Folders(const engine::Engine& engine) : engine_(engine) {}

    json check(const json& payload) const;
    json list(const json& payload) const;
    json findDuplicates(const json& payload) const;
    json planAlpha(const json& payload) const;
    json applyPlan(const json& payload) const;
    json organizeByType(const json& payload) const;
    json organizeByCategory(const json& payload) const;

    void registerAll(Router& router) const;

private:
    const engine::Engine& engine_;
};

}
