#include "protocols/shell/util/argsHelpers.hpp"

#include <algorithm>

namespace fw::protocols::shell {

namespace {
const std::vector<std::string> GLOBAL_FLAGS{"c", "config", "root", "json"};
}

CommandResult invalid(std::string msg) { return {2, "", std::move(msg) + "\n"}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }

CommandResult okJson(nlohmann::json data) {
    CommandResult r;
    r.stdout_text = data.dump(2) + "\n";
    r.data = std::move(data);
    r.has_data = true;
    return r;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    std::optional<std::string> found;
    for (const auto& [k, v] : c.options) if (k == key) found = v.value_or(std::string{});
    return found;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

std::vector<std::string> optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options) if (k == key && v) out.push_back(*v);
    return out;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

std::optional<std::string> unknownFlag(const CommandCall& c, const std::vector<std::string>& allowed) {
    for (const auto& [k, v] : c.options) {
        if (std::ranges::find(allowed, k) != allowed.end()) continue;
        if (std::ranges::find(GLOBAL_FLAGS, k) != GLOBAL_FLAGS.end()) continue;
        return k;
    }
    return std::nullopt;
}

}
