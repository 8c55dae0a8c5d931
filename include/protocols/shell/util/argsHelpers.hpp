#pragma once

#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fw::protocols::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);
CommandResult okJson(nlohmann::json data);

// Last occurrence wins; a bare flag yields "".
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

// Every value given for a repeatable flag, in order.
std::vector<std::string> optVals(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// Flags a command accepts on top of the global ones; anything else is a usage error.
std::optional<std::string> unknownFlag(const CommandCall& c, const std::vector<std::string>& allowed);

}
