#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

namespace fw::protocols::shell {

void registerSystemCommands(Router& r) {
    r.registerCommand("help", {
        "help", "Show this help",
        [&r](const CommandCall&) { return ok(r.usage()); },
        false, {"h", "?"}
    });
}

}
