#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "protocols/rpc/Router.hpp"
#include "protocols/rpc/handler/Folders.hpp"
#include "log/Registry.hpp"

#include <iostream>
#include <string>

namespace fw::protocols::shell {

// One JSON request per input line, one JSON response per output line, until EOF.
static CommandResult handle_rpc(const CommandCall& call) {
    rpc::Router router;
    const rpc::handler::Folders folders(*call.engine);
    folders.registerAll(router);

    std::istream& in = call.in ? *call.in : std::cin;
    std::ostream& out = call.out ? *call.out : std::cout;

    std::size_t handled = 0;
    for (std::string line; std::getline(in, line);) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        out << router.routeLine(line).dump() << '\n';
        out.flush();
        ++handled;
    }

    log::Registry::rpc()->info("[rpc] Served {} requests", handled);
    return ok("");
}

void registerRpcCommands(Router& r) {
    r.registerCommand("rpc", {
        "rpc", "Serve JSON requests from stdin, one per line",
        handle_rpc, true, {"serve"}
    });
}

}
