#pragma once

namespace fw::protocols::shell {

class Router;

void registerSystemCommands(Router& r);
void registerFolderCommands(Router& r);
void registerRpcCommands(Router& r);

inline void registerAllCommands(Router& r) {
    registerFolderCommands(r);
    registerRpcCommands(r);
    registerSystemCommands(r);
}

}
