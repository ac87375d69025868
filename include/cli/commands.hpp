#pragma once

namespace vc::cli {

class Router;
class Context;

void registerCatalogCommands(Router& r, Context& ctx);
void registerJobCommands(Router& r, Context& ctx);
void registerEngineCommands(Router& r, Context& ctx);
void registerIdentityCommands(Router& r, Context& ctx);
void registerConfigCommands(Router& r, Context& ctx);
void registerSystemCommands(Router& r);

inline void registerAllCommands(Router& r, Context& ctx) {
    registerCatalogCommands(r, ctx);
    registerJobCommands(r, ctx);
    registerEngineCommands(r, ctx);
    registerIdentityCommands(r, ctx);
    registerConfigCommands(r, ctx);
    registerSystemCommands(r);
}

}
