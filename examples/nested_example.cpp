#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cmdtree/cmdtree.hpp"

// app user show <id>
// app user rename <id> <name> [--force]
// app tag add <tag> [...]
int main(int argc, char** argv) {
    using cmdtree::ArgSlot;
    using cmdtree::CommandSpec;

    auto show = CommandSpec::leaf("show", {ArgSlot::named("id")}, [](cmdtree::Context& ctx) {
        ctx.out() << "user " << *ctx.binding("id") << "\n";
        return 0;
    });

    auto renameCmd = CommandSpec::leaf(
        "rename",
        {ArgSlot::named("id"), ArgSlot::named("name")},
        [](cmdtree::Context& ctx) {
            if (ctx.binding("name")->empty() && !ctx.opt<bool>("force", false)) {
                cmdtree::haltWith("refusing to set an empty name without --force", 2);
            }
            ctx.out() << "renamed " << *ctx.binding("id") << " to " << *ctx.binding("name") << "\n";
            return 0;
        },
        {cmdtree::OptionSpec("force", 'f', "force", "Allow empty names.")});

    auto add = CommandSpec::leaf("add", {ArgSlot::named("tag"), ArgSlot::variadic()}, [](cmdtree::Context& ctx) {
        ctx.out() << *ctx.binding("tag") << ": " << ctx.rest().size() << " item(s)\n";
        return 0;
    });

    cmdtree::App app("app");
    app.version("0.2.0")
        .addCommand(CommandSpec::collection("user", {std::move(show), std::move(renameCmd)}))
        .addCommand(CommandSpec::collection("tag", {std::move(add)}));
    return app.run(argc, argv);
}
