#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    using cmdtree::ArgSlot;
    using cmdtree::CommandSpec;

    cmdtree::App app("app");
    app.version("0.1.0");

    auto print = CommandSpec::leaf("print", {}, [](cmdtree::Context& ctx) {
        ctx.out() << ctx.opt<std::string>("message", "Hello, World!") << "\n";
        return 0;
    });
    print.withOption(cmdtree::OptionSpec("message", 'm', "message",
                                         cmdtree::ArgSpec{cmdtree::ArgType::String, std::string("Hello, World!")},
                                         "Message to print"));

    auto echo = CommandSpec::leaf("echo", {ArgSlot::variadic()}, [](cmdtree::Context& ctx) {
        const auto& words = ctx.rest();
        for (std::size_t i = 0; i < words.size(); ++i) {
            if (i) ctx.out() << " ";
            ctx.out() << words[i];
        }
        ctx.out() << "\n";
        return 0;
    });

    app.addCommand(std::move(print));
    app.addCommand(std::move(echo));
    return app.run(argc, argv);
}
