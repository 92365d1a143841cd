#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    using cmdtree::ArgSpec;
    using cmdtree::ArgType;
    using cmdtree::OptionSpec;

    // Precedence: config file > flag > default
    auto status = cmdtree::CommandSpec::leaf(
        "status",
        {},
        [](cmdtree::Context& ctx) {
            ctx.out() << "output=" << ctx.opt<std::string>("output", "plain")
                      << " retries=" << ctx.opt<std::int64_t>("retries", 0)
                      << " verbose=" << (ctx.opt<bool>("verbose", false) ? "true" : "false") << "\n";
            return 0;
        },
        {
            OptionSpec("verbose", 'V', "verbose", "Print more."),
            OptionSpec("retries", 'r', "retries", ArgSpec{ArgType::Integer, std::int64_t{3}}, "How many times to retry."),
        });

    cmdtree::App app("app");
    app.version("0.1.0").configFile("app.conf").addCommand(std::move(status));
    return app.run(argc, argv);
}
