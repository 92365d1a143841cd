#ifndef CMDTREE_APP_HPP
#define CMDTREE_APP_HPP

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "command.hpp"
#include "matcher.hpp"
#include "option.hpp"
#include "parsed_options.hpp"

namespace cmdtree {

// Owns the declared command tree and dispatches one invocation against it.
//
//   cmdtree::App app("tool");
//   app.version("1.0").addCommand(cmdtree::CommandSpec::leaf("run", {...}, handler));
//   return app.run(argc, argv);
//
// Usage, help and version output all end with status 0; option parse errors and config
// load errors end with status 1; otherwise the handler's return value is the status.
class App {
public:
    struct Outcome {
        enum class Kind {
            UsageDisplayed,
            VersionDisplayed,
            Dispatched,
            Fatal,
        };

        Kind kind{Kind::UsageDisplayed};
        int exitCode{0};
    };

    explicit App(std::string script = {}) : script_(std::move(script)) {}

    App& version(std::string v) {
        version_ = std::move(v);
        return *this;
    }

    // Key/value file overlaid on the options of a resolved leaf (if the file exists).
    App& configFile(std::string path) {
        configFile_ = std::move(path);
        return *this;
    }

    App& addCommand(CommandSpec cmd) {
        commands_.push_back(std::move(cmd));
        return *this;
    }

    App& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    App& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    // Pins the usage line width instead of asking the terminal.
    App& setLineWidth(std::size_t width) {
        lineWidth_ = width;
        return *this;
    }


    // `args` excludes the program name.
    Outcome dispatch(const std::vector<std::string>& args) const;

    int execute(const std::vector<std::string>& args) const { return dispatch(args).exitCode; }

    int run(int argc, char** argv) const {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return execute(args);
    }

    // Text printed for help / usage at a given match; exposed for embedding hosts.
    [[nodiscard]] std::string leafUsage(const CommandSpec& leaf, const std::vector<std::string>& path) const;
    [[nodiscard]] std::string treeUsage(const Match& match, bool withGlobalOptions) const;

private:
    std::ostream& out() const { return out_ ? *out_ : std::cout; }
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }
    std::size_t lineWidth() const;

    Outcome dispatchLeaf(const Match& match, const std::vector<std::string>& rest) const;
    Outcome dispatchTree(const Match& match, const std::vector<std::string>& rest) const;
    std::optional<std::string> applyConfigFile(const CommandSpec& leaf, ParsedOptions& opts) const;
    Outcome fail(const std::string& message) const;

    std::string script_;
    std::string version_;
    std::optional<std::string> configFile_;
    std::vector<CommandSpec> commands_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
    std::optional<std::size_t> lineWidth_;
};

} // namespace cmdtree

#endif // CMDTREE_APP_HPP
