#ifndef CMDTREE_CONTEXT_HPP
#define CMDTREE_CONTEXT_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "command.hpp"
#include "parsed_options.hpp"

namespace cmdtree {

// What a leaf handler gets: its positional bindings, the parsed options and the streams
// the dispatcher writes to. Only valid for the duration of the handler call.
class Context {
public:
    Context(const CommandSpec& command,
            const std::vector<std::string>& path,
            const Bindings& bindings,
            const ParsedOptions& options,
            std::ostream& out,
            std::ostream& err)
        : command_(command), path_(path), bindings_(bindings), options_(options), out_(out), err_(err) {}

    [[nodiscard]] const CommandSpec& command() const { return command_; }
    // Collection names traversed to reach the command.
    [[nodiscard]] const std::vector<std::string>& path() const { return path_; }

    [[nodiscard]] const Bindings& bindings() const { return bindings_; }
    [[nodiscard]] const Bindings::Value* find(std::string_view id) const { return bindings_.find(id); }
    [[nodiscard]] std::optional<std::string> binding(std::string_view id) const { return bindings_.get(id); }
    [[nodiscard]] const std::vector<std::string>& rest() const {
        static const std::vector<std::string> kEmpty;
        const auto* r = bindings_.rest();
        return r ? *r : kEmpty;
    }

    [[nodiscard]] const ParsedOptions& options() const { return options_; }
    [[nodiscard]] bool hasOpt(const std::string& id) const { return options_.has(id); }
    template <typename T>
    T opt(const std::string& id, T defaultValue = T()) const {
        return options_.get<T>(id, std::move(defaultValue));
    }
    std::string opt(const std::string& id, const char* defaultValue) const {
        return options_.get<std::string>(id, defaultValue);
    }

    std::ostream& out() const { return out_; }
    std::ostream& err() const { return err_; }

private:
    const CommandSpec& command_;
    const std::vector<std::string>& path_;
    const Bindings& bindings_;
    const ParsedOptions& options_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace cmdtree

#endif // CMDTREE_CONTEXT_HPP
