#ifndef CMDTREE_MATCHER_HPP
#define CMDTREE_MATCHER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "command.hpp"

namespace cmdtree {

struct Match {
    enum class Status {
        Resolved,     // `node` is a leaf whose slots bound cleanly
        PartialMatch, // `node` is the deepest leaf or collection reached
        NoMatch,      // the first token names no top-level command
    };

    Status status{Status::NoMatch};
    const CommandSpec* node{nullptr};
    Bindings bindings;
    // Collection names traversed, outermost first. Excludes a matched leaf's own name.
    std::vector<std::string> path;
};

// Splits argv (without the program name) at the first token starting with '-': the leading
// tokens are the candidate command path, the rest goes to the option parser.
std::pair<std::vector<std::string>, std::vector<std::string>> splitTargets(const std::vector<std::string>& args);

// Binds `tokens[first..]` to `slots`; nullopt on too few tokens, or on leftovers without a
// variadic slot to take them.
std::optional<Bindings> bindSlots(const std::vector<ArgSlot>& slots,
                                  const std::vector<std::string>& tokens,
                                  std::size_t first = 0);

// Resolves `targets` against the command tree. Siblings are scanned in declaration order
// and the first whose name equals the token is taken.
Match matchCommand(const std::vector<CommandSpec>& commands, const std::vector<std::string>& targets);

} // namespace cmdtree

#endif // CMDTREE_MATCHER_HPP
