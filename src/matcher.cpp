#include "cmdtree/matcher.hpp"

#include <algorithm>
#include <cstddef>

namespace cmdtree {

std::pair<std::vector<std::string>, std::vector<std::string>> splitTargets(const std::vector<std::string>& args) {
    std::size_t i = 0;
    while (i < args.size() && (args[i].empty() || args[i].front() != '-')) ++i;
    return {std::vector<std::string>(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(i)),
            std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i), args.end())};
}

std::optional<Bindings> bindSlots(const std::vector<ArgSlot>& slots,
                                  const std::vector<std::string>& tokens,
                                  std::size_t first) {
    Bindings out;
    std::size_t t = first;
    for (const auto& slot : slots) {
        if (slot.isVariadic()) {
            out.bindRest(std::vector<std::string>(tokens.begin() + static_cast<std::ptrdiff_t>(std::min(t, tokens.size())),
                                                  tokens.end()));
            return out;
        }
        if (t >= tokens.size()) return std::nullopt;
        out.bind(slot.id(), tokens[t++]);
    }
    if (t < tokens.size()) return std::nullopt;
    return out;
}

namespace {

Match matchLevel(const std::vector<CommandSpec>& siblings,
                 const CommandSpec* parent,
                 const std::vector<std::string>& targets,
                 std::size_t depth,
                 std::vector<std::string> path) {
    Match m;
    m.path = std::move(path);
    if (depth >= targets.size()) {
        m.status = parent ? Match::Status::PartialMatch : Match::Status::NoMatch;
        m.node = parent;
        return m;
    }

    const std::string& token = targets[depth];
    for (const auto& cmd : siblings) {
        if (cmd.name() != token) continue;

        if (cmd.isCollection()) {
            m.path.push_back(cmd.name());
            return matchLevel(cmd.children(), &cmd, targets, depth + 1, std::move(m.path));
        }

        m.node = &cmd;
        if (auto bound = bindSlots(cmd.slots(), targets, depth + 1)) {
            m.status = Match::Status::Resolved;
            m.bindings = std::move(*bound);
        } else {
            m.status = Match::Status::PartialMatch;
        }
        return m;
    }

    m.status = parent ? Match::Status::PartialMatch : Match::Status::NoMatch;
    m.node = parent;
    return m;
}

} // namespace

Match matchCommand(const std::vector<CommandSpec>& commands, const std::vector<std::string>& targets) {
    return matchLevel(commands, nullptr, targets, 0, {});
}

} // namespace cmdtree
