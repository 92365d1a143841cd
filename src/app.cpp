#include "cmdtree/app.hpp"

#include <string_view>

#include "cmdtree/config.hpp"
#include "cmdtree/context.hpp"
#include "cmdtree/halt.hpp"
#include "cmdtree/parser.hpp"
#include "cmdtree/terminal.hpp"
#include "cmdtree/usage.hpp"

namespace cmdtree {

App::Outcome App::dispatch(const std::vector<std::string>& args) const {
    const auto [targets, rest] = splitTargets(args);
    const auto match = matchCommand(commands_, targets);

    switch (match.status) {
    case Match::Status::Resolved:
        return dispatchLeaf(match, rest);
    case Match::Status::PartialMatch:
        if (match.node && match.node->isLeaf()) {
            out() << leafUsage(*match.node, match.path);
            return {Outcome::Kind::UsageDisplayed, 0};
        }
        return dispatchTree(match, rest);
    case Match::Status::NoMatch:
        return dispatchTree(match, rest);
    }
    return {Outcome::Kind::UsageDisplayed, 0};
}

App::Outcome App::dispatchLeaf(const Match& match, const std::vector<std::string>& rest) const {
    const CommandSpec& leaf = *match.node;

    std::vector<OptionSpec> specs;
    specs.reserve(leaf.options().size() + 1);
    specs.push_back(helpOption());
    specs.insert(specs.end(), leaf.options().begin(), leaf.options().end());

    Parser parser(specs, rest);
    if (!parser.ok()) return fail("Invalid option sequence given: " + parser.error());
    ParsedOptions opts = parser.takeOptions();

    if (auto err = applyConfigFile(leaf, opts)) return fail(*err);

    if (opts.isSet("help")) {
        out() << leafUsage(leaf, match.path);
        return {Outcome::Kind::UsageDisplayed, 0};
    }

    Context ctx(leaf, match.path, match.bindings, opts, out(), err());
    try {
        return {Outcome::Kind::Dispatched, leaf.handler()(ctx)};
    } catch (const Halt& h) {
        if (!h.message().empty()) {
            err() << h.message();
            if (h.message().back() != '\n') err() << "\n";
        }
        return {Outcome::Kind::Dispatched, h.code()};
    }
}

App::Outcome App::dispatchTree(const Match& match, const std::vector<std::string>& rest) const {
    const std::vector<OptionSpec> specs{helpOption(), versionOption()};
    Parser parser(specs, rest);
    if (!parser.ok()) return fail("Invalid option sequence given: " + parser.error());

    if (parser.options().isSet("version")) {
        out() << (script_.empty() ? usage::kUnsetScript : std::string_view(script_)) << " "
              << (version_.empty() ? usage::kUnsetVersion : std::string_view(version_)) << "\n";
        return {Outcome::Kind::VersionDisplayed, 0};
    }

    out() << treeUsage(match, match.path.empty());
    return {Outcome::Kind::UsageDisplayed, 0};
}

std::optional<std::string> App::applyConfigFile(const CommandSpec& leaf, ParsedOptions& opts) const {
    if (!configFile_) return std::nullopt;

    config::RawEntries raw;
    std::vector<ParsedOptions::Entry> typed;
    auto err = config::loadFile(*configFile_, raw);
    if (!err) err = config::toOptions(raw, leaf.options(), typed);
    if (err) return "Failed to load " + *configFile_ + ": " + *err;

    opts.overlay(typed);
    return std::nullopt;
}

App::Outcome App::fail(const std::string& message) const {
    err() << message;
    if (message.empty() || message.back() != '\n') err() << "\n";
    return {Outcome::Kind::Fatal, 1};
}

std::string App::leafUsage(const CommandSpec& leaf, const std::vector<std::string>& path) const {
    return usage::leafUsage(script_, path, leaf, lineWidth());
}

std::string App::treeUsage(const Match& match, bool withGlobalOptions) const {
    std::vector<OptionSpec> opts;
    if (withGlobalOptions) opts = {helpOption(), versionOption()};
    const auto& level = match.node ? match.node->children() : commands_;
    return usage::treeUsage(script_, match.path, opts, usage::commandNames(level), lineWidth());
}

std::size_t App::lineWidth() const {
    if (lineWidth_) return *lineWidth_;
    return terminal::lineLength(terminal::Stream::Stdout);
}

} // namespace cmdtree
