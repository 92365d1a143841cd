#ifndef CMDTREE_COMMAND_HPP
#define CMDTREE_COMMAND_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "option.hpp"

namespace cmdtree {

class Context;

// One positional slot of a leaf command: either binds a single token to a name, or (the
// variadic marker, always last) captures every remaining token under `others`.
class ArgSlot {
public:
    static constexpr std::string_view kRestId = "others";

    static ArgSlot named(std::string id);
    static ArgSlot variadic() { return ArgSlot(std::string(kRestId), true); }

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] bool isVariadic() const { return variadic_; }

    // "<id>" or "[...]" as shown in usage lines.
    [[nodiscard]] std::string placeholder() const { return variadic_ ? "[...]" : "<" + id_ + ">"; }

private:
    ArgSlot(std::string id, bool variadic) : id_(std::move(id)), variadic_(variadic) {}

    std::string id_;
    bool variadic_{false};
};

// Positional values bound while matching a leaf, in slot order.
class Bindings {
public:
    using Value = std::variant<std::string, std::vector<std::string>>;
    using Entry = std::pair<std::string, Value>;

    void bind(std::string id, std::string value) { entries_.emplace_back(std::move(id), std::move(value)); }
    void bindRest(std::vector<std::string> tokens) {
        entries_.emplace_back(std::string(ArgSlot::kRestId), std::move(tokens));
    }

    [[nodiscard]] const Value* find(std::string_view id) const {
        for (const auto& e : entries_) {
            if (e.first == id) return &e.second;
        }
        return nullptr;
    }

    [[nodiscard]] bool has(std::string_view id) const { return find(id) != nullptr; }

    // Value of a named slot; nullopt when unbound or when `id` is the variadic capture.
    [[nodiscard]] std::optional<std::string> get(std::string_view id) const {
        const auto* v = find(id);
        if (!v) return std::nullopt;
        if (const auto* s = std::get_if<std::string>(v)) return *s;
        return std::nullopt;
    }

    // Variadic capture; nullptr when the leaf has no variadic slot.
    [[nodiscard]] const std::vector<std::string>* rest() const {
        const auto* v = find(ArgSlot::kRestId);
        if (!v) return nullptr;
        return std::get_if<std::vector<std::string>>(v);
    }

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    bool operator==(const Bindings& other) const { return entries_ == other.entries_; }

private:
    std::vector<Entry> entries_;
};

// A node of the declared command tree: a collection of subcommands or a runnable leaf.
//
// Sibling names are expected to be unique. This is not checked: lookups scan siblings in
// declaration order and the first match wins, so a later duplicate is shadowed.
class CommandSpec {
public:
    enum class Kind {
        Collection,
        Leaf,
    };

    // Receives the invocation context, returns the process exit status.
    using Handler = std::function<int(Context&)>;

    static CommandSpec collection(std::string name, std::vector<CommandSpec> children = {});
    static CommandSpec leaf(std::string name,
                            std::vector<ArgSlot> slots,
                            Handler handler,
                            std::vector<OptionSpec> options = {});

    // Collection only.
    CommandSpec& addCommand(CommandSpec cmd);
    // Leaf only.
    CommandSpec& withOption(OptionSpec option);

    [[nodiscard]] bool isLeaf() const { return kind_ == Kind::Leaf; }
    [[nodiscard]] bool isCollection() const { return kind_ == Kind::Collection; }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<CommandSpec>& children() const { return children_; }
    [[nodiscard]] const std::vector<ArgSlot>& slots() const { return slots_; }
    [[nodiscard]] const std::vector<OptionSpec>& options() const { return options_; }
    [[nodiscard]] const Handler& handler() const { return handler_; }

private:
    CommandSpec(Kind kind, std::string name);

    Kind kind_;
    std::string name_;
    std::vector<CommandSpec> children_;
    std::vector<ArgSlot> slots_;
    std::vector<OptionSpec> options_;
    Handler handler_;
};

} // namespace cmdtree

#endif // CMDTREE_COMMAND_HPP
