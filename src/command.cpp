#include "cmdtree/command.hpp"

#include <stdexcept>

namespace cmdtree {

ArgSlot ArgSlot::named(std::string id) {
    if (id.empty()) throw std::invalid_argument("argument slot name must not be empty");
    if (id == kRestId) {
        throw std::invalid_argument("\"" + std::string(kRestId) + "\" is reserved for the variadic slot");
    }
    return ArgSlot(std::move(id), false);
}

CommandSpec::CommandSpec(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {
    if (name_.empty()) throw std::invalid_argument("command name must not be empty");
    if (name_.front() == '-') throw std::invalid_argument("command name \"" + name_ + "\" must not start with '-'");
}

CommandSpec CommandSpec::collection(std::string name, std::vector<CommandSpec> children) {
    CommandSpec cmd(Kind::Collection, std::move(name));
    cmd.children_ = std::move(children);
    return cmd;
}

CommandSpec CommandSpec::leaf(std::string name,
                              std::vector<ArgSlot> slots,
                              Handler handler,
                              std::vector<OptionSpec> options) {
    CommandSpec cmd(Kind::Leaf, std::move(name));
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].isVariadic() && i + 1 != slots.size()) {
            throw std::invalid_argument("variadic slot must be the last slot of \"" + cmd.name_ + "\"");
        }
    }
    if (!handler) throw std::invalid_argument("leaf command \"" + cmd.name_ + "\" needs a handler");
    cmd.slots_ = std::move(slots);
    cmd.handler_ = std::move(handler);
    cmd.options_ = std::move(options);
    return cmd;
}

CommandSpec& CommandSpec::addCommand(CommandSpec cmd) {
    if (kind_ != Kind::Collection) throw std::logic_error("cannot add subcommands to leaf \"" + name_ + "\"");
    children_.push_back(std::move(cmd));
    return *this;
}

CommandSpec& CommandSpec::withOption(OptionSpec option) {
    if (kind_ != Kind::Leaf) throw std::logic_error("cannot add options to collection \"" + name_ + "\"");
    options_.push_back(std::move(option));
    return *this;
}

} // namespace cmdtree
