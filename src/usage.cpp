#include "cmdtree/usage.hpp"

#include <algorithm>
#include <sstream>

#include "cmdtree/utils.hpp"
#include "cmdtree/wrap.hpp"

namespace cmdtree::usage {

std::string optionText(const OptionSpec& opt) {
    if (opt.hasShort() && opt.hasLong()) return opt.shortFlag() + ", " + opt.longFlag();
    if (opt.hasShort()) return opt.shortFlag();
    return opt.longFlag();
}

std::string helpText(const OptionSpec& opt) {
    const auto def = opt.defaultValue();
    if (!def || opt.help().empty()) return opt.help();
    return opt.help() + " [default: " + toString(*def) + "]";
}

std::size_t columnWidth(const std::vector<OptionSpec>& opts) {
    std::size_t width = 0;
    for (const auto& o : opts) width = std::max(width, optionText(o).size());
    return width;
}

std::string formatOptionRow(std::size_t column, std::size_t lineWidth, std::string_view optText, std::string_view help) {
    std::string row = "  ";
    row += optText;
    if (help.empty()) return row + "\n";

    if (column < lineWidth / 2) {
        const auto lines = wrapLine(lineWidth - column - 3, help);
        row.append(column - optText.size() + 1, ' ');
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i != 0) {
                row.push_back('\n');
                row.append(column + 3, ' ');
            }
            row += lines[i];
        }
        return row + "\n";
    }

    const std::size_t width = lineWidth > 6 ? lineWidth - 6 : 1;
    for (const auto& line : wrapLine(width, help)) row += "\n      " + line;
    return row + "\n";
}

std::string optionsSection(const std::vector<OptionSpec>& opts, std::size_t lineWidth) {
    if (opts.empty()) return {};
    const std::size_t column = columnWidth(opts) + 1;
    std::string out;
    for (const auto& o : opts) out += formatOptionRow(column, lineWidth, optionText(o), helpText(o));
    out += "\n";
    return out;
}

std::vector<std::string> commandNames(const std::vector<CommandSpec>& commands) {
    std::vector<std::string> names;
    for (const auto& c : commands) {
        if (std::find(names.begin(), names.end(), c.name()) == names.end()) names.push_back(c.name());
    }
    return names;
}

std::string subcommandsSection(const std::vector<std::string>& names) {
    if (names.empty()) return {};
    std::ostringstream oss;
    oss << "Available subcommands: \n\n";
    for (const auto& n : names) oss << "  " << n << "\n";
    oss << "\n";
    return oss.str();
}

std::string usageLine(std::string_view script, std::string_view args) {
    std::ostringstream oss;
    oss << "Usage: " << (script.empty() ? kUnsetScript : script) << " " << args << " [options]\n\n";
    return oss.str();
}

std::string footer(std::string_view script) {
    std::ostringstream oss;
    oss << "For help on any individual command run `" << (script.empty() ? kUnsetScript : script)
        << " COMMAND -h`\n";
    return oss.str();
}

std::string leafUsage(std::string_view script,
                      const std::vector<std::string>& path,
                      const CommandSpec& leaf,
                      std::size_t lineWidth) {
    std::vector<std::string> words = path;
    words.push_back(leaf.name());
    for (const auto& slot : leaf.slots()) {
        words.push_back(slot.placeholder());
        if (slot.isVariadic()) break;
    }
    return usageLine(script, utils::join(words, " ")) + optionsSection(leaf.options(), lineWidth);
}

std::string treeUsage(std::string_view script,
                      const std::vector<std::string>& path,
                      const std::vector<OptionSpec>& opts,
                      const std::vector<std::string>& names,
                      std::size_t lineWidth) {
    return usageLine(script, utils::join(path, " ") + " <command> [<arg>]") + optionsSection(opts, lineWidth) +
           subcommandsSection(names) + footer(script);
}

} // namespace cmdtree::usage
