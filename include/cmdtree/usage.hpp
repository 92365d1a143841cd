#ifndef CMDTREE_USAGE_HPP
#define CMDTREE_USAGE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "command.hpp"
#include "option.hpp"

namespace cmdtree::usage {

inline constexpr std::string_view kUnsetScript = "undef_script_name";
inline constexpr std::string_view kUnsetVersion = "undef_script_ver";

// "-x", "--long" or "-x, --long".
std::string optionText(const OptionSpec& opt);

// Help string, with " [default: <value>]" appended when a default is declared.
std::string helpText(const OptionSpec& opt);

// Widest option text in `opts`.
std::size_t columnWidth(const std::vector<OptionSpec>& opts);

// One option row (newline-terminated). `column` is the option column width plus one.
// Rows are aligned when the column is narrower than half the line, stacked otherwise.
std::string formatOptionRow(std::size_t column, std::size_t lineWidth, std::string_view optText, std::string_view help);

// Every option row followed by a blank line; empty string for no options.
std::string optionsSection(const std::vector<OptionSpec>& opts, std::size_t lineWidth);

// Distinct names in declaration order.
std::vector<std::string> commandNames(const std::vector<CommandSpec>& commands);

std::string subcommandsSection(const std::vector<std::string>& names);

// "Usage: <script> <args> [options]\n\n"
std::string usageLine(std::string_view script, std::string_view args);

std::string footer(std::string_view script);

// Usage of one leaf: path, leaf name and slot placeholders, then the leaf's own options.
std::string leafUsage(std::string_view script,
                      const std::vector<std::string>& path,
                      const CommandSpec& leaf,
                      std::size_t lineWidth);

// Usage listing the commands available under `path`.
std::string treeUsage(std::string_view script,
                      const std::vector<std::string>& path,
                      const std::vector<OptionSpec>& opts,
                      const std::vector<std::string>& names,
                      std::size_t lineWidth);

} // namespace cmdtree::usage

#endif // CMDTREE_USAGE_HPP
