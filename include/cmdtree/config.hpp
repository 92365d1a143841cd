#ifndef CMDTREE_CONFIG_HPP
#define CMDTREE_CONFIG_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "option.hpp"
#include "parsed_options.hpp"

namespace cmdtree::config {

using RawEntries = std::vector<std::pair<std::string, std::string>>;

// `key = value` lines; blank lines and `#` comments are skipped, matching single or double
// quotes around the value are stripped. Returns an error for a line without '='.
std::optional<std::string> parseEnvLike(std::istream& in, RawEntries& out);

// A single JSON object of scalars. Nested objects flatten to dotted keys, nulls are
// skipped, arrays are rejected.
std::optional<std::string> parseJson(std::istream& in, RawEntries& out);

// Reads `path` (JSON when it ends in ".json", env-like otherwise). A missing file yields
// no entries and no error.
std::optional<std::string> loadFile(const std::string& path, RawEntries& out);

// Types raw entries against `specs`. A key naming an option (by identifier, long name, or
// long name with '_' for '-') is stored under the option identifier and must convert to
// the option's type; other keys are kept as strings.
std::optional<std::string> toOptions(const RawEntries& raw,
                                     const std::vector<OptionSpec>& specs,
                                     std::vector<ParsedOptions::Entry>& out);

} // namespace cmdtree::config

#endif // CMDTREE_CONFIG_HPP
