#ifndef CMDTREE_PARSER_HPP
#define CMDTREE_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "option.hpp"
#include "parsed_options.hpp"
#include "utils.hpp"

namespace cmdtree {

// Turns a token list into parsed options plus the tokens that are not flags.
//
// Accepted forms: --long, --long=value, --long value, -s, -s value, -svalue, -s=value,
// grouped short presence flags (-abc) and `--` to end flag parsing. Boolean-typed options
// take an optional following true/false literal. The first error stops parsing.
class Parser {
public:
    // Unknown flags within this edit distance of a known spelling are suggested.
    static constexpr std::size_t kSuggestionDistance = 2;

    Parser(const std::vector<OptionSpec>& specs, const std::vector<std::string>& tokens) : specs_(specs) {
        for (const auto& s : specs_) {
            if (s.hasLong()) knownKeys_.push_back(s.longFlag());
            if (s.hasShort()) knownKeys_.push_back(s.shortFlag());
        }

        bool positionalOnly = false;
        for (std::size_t i = 0; i < tokens.size() && ok_; ++i) {
            const std::string& arg = tokens[i];
            if (!positionalOnly && arg == "--") {
                positionalOnly = true;
                continue;
            }
            if (positionalOnly || !isFlagToken(arg)) {
                extras_.push_back(arg);
                continue;
            }

            if (arg.rfind("--", 0) == 0) {
                parseLong(arg, i, tokens);
            } else {
                parseShort(arg, i, tokens);
            }
        }

        if (!ok_) return;
        for (const auto& s : specs_) {
            if (auto def = s.defaultValue()) parsed_.setDefault(s.id(), std::move(*def));
        }
    }

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] const std::string& error() const { return error_; }

    [[nodiscard]] const ParsedOptions& options() const { return parsed_; }
    ParsedOptions takeOptions() { return std::move(parsed_); }

    [[nodiscard]] const std::vector<std::string>& extras() const { return extras_; }

    static bool isFlagToken(std::string_view s) {
        return s.size() >= 2 && s[0] == '-';
    }

private:
    static bool isBoolLiteral(std::string_view s) {
        return s == "1" || s == "0" || s == "true" || s == "false" || s == "True" || s == "False" ||
               s == "TRUE" || s == "FALSE" || s == "on" || s == "off" || s == "yes" || s == "no";
    }

    // First declaration wins when two specs share a spelling.
    const OptionSpec* findLong(std::string_view name) const {
        for (const auto& s : specs_) {
            if (s.hasLong() && s.longName() == name) return &s;
        }
        return nullptr;
    }

    const OptionSpec* findShort(char c) const {
        for (const auto& s : specs_) {
            if (s.hasShort() && s.shortName() == c) return &s;
        }
        return nullptr;
    }

    void parseLong(const std::string& arg, std::size_t& i, const std::vector<std::string>& tokens) {
        std::string key = arg;
        std::optional<std::string> inlineValue;
        const auto eq = arg.find('=');
        if (eq != std::string::npos) {
            key = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }

        const auto* spec = findLong(std::string_view(key).substr(2));
        if (!spec) {
            failUnknownFlag(key);
            return;
        }
        consumeValue(*spec, key, std::move(inlineValue), i, tokens);
    }

    void parseShort(const std::string& arg, std::size_t& i, const std::vector<std::string>& tokens) {
        // -s=value
        if (arg.size() >= 3 && arg[2] == '=') {
            const std::string key = arg.substr(0, 2);
            const auto* spec = findShort(arg[1]);
            if (!spec) {
                failUnknownFlag(key);
                return;
            }
            consumeValue(*spec, key, arg.substr(3), i, tokens);
            return;
        }

        for (std::size_t pos = 1; pos < arg.size(); ++pos) {
            const std::string key = std::string("-") + arg[pos];
            const auto* spec = findShort(arg[pos]);
            if (!spec) {
                failUnknownFlag(key);
                return;
            }

            if (!spec->takesValue() || spec->arg()->type == ArgType::Boolean) {
                // Last character of the token may still pick up a following true/false literal.
                if (pos + 1 == arg.size()) {
                    consumeValue(*spec, key, std::nullopt, i, tokens);
                } else {
                    parsed_.set(spec->id(), true);
                }
                continue;
            }

            // Needs a value: -ovalue OR -o value
            std::optional<std::string> value;
            if (pos + 1 < arg.size()) value = arg.substr(pos + 1);
            consumeValue(*spec, key, std::move(value), i, tokens);
            return;
        }
    }

    void consumeValue(const OptionSpec& spec,
                      const std::string& key,
                      std::optional<std::string> inlineValue,
                      std::size_t& i,
                      const std::vector<std::string>& tokens) {
        if (!spec.takesValue()) {
            if (!inlineValue) {
                parsed_.set(spec.id(), true);
                return;
            }
            recordConverted(spec, key, ArgType::Boolean, *inlineValue);
            return;
        }

        const ArgType type = spec.arg()->type;
        if (inlineValue) {
            recordConverted(spec, key, type, *inlineValue);
            return;
        }

        if (type == ArgType::Boolean) {
            if (i + 1 < tokens.size() && isBoolLiteral(tokens[i + 1])) {
                recordConverted(spec, key, type, tokens[++i]);
            } else {
                parsed_.set(spec.id(), true);
            }
            return;
        }

        if (i + 1 >= tokens.size()) {
            ok_ = false;
            error_ = "flag needs an argument: " + key;
            return;
        }
        recordConverted(spec, key, type, tokens[++i]);
    }

    void recordConverted(const OptionSpec& spec, const std::string& key, ArgType type, const std::string& value) {
        auto converted = OptionSpec::tryConvert(type, value);
        if (!converted) {
            ok_ = false;
            error_ = "invalid argument \"" + value + "\" for \"" + key + "\"";
            return;
        }
        parsed_.set(spec.id(), std::move(*converted));
    }

    void failUnknownFlag(const std::string& key) {
        ok_ = false;
        error_ = "unknown flag: " + key;
        const auto suggestions = utils::suggest(key, knownKeys_, /*maxResults=*/3, kSuggestionDistance);
        if (suggestions.empty()) return;
        error_ += "\n\nDid you mean this?\n";
        for (const auto& s : suggestions) error_ += "  " + s + "\n";
    }

    std::vector<OptionSpec> specs_;
    std::vector<std::string> knownKeys_;
    ParsedOptions parsed_;
    std::vector<std::string> extras_;
    bool ok_{true};
    std::string error_;
};

} // namespace cmdtree

#endif // CMDTREE_PARSER_HPP
