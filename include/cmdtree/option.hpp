#ifndef CMDTREE_OPTION_HPP
#define CMDTREE_OPTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cmdtree {
using OptionValue = std::variant<bool, std::int64_t, double, std::string>;

enum class ArgType {
    Boolean,
    Integer,
    Float,
    String,
};

// Type of the value an option takes, plus the value used when the option is absent.
struct ArgSpec {
    ArgType type{ArgType::String};
    std::optional<OptionValue> defaultValue;
};

class OptionSpec {
public:
    // Presence flag: no argument, parsed value is `true` when given.
    OptionSpec(std::string id, char shortName, std::string longName, std::string help)
        : id_(std::move(id)), shortName_(shortName), longName_(std::move(longName)), help_(std::move(help)) {
        validate();
    }

    OptionSpec(std::string id, char shortName, std::string longName, ArgSpec arg, std::string help)
        : id_(std::move(id)),
          shortName_(shortName),
          longName_(std::move(longName)),
          arg_(std::move(arg)),
          help_(std::move(help)) {
        validate();
    }

    [[nodiscard]] const std::string& id() const { return id_; }
    // '\0' when the option has no short form.
    [[nodiscard]] char shortName() const { return shortName_; }
    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] const std::optional<ArgSpec>& arg() const { return arg_; }
    [[nodiscard]] const std::string& help() const { return help_; }

    [[nodiscard]] bool hasShort() const { return shortName_ != '\0'; }
    [[nodiscard]] bool hasLong() const { return !longName_.empty(); }
    [[nodiscard]] bool takesValue() const { return arg_.has_value(); }
    [[nodiscard]] std::optional<OptionValue> defaultValue() const {
        if (!arg_) return std::nullopt;
        return arg_->defaultValue;
    }

    // "-x" / "--long" spellings, empty when the form is absent.
    [[nodiscard]] std::string shortFlag() const { return hasShort() ? std::string{'-', shortName_} : std::string(); }
    [[nodiscard]] std::string longFlag() const { return hasLong() ? "--" + longName_ : std::string(); }

    // Throws std::invalid_argument if `text` does not convert to `type`.
    static OptionValue convert(ArgType type, const std::string& text);
    static std::optional<OptionValue> tryConvert(ArgType type, std::string_view text);

private:
    void validate() const;

    std::string id_;        // verbose
    char shortName_{'\0'};  // v
    std::string longName_;  // verbose
    std::optional<ArgSpec> arg_;
    std::string help_;
};

// The universal options every dispatcher injects.
OptionSpec helpOption();
OptionSpec versionOption();

std::string_view argTypeName(ArgType type);

// Renders a value the way help text and config round-trips expect: true/false, decimal
// integers, shortest round-trip floats, strings verbatim.
std::string toString(const OptionValue& value);

} // namespace cmdtree

#endif // CMDTREE_OPTION_HPP
