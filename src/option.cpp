#include "cmdtree/option.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <system_error>
#include <stdexcept>
#include <type_traits>

namespace {

static std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static bool tryParseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

static bool tryParseInt(std::string_view s, std::int64_t& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

static bool tryParseFloat(std::string_view s, double& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

// Shortest round-trip text; plain notation unless the magnitude is extreme.
static std::string formatFloat(double v) {
    const double magnitude = std::fabs(v);
    const bool plain = magnitude == 0.0 || (magnitude >= 1e-4 && magnitude < 1e15);

    char buf[64];
    const auto res = plain ? std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed)
                           : std::to_chars(buf, buf + sizeof(buf), v);
    std::string text = res.ec == std::errc() ? std::string(buf, res.ptr) : std::to_string(v);
    if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
    return text;
}

} // namespace

namespace cmdtree {

void OptionSpec::validate() const {
    if (id_.empty()) throw std::invalid_argument("option identifier must not be empty");
    if (!hasShort() && !hasLong()) {
        throw std::invalid_argument("option \"" + id_ + "\" needs a short or a long flag");
    }
    if (hasShort() && (shortName_ == '-' || std::isspace(static_cast<unsigned char>(shortName_)))) {
        throw std::invalid_argument("option \"" + id_ + "\" has an invalid short flag");
    }
    if (hasLong() && longName_.rfind('-', 0) == 0) {
        throw std::invalid_argument("long flag of option \"" + id_ + "\" must not start with '-'");
    }
}

std::optional<OptionValue> OptionSpec::tryConvert(ArgType type, std::string_view text) {
    switch (type) {
    case ArgType::Boolean: {
        bool out = false;
        if (!tryParseBool(text, out)) return std::nullopt;
        return OptionValue{out};
    }
    case ArgType::Integer: {
        std::int64_t out = 0;
        if (!tryParseInt(text, out)) return std::nullopt;
        return OptionValue{out};
    }
    case ArgType::Float: {
        double out = 0.0;
        if (!tryParseFloat(text, out)) return std::nullopt;
        return OptionValue{out};
    }
    case ArgType::String:
        return OptionValue{std::string(text)};
    }
    return std::nullopt;
}

OptionValue OptionSpec::convert(ArgType type, const std::string& text) {
    auto v = tryConvert(type, text);
    if (!v) throw std::invalid_argument("invalid " + std::string(argTypeName(type)));
    return std::move(*v);
}

OptionSpec helpOption() {
    return OptionSpec("help", 'h', "help", "Print this help.");
}

OptionSpec versionOption() {
    return OptionSpec("version", 'v', "version", "Print the version and exit.");
}

std::string_view argTypeName(ArgType type) {
    switch (type) {
    case ArgType::Boolean: return "boolean";
    case ArgType::Integer: return "integer";
    case ArgType::Float: return "float";
    case ArgType::String: return "string";
    }
    return "string";
}

std::string toString(const OptionValue& value) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
            if constexpr (std::is_same_v<T, std::int64_t>) return std::to_string(x);
            if constexpr (std::is_same_v<T, double>) return formatFloat(x);
            if constexpr (std::is_same_v<T, std::string>) return x;
        },
        value);
}

} // namespace cmdtree
