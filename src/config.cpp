#include "cmdtree/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

std::string_view trim(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool endsWith(std::string_view s, std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return s.substr(s.size() - suffix.size()) == suffix;
}

bool isRegularFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

// Reads one JSON object whose leaves are scalars. Nested objects contribute dotted keys;
// scalars keep their source spelling and are typed later against the option specs.
class FlatJsonReader {
public:
    explicit FlatJsonReader(std::string_view text) : text_(text) {}

    std::optional<std::string> read(cmdtree::config::RawEntries& out) {
        if (!object("", out)) return error_;
        skipWs();
        if (pos_ != text_.size()) return std::string("trailing characters");
        return std::nullopt;
    }

private:
    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    void skipWs() {
        while (pos_ < text_.size() && std::string_view(" \t\r\n").find(text_[pos_]) != std::string_view::npos) ++pos_;
    }

    bool expect(char c) {
        skipWs();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    bool fail(std::string message) {
        if (error_.empty()) error_ = std::move(message);
        return false;
    }

    bool object(const std::string& prefix, cmdtree::config::RawEntries& out) {
        if (!expect('{')) return fail("expected '{'");
        if (expect('}')) return true;
        do {
            std::string key;
            if (!readString(key)) return fail("expected a string key");
            if (!expect(':')) return fail("expected ':' after \"" + key + "\"");
            const std::string path = prefix.empty() ? key : prefix + "." + key;
            skipWs();
            if (peek() == '[') return fail("unsupported array value for \"" + path + "\"");
            const bool ok = peek() == '{' ? object(path, out) : scalar(path, out);
            if (!ok) return false;
        } while (expect(','));
        if (!expect('}')) return fail("expected ',' or '}'");
        return true;
    }

    // Single-character escapes only.
    bool readString(std::string& text) {
        static constexpr std::string_view kEscaped = "\"\\/bfnrt";
        static constexpr std::string_view kUnescaped = "\"\\/\b\f\n\r\t";

        skipWs();
        if (peek() != '"') return false;
        ++pos_;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                text.push_back(c);
                continue;
            }
            const auto at = kEscaped.find(peek());
            if (at == std::string_view::npos) return false;
            ++pos_;
            text.push_back(kUnescaped[at]);
        }
        return false;
    }

    // A null drops the key.
    bool scalar(const std::string& path, cmdtree::config::RawEntries& out) {
        if (peek() == '"') {
            std::string text;
            if (!readString(text)) return fail("invalid value for \"" + path + "\"");
            out.emplace_back(path, std::move(text));
            return true;
        }
        for (std::string_view word : {"true", "false", "null"}) {
            if (text_.substr(pos_, word.size()) != word) continue;
            pos_ += word.size();
            if (word != "null") out.emplace_back(path, std::string(word));
            return true;
        }

        const std::size_t start = pos_;
        while (pos_ < text_.size() && std::string_view("+-.eE0123456789").find(text_[pos_]) != std::string_view::npos) {
            ++pos_;
        }
        const std::string number(text_.substr(start, pos_ - start));
        if (number.empty() || !cmdtree::OptionSpec::tryConvert(cmdtree::ArgType::Float, number)) {
            return fail("invalid value for \"" + path + "\"");
        }
        out.emplace_back(path, number);
        return true;
    }

    std::string_view text_;
    std::size_t pos_{0};
    std::string error_;
};

} // namespace

namespace cmdtree::config {

std::optional<std::string> parseEnvLike(std::istream& in, RawEntries& out) {
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const auto t = trim(line);
        if (t.empty()) continue;
        if (t.front() == '#') continue;
        const auto eq = t.find('=');
        if (eq == std::string_view::npos) return "line " + std::to_string(lineNo) + ": expected key = value";
        const auto key = trim(t.substr(0, eq));
        if (key.empty()) return "line " + std::to_string(lineNo) + ": empty key";
        auto value = std::string(trim(t.substr(eq + 1)));
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        out.emplace_back(std::string(key), std::move(value));
    }
    if (in.bad()) return std::string("read error");
    return std::nullopt;
}

std::optional<std::string> parseJson(std::istream& in, RawEntries& out) {
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::string("read error");
    RawEntries parsed;
    if (auto err = FlatJsonReader(contents).read(parsed)) return "invalid json: " + *err;
    out.insert(out.end(), parsed.begin(), parsed.end());
    return std::nullopt;
}

std::optional<std::string> loadFile(const std::string& path, RawEntries& out) {
    if (!isRegularFile(path)) return std::nullopt;

    std::ifstream in(path);
    if (!in.is_open()) return std::string("cannot open file");
    if (endsWith(path, ".json")) return parseJson(in, out);
    return parseEnvLike(in, out);
}

std::optional<std::string> toOptions(const RawEntries& raw,
                                     const std::vector<OptionSpec>& specs,
                                     std::vector<ParsedOptions::Entry>& out) {
    auto specFor = [&](const std::string& key) -> const OptionSpec* {
        for (const auto& s : specs) {
            if (s.id() == key) return &s;
        }
        for (const auto& s : specs) {
            if (!s.hasLong()) continue;
            if (s.longName() == key) return &s;
            std::string underscore = s.longName();
            std::replace(underscore.begin(), underscore.end(), '-', '_');
            if (underscore == key) return &s;
        }
        return nullptr;
    };

    for (const auto& [k, v] : raw) {
        const auto* spec = specFor(k);
        if (!spec) {
            out.emplace_back(k, v);
            continue;
        }
        const ArgType type = spec->takesValue() ? spec->arg()->type : ArgType::Boolean;
        auto converted = OptionSpec::tryConvert(type, v);
        if (!converted) {
            return "invalid " + std::string(argTypeName(type)) + " \"" + v + "\" for \"" + k + "\"";
        }
        out.emplace_back(spec->id(), std::move(*converted));
    }
    return std::nullopt;
}

} // namespace cmdtree::config
