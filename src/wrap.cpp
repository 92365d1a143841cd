#include "cmdtree/wrap.hpp"

namespace {

bool isBlank(char c) { return c == ' ' || c == '\t'; }

bool hasText(const std::string& s) { return s.find_first_not_of(" \t") != std::string::npos; }

} // namespace

namespace cmdtree {

std::vector<std::string> wrapLine(std::size_t width, std::string_view text) {
    if (width == 0) width = 1;

    std::vector<std::string> lines;
    std::string current;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (current.size() < width) {
            current.push_back(text[pos++]);
            continue;
        }

        const auto blank = current.find_last_of(" \t");
        if (blank != std::string::npos) {
            // A run of blanks carried over a break does not get a line of its own.
            if (hasText(current.substr(0, blank + 1))) lines.push_back(current.substr(0, blank + 1));
            current.erase(0, blank + 1);
            continue;
        }

        // No break point inside the span: finish the word and keep it in one piece.
        while (pos < text.size() && !isBlank(text[pos])) current.push_back(text[pos++]);
        lines.push_back(std::move(current));
        current.clear();
        while (pos < text.size() && isBlank(text[pos])) ++pos;
    }
    if (hasText(current)) lines.push_back(std::move(current));
    return lines;
}

} // namespace cmdtree
