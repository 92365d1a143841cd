#ifndef CMDTREE_WRAP_HPP
#define CMDTREE_WRAP_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cmdtree {

// Greedy word-wrap. Breaks after the last space or tab that fits in `width`; the
// whitespace character stays at the end of the emitted line. A word longer than `width`
// is emitted whole on its own line. Lines holding only blanks are dropped, so empty or
// all-blank input yields no lines.
std::vector<std::string> wrapLine(std::size_t width, std::string_view text);

} // namespace cmdtree

#endif // CMDTREE_WRAP_HPP
