#ifndef CMDTREE_TERMINAL_HPP
#define CMDTREE_TERMINAL_HPP

#include <cstddef>
#include <optional>

namespace cmdtree::terminal {

enum class Stream {
    Stdout,
    Stderr,
    Other,
};

// Usage lines never get wider than this, and it is the fallback when the width is unknown.
inline constexpr std::size_t kLineLength = 75;
// Reported widths below this are treated as bogus.
inline constexpr std::size_t kMinLineLength = 20;

// Returns true if the underlying stream is a terminal.
bool isTty(Stream stream);

// Column count of the terminal behind `stream`, falling back to $COLUMNS.
std::optional<std::size_t> columns(Stream stream);

// Width available for usage text given the reported column count.
std::size_t lineLength(std::optional<std::size_t> columns);

inline std::size_t lineLength(Stream stream) { return lineLength(columns(stream)); }

} // namespace cmdtree::terminal

#endif // CMDTREE_TERMINAL_HPP
