#include "cmdtree/terminal.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace {

std::optional<std::size_t> columnsFromEnv() {
    const char* env = std::getenv("COLUMNS");
    if (env == nullptr || *env == '\0') return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(env, &end, 10);
    if (errno != 0 || end == env || *end != '\0' || v <= 0) return std::nullopt;
    return static_cast<std::size_t>(v);
}

FILE* fileFor(cmdtree::terminal::Stream stream) {
    switch (stream) {
    case cmdtree::terminal::Stream::Stdout: return stdout;
    case cmdtree::terminal::Stream::Stderr: return stderr;
    case cmdtree::terminal::Stream::Other: return nullptr;
    }
    return nullptr;
}

} // namespace

namespace cmdtree::terminal {

bool isTty(Stream stream) {
    FILE* file = fileFor(stream);
    if (file == nullptr) return false;
#if defined(_WIN32)
    return _isatty(_fileno(file)) != 0;
#else
    return ::isatty(fileno(file)) != 0;
#endif
}

std::optional<std::size_t> columns(Stream stream) {
    if (!isTty(stream)) return columnsFromEnv();
#if defined(_WIN32)
    HANDLE h = GetStdHandle(stream == Stream::Stderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
    CONSOLE_SCREEN_BUFFER_INFO info;
    if (h != nullptr && h != INVALID_HANDLE_VALUE && GetConsoleScreenBufferInfo(h, &info)) {
        const auto width = info.srWindow.Right - info.srWindow.Left + 1;
        if (width > 0) return static_cast<std::size_t>(width);
    }
#else
    struct winsize ws {};
    if (::ioctl(fileno(fileFor(stream)), TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return static_cast<std::size_t>(ws.ws_col);
#endif
    return columnsFromEnv();
}

std::size_t lineLength(std::optional<std::size_t> columns) {
    if (!columns || *columns < kMinLineLength) return kLineLength;
    if (*columns < kLineLength) return *columns - 1;
    return kLineLength;
}

} // namespace cmdtree::terminal
