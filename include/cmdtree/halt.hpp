#ifndef CMDTREE_HALT_HPP
#define CMDTREE_HALT_HPP

#include <exception>
#include <string>
#include <utility>

namespace cmdtree {

// Thrown from a handler to end the invocation with a given exit status. The dispatcher
// prints the message (if any) on its error stream and returns the status; the process is
// never terminated from inside the library.
class Halt : public std::exception {
public:
    explicit Halt(int code, std::string message = {}) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int code_;
    std::string message_;
};

[[noreturn]] inline void haltWith(int code) { throw Halt(code); }

[[noreturn]] inline void haltWith(std::string message, int code = 1) { throw Halt(code, std::move(message)); }

} // namespace cmdtree

#endif // CMDTREE_HALT_HPP
