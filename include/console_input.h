#ifndef CONSOLE_INPUT_H
#define CONSOLE_INPUT_H

#include <istream>
#include <optional>
#include <string>

// Source of typed answers for the confirmation fallback
class TypedInput {
public:
    virtual ~TypedInput() = default;

    // Show prompt and read one line. std::nullopt on timeout or end of input.
    // timeout_seconds <= 0 waits indefinitely.
    virtual std::optional<std::string> read_line(const std::string& prompt, int timeout_seconds) = 0;
};

// Reads from the process's standard input, polling the descriptor so the
// wait can be bounded
class ConsoleInput : public TypedInput {
public:
    std::optional<std::string> read_line(const std::string& prompt, int timeout_seconds) override;
};

#endif // CONSOLE_INPUT_H
