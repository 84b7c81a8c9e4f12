#ifndef COMMAND_SYNTHESIZER_H
#define COMMAND_SYNTHESIZER_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "language_oracle.h"

// A shell command proposed by the command model. Only its JSON shape has
// been checked; it must pass both confirmation gates before it runs.
struct SynthesizedCommand {
    std::string command;
    nlohmann::json raw;     // the whole object the model returned
};

// Remove a leading ```json and a trailing ``` marker, trimming whitespace
std::string strip_code_fence(const std::string& text);

// Sentence telling the model which desktop tools fit the host
std::string desktop_hint(const std::string& system_profile);

// Full prompt sent to the command model
std::string build_command_prompt(const std::string& utterance, const std::string& system_profile);

// Parse a command model reply. Absent unless the reply is a JSON object
// whose "command" member is a non-empty string.
std::optional<SynthesizedCommand> parse_command_reply(const std::string& reply_text);

// Turns an instruction into a concrete command through the command model
class CommandSynthesizer {
private:
    LanguageOracle& oracle;
    std::string model;
    bool debug_enabled = false;

public:
    CommandSynthesizer(LanguageOracle& language_oracle, const std::string& command_model, bool debug = false);

    std::optional<SynthesizedCommand> synthesize(const std::string& utterance, const std::string& system_profile);
};

#endif // COMMAND_SYNTHESIZER_H
