#ifndef COMMAND_SUMMARIZER_H
#define COMMAND_SUMMARIZER_H

#include <string>
#include "language_oracle.h"

std::string build_summary_prompt(const std::string& command_text);

// Asks the conversation model for a one-sentence description of a command.
// The summary is advisory; any failure yields an empty string.
class CommandSummarizer {
private:
    LanguageOracle& oracle;
    std::string model;
    bool debug_enabled = false;

public:
    CommandSummarizer(LanguageOracle& language_oracle, const std::string& conversation_model, bool debug = false);

    std::string summarize(const std::string& command_text);
};

#endif // COMMAND_SUMMARIZER_H
