#include "command_summarizer.h"
#include <iostream>

std::string build_summary_prompt(const std::string& command_text) {
    return "Summarize in one sentence what the following command does: " + command_text;
}

CommandSummarizer::CommandSummarizer(LanguageOracle& language_oracle, const std::string& conversation_model, bool debug)
    : oracle(language_oracle), model(conversation_model), debug_enabled(debug) {}

std::string CommandSummarizer::summarize(const std::string& command_text) {
    OracleReply reply = oracle.generate(model, build_summary_prompt(command_text), false);
    if (!reply.ok()) {
        if (debug_enabled) {
            std::cout << "Debug: Summary request failed (" << to_string(reply.status) << "): "
                      << reply.error << std::endl;
        }
        return "";
    }

    size_t start = reply.text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = reply.text.find_last_not_of(" \t\r\n");
    return reply.text.substr(start, end - start + 1);
}
