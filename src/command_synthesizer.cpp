#include "command_synthesizer.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace {

const char* const kFenceOpen = "```json";
const char* const kFenceClose = "```";

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

bool contains_word(const std::string& haystack, const std::string& needle) {
    std::string lower = haystack;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find(needle) != std::string::npos;
}

} // namespace

std::string strip_code_fence(const std::string& text) {
    std::string result = trim(text);

    const std::string open = kFenceOpen;
    if (result.compare(0, open.size(), open) == 0) {
        result = trim(result.substr(open.size()));
    }

    const std::string close = kFenceClose;
    if (result.size() >= close.size() &&
        result.compare(result.size() - close.size(), close.size(), close) == 0) {
        result = trim(result.substr(0, result.size() - close.size()));
    }
    return result;
}

std::string desktop_hint(const std::string& system_profile) {
    if (contains_word(system_profile, "kde") || contains_word(system_profile, "plasma")) {
        return "Use tools that belong to a KDE environment. Do not output generic commands such as "
               "'gnome-terminal'; instead, use 'konsole' or another KDE-compatible terminal.";
    }
    if (contains_word(system_profile, "gnome")) {
        return "Use tools that belong to a GNOME environment. Do not output KDE programs such as "
               "'konsole'; instead, use 'gnome-terminal' or another GNOME-compatible terminal.";
    }
    if (contains_word(system_profile, "xfce")) {
        return "Use tools that belong to an XFCE environment, such as 'xfce4-terminal', "
               "rather than GNOME or KDE programs.";
    }
    return "Only use programs that are likely to be installed on this system.";
}

std::string build_command_prompt(const std::string& utterance, const std::string& system_profile) {
    std::stringstream prompt;
    prompt << "This system is running on " << system_profile << ". "
           << "Please convert the following instruction into a JSON object with a single key 'command' "
           << "that is appropriate for this environment. "
           << desktop_hint(system_profile) << " "
           << "Instruction: " << utterance;
    return prompt.str();
}

std::optional<SynthesizedCommand> parse_command_reply(const std::string& reply_text) {
    std::string cleaned = strip_code_fence(reply_text);

    nlohmann::json data = nlohmann::json::parse(cleaned, nullptr, false);
    if (data.is_discarded()) {
        std::cerr << "Error: Failed to parse command response as JSON." << std::endl;
        return std::nullopt;
    }

    if (!data.is_object() || !data.contains("command")) {
        std::cerr << "Error: Command response has no 'command' key: " << cleaned << std::endl;
        return std::nullopt;
    }

    const auto& command = data["command"];
    if (!command.is_string() || trim(command.get<std::string>()).empty()) {
        std::cerr << "Error: Command response 'command' is not a usable string: " << command.dump() << std::endl;
        return std::nullopt;
    }

    SynthesizedCommand result;
    result.command = trim(command.get<std::string>());
    result.raw = data;
    return result;
}

CommandSynthesizer::CommandSynthesizer(LanguageOracle& language_oracle, const std::string& command_model, bool debug)
    : oracle(language_oracle), model(command_model), debug_enabled(debug) {}

std::optional<SynthesizedCommand> CommandSynthesizer::synthesize(const std::string& utterance,
                                                                 const std::string& system_profile) {
    std::string prompt = build_command_prompt(utterance, system_profile);
    if (debug_enabled) {
        std::cout << "Debug: Command prompt: " << prompt << std::endl;
    }

    OracleReply reply = oracle.generate(model, prompt, false);
    if (!reply.ok()) {
        std::cerr << "Error: Command model gave no result (" << to_string(reply.status) << ")" << std::endl;
        return std::nullopt;
    }

    if (debug_enabled) {
        std::cout << "Debug: Command model response text: " << reply.text << std::endl;
    }
    return parse_command_reply(reply.text);
}
