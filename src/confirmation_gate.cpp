#include "confirmation_gate.h"
#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

} // namespace

bool is_affirmative_voice(const std::string& response) {
    std::string lower = to_lower(response);
    return lower.find("yes") != std::string::npos || lower.find("run it") != std::string::npos;
}

bool is_affirmative_typed(const std::string& response) {
    return to_lower(trim(response)) == "yes";
}

ConfirmationGate::ConfirmationGate(SpeechOutput& speech_output, Transcriber& gateway, TypedInput& typed_input,
                                   int typed_input_timeout_seconds, bool debug)
    : speech(speech_output),
      transcriber(gateway),
      input(typed_input),
      typed_timeout_seconds(typed_input_timeout_seconds),
      debug_enabled(debug) {}

bool ConfirmationGate::confirm(const std::string& prompt_text, int timeout_seconds) {
    try {
        speech.speak(prompt_text);
        std::cout << prompt_text << std::endl;

        Transcription response = transcriber.listen(timeout_seconds);
        if (response.ok()) {
            if (debug_enabled) {
                std::cout << "Debug: Voice confirmation response: " << response.text << std::endl;
            }
            return response.typed ? is_affirmative_typed(response.text) : is_affirmative_voice(response.text);
        }

        if (debug_enabled) {
            std::cout << "Debug: No voice confirmation (" << to_string(response.status) << ")" << std::endl;
        }

        std::optional<std::string> typed =
            input.read_line("No voice input detected. Type yes or no: ", typed_timeout_seconds);
        if (!typed) {
            return false;
        }
        return is_affirmative_typed(*typed);
    } catch (const std::exception& e) {
        std::cerr << "Error: Voice confirmation error: " << e.what() << std::endl;
        return false;
    }
}
