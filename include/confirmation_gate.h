#ifndef CONFIRMATION_GATE_H
#define CONFIRMATION_GATE_H

#include <string>
#include "console_input.h"
#include "speech_output.h"
#include "transcriber.h"

// Spoken answer counts as approval when it contains "yes" or "run it",
// ignoring case
bool is_affirmative_voice(const std::string& response);

// Typed answer counts as approval only when it is exactly "yes" after
// trimming and lower-casing
bool is_affirmative_typed(const std::string& response);

// Yes/no checkpoint: speak the prompt, listen, fall back to the keyboard.
// Answers typed at the gateway (text mode) follow the typed rule.
// Every failure path answers false.
class ConfirmationGate {
private:
    SpeechOutput& speech;
    Transcriber& transcriber;
    TypedInput& input;
    int typed_timeout_seconds;
    bool debug_enabled = false;

public:
    ConfirmationGate(SpeechOutput& speech_output, Transcriber& gateway, TypedInput& typed_input,
                     int typed_input_timeout_seconds, bool debug = false);

    bool confirm(const std::string& prompt_text, int timeout_seconds);
};

#endif // CONFIRMATION_GATE_H
