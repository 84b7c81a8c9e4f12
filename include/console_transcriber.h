#ifndef CONSOLE_TRANSCRIBER_H
#define CONSOLE_TRANSCRIBER_H

#include <csignal>
#include <iostream>
#include "console_input.h"
#include "transcriber.h"

// Reference to the global running flag from session_loop.cpp
extern volatile sig_atomic_t g_running;

// Text mode gateway: utterances are typed instead of spoken
class ConsoleTranscriber : public Transcriber {
private:
    TypedInput& input;

public:
    explicit ConsoleTranscriber(TypedInput& in) : input(in) {}

    Transcription listen(int timeout_seconds) override {
        std::optional<std::string> line = input.read_line("You: ", timeout_seconds);
        if (!line) {
            if (std::cin.eof()) {
                std::cout << "\nEnd of input." << std::endl;
                g_running = 0;
            }
            return Transcription::missed(TranscriptionStatus::Timeout);
        }
        Transcription result = classify_transcript(*line);
        result.typed = true;
        return result;
    }
};

#endif // CONSOLE_TRANSCRIBER_H
