#ifndef VOICE_RELAY_TEST_FAKES_H
#define VOICE_RELAY_TEST_FAKES_H

#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "command_executor.h"
#include "console_input.h"
#include "language_oracle.h"
#include "speech_output.h"
#include "transcriber.h"

// Deterministic stand-ins for the external collaborators

struct OracleCall {
    std::string model;
    std::string prompt;
    bool stream;
};

// Replies are queued per model; an empty queue answers Unavailable
class FakeOracle : public LanguageOracle {
public:
    std::map<std::string, std::deque<OracleReply>> replies;
    std::vector<OracleCall> calls;

    void reply(const std::string& model, const std::string& text) {
        replies[model].push_back(OracleReply::success(text));
    }

    void fail(const std::string& model, OracleStatus status = OracleStatus::Unavailable) {
        replies[model].push_back(OracleReply::failure(status, "scripted failure"));
    }

    OracleReply generate(const std::string& model, const std::string& prompt, bool stream) override {
        calls.push_back({model, prompt, stream});
        auto& queue = replies[model];
        if (queue.empty()) {
            return OracleReply::failure(OracleStatus::Unavailable, "no scripted reply");
        }
        OracleReply next = queue.front();
        queue.pop_front();
        return next;
    }
};

// Hands out scripted transcriptions; runs out into Timeout
class ScriptedTranscriber : public Transcriber {
public:
    std::deque<Transcription> script;
    std::vector<int> timeouts;
    bool throw_on_listen = false;

    void say(const std::string& text) { script.push_back(Transcription::heard(text)); }
    void silence() { script.push_back(Transcription::missed(TranscriptionStatus::Timeout)); }
    void mumble() { script.push_back(Transcription::missed(TranscriptionStatus::Unintelligible)); }

    Transcription listen(int timeout_seconds) override {
        timeouts.push_back(timeout_seconds);
        if (throw_on_listen) {
            throw std::runtime_error("microphone unplugged");
        }
        if (script.empty()) {
            return Transcription::missed(TranscriptionStatus::Timeout);
        }
        Transcription next = script.front();
        script.pop_front();
        return next;
    }
};

class RecordingSpeech : public SpeechOutput {
public:
    std::vector<std::string> spoken;
    bool throw_on_speak = false;
    std::string throw_on_prefix;    // throw only for text starting with this

    void speak(const std::string& text) override {
        if (throw_on_speak || (!throw_on_prefix.empty() && text.rfind(throw_on_prefix, 0) == 0)) {
            throw std::runtime_error("audio device busy");
        }
        spoken.push_back(text);
    }
};

// Typed answers; std::nullopt models a timeout or end of input
class ScriptedInput : public TypedInput {
public:
    std::deque<std::optional<std::string>> lines;
    std::vector<std::string> prompts;

    void type(const std::string& line) { lines.push_back(line); }
    void time_out() { lines.push_back(std::nullopt); }

    std::optional<std::string> read_line(const std::string& prompt, int) override {
        prompts.push_back(prompt);
        if (lines.empty()) {
            return std::nullopt;
        }
        std::optional<std::string> next = lines.front();
        lines.pop_front();
        return next;
    }
};

// Records every argument vector instead of spawning anything
class RecordingRunner : public ProcessRunner {
public:
    std::vector<std::vector<std::string>> calls;
    ProcessResult result{ProcessStatus::Exited, 0};

    ProcessResult run(const std::vector<std::string>& argv) override {
        calls.push_back(argv);
        return result;
    }
};

#endif // VOICE_RELAY_TEST_FAKES_H
