#include "session_loop.h"
#include <chrono>
#include <iostream>
#include <thread>
#include "conversation_log.h"
#include "tts_engine.h"

// Global flag for handling Ctrl+C - referenced in other files via extern
volatile sig_atomic_t g_running = 1;

namespace {

const char* const kCommandDetectedPrompt =
    "Command detected. Do you want to issue this command? Please say yes or no.";
const char* const kExecutePrompt =
    "Do you want to execute the above command? Please say yes or no.";

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Listening: return "Listening";
        case SessionState::Conversational: return "Conversational";
        case SessionState::CommandDetected: return "CommandDetected";
        case SessionState::AwaitingConfirm1: return "AwaitingConfirm1";
        case SessionState::Synthesizing: return "Synthesizing";
        case SessionState::AwaitingConfirm2: return "AwaitingConfirm2";
        case SessionState::Executing: return "Executing";
        case SessionState::Aborted: return "Aborted";
    }
    return "Unknown";
}

const char* to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::NoInput: return "NoInput";
        case CycleOutcome::Conversation: return "Conversation";
        case CycleOutcome::ConversationFailed: return "ConversationFailed";
        case CycleOutcome::NotConfirmed: return "NotConfirmed";
        case CycleOutcome::SynthesisFailed: return "SynthesisFailed";
        case CycleOutcome::ExecutionCanceled: return "ExecutionCanceled";
        case CycleOutcome::Executed: return "Executed";
        case CycleOutcome::ExecutionFailed: return "ExecutionFailed";
        case CycleOutcome::Failed: return "Failed";
    }
    return "Unknown";
}

SessionLoop::SessionLoop(const Config& cfg, SessionParts session_parts, const std::string& system_profile,
                         const std::string& log_path, bool debug)
    : config(cfg), parts(session_parts), profile(system_profile), log_file(log_path), debug_enabled(debug) {}

void SessionLoop::set_state(SessionState next) {
    if (next == current) {
        return;
    }
    SessionState previous = current;
    current = next;
    if (debug_enabled) {
        std::cout << "Debug: State " << to_string(previous) << " -> " << to_string(next) << std::endl;
    }
    if (on_state_change) {
        on_state_change(previous, next);
    }
}

CycleOutcome SessionLoop::run_cycle() {
    set_state(SessionState::Listening);

    CycleOutcome outcome = CycleOutcome::NoInput;
    bool command_branch = false;
    try {
        Transcription heard = parts.transcriber.listen(config.relay.listen_timeout_seconds);
        if (!heard.ok()) {
            set_state(SessionState::Idle);
            return CycleOutcome::NoInput;
        }

        log_conversation(log_file, "User", heard.text);

        if (parts.classifier.classify(heard.text)) {
            command_branch = true;
            outcome = handle_command(heard.text);
        } else {
            outcome = converse(heard.text);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Cycle aborted: " << e.what() << std::endl;
        set_state(SessionState::Aborted);
        outcome = CycleOutcome::Failed;
    }

    if (command_branch) {
        cooldown();
    }

    std::cout << "\n--- Waiting for next input ---\n" << std::endl;
    set_state(SessionState::Idle);
    return outcome;
}

void SessionLoop::run() {
    std::cout << "Starting voice command interface..." << std::endl;
    while (g_running) {
        run_cycle();
    }
}

CycleOutcome SessionLoop::converse(const std::string& utterance) {
    set_state(SessionState::Conversational);

    OracleReply reply = parts.oracle.generate(config.ollama.conversation_model, utterance, false);
    if (!reply.ok()) {
        std::cout << "No valid response from the conversational model." << std::endl;
        return CycleOutcome::ConversationFailed;
    }

    std::cout << "Conversational LLM response: " << reply.text << std::endl;
    log_conversation(log_file, "Assistant", reply.text);
    parts.speech.speak(prepare_for_speech(reply.text));
    return CycleOutcome::Conversation;
}

CycleOutcome SessionLoop::handle_command(const std::string& utterance) {
    set_state(SessionState::CommandDetected);
    if (debug_enabled) {
        std::cout << "Debug: Command detected in input." << std::endl;
    }

    set_state(SessionState::AwaitingConfirm1);
    if (!parts.gate.confirm(kCommandDetectedPrompt, config.relay.command_confirm_timeout_seconds)) {
        std::cout << "Command not confirmed." << std::endl;
        set_state(SessionState::Aborted);
        return CycleOutcome::NotConfirmed;
    }

    set_state(SessionState::Synthesizing);
    std::optional<SynthesizedCommand> command = parts.synthesizer.synthesize(utterance, profile);
    if (!command) {
        std::cout << "Could not generate a valid command." << std::endl;
        set_state(SessionState::Aborted);
        return CycleOutcome::SynthesisFailed;
    }

    std::cout << "Command generated: " << command->command << std::endl;
    log_conversation(log_file, "Command", command->command);
    parts.speech.speak("Proposed command: " + command->command);

    if (parts.notifier) {
        parts.notifier->notify(command->command);
    }

    std::string summary = parts.summarizer.summarize(command->command);
    if (summary.empty()) {
        std::cout << "No summary generated." << std::endl;
    } else {
        std::cout << "Command summary: " << summary << std::endl;
        log_conversation(log_file, "Summary", summary);
        parts.speech.speak("Summary: " + summary);
    }

    set_state(SessionState::AwaitingConfirm2);
    if (!parts.gate.confirm(kExecutePrompt, config.relay.execute_confirm_timeout_seconds)) {
        std::cout << "Command execution canceled." << std::endl;
        set_state(SessionState::Aborted);
        return CycleOutcome::ExecutionCanceled;
    }

    set_state(SessionState::Executing);
    ExecResult result = parts.executor.execute(command->command);
    log_conversation(log_file, "Result", result.ok ? "success" : "failed: " + result.error);
    return result.ok ? CycleOutcome::Executed : CycleOutcome::ExecutionFailed;
}

void SessionLoop::cooldown() {
    auto remaining = std::chrono::milliseconds(config.relay.cooldown_ms);
    const auto slice = std::chrono::milliseconds(100);
    while (g_running && remaining.count() > 0) {
        auto step = remaining < slice ? remaining : slice;
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
}
