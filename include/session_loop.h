#ifndef SESSION_LOOP_H
#define SESSION_LOOP_H

#include <csignal>
#include <functional>
#include <string>
#include "command_classifier.h"
#include "command_executor.h"
#include "command_notifier.h"
#include "command_summarizer.h"
#include "command_synthesizer.h"
#include "config.h"
#include "confirmation_gate.h"
#include "language_oracle.h"
#include "speech_output.h"
#include "transcriber.h"

// Cleared by the SIGINT handler; every blocking stage checks it
extern volatile sig_atomic_t g_running;

enum class SessionState {
    Idle,
    Listening,
    Conversational,
    CommandDetected,
    AwaitingConfirm1,
    Synthesizing,
    AwaitingConfirm2,
    Executing,
    Aborted
};

// How one utterance was handled
enum class CycleOutcome {
    NoInput,
    Conversation,
    ConversationFailed,
    NotConfirmed,
    SynthesisFailed,
    ExecutionCanceled,
    Executed,
    ExecutionFailed,
    Failed              // a collaborator threw; the cycle was abandoned
};

const char* to_string(SessionState state);
const char* to_string(CycleOutcome outcome);

// Collaborators the loop drives. All references must outlive the loop;
// notifier may be null.
struct SessionParts {
    Transcriber& transcriber;
    CommandClassifier& classifier;
    ConfirmationGate& gate;
    CommandSynthesizer& synthesizer;
    CommandSummarizer& summarizer;
    CommandExecutor& executor;
    SpeechOutput& speech;
    LanguageOracle& oracle;
    CommandNotifier* notifier = nullptr;
};

// Listen, classify, and either answer conversationally or walk a command
// through both confirmation gates. One utterance is finished before the
// next listen starts.
class SessionLoop {
public:
    using StateObserver = std::function<void(SessionState from, SessionState to)>;

    SessionLoop(const Config& config, SessionParts parts, const std::string& system_profile,
                const std::string& log_file = "", bool debug = false);

    void set_state_observer(StateObserver observer) { on_state_change = std::move(observer); }
    SessionState state() const { return current; }

    // Handle exactly one utterance, including the cooldown after commands.
    // Never throws std::exception; a failing collaborator ends the cycle.
    CycleOutcome run_cycle();

    // Repeat run_cycle() until g_running is cleared
    void run();

private:
    const Config& config;
    SessionParts parts;
    std::string profile;
    std::string log_file;
    bool debug_enabled = false;

    SessionState current = SessionState::Idle;
    StateObserver on_state_change;

    void set_state(SessionState next);
    CycleOutcome converse(const std::string& utterance);
    CycleOutcome handle_command(const std::string& utterance);
    void cooldown();
};

#endif // SESSION_LOOP_H
