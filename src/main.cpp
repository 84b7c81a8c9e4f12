#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <cstring>
#include <unistd.h>

#include "command_classifier.h"
#include "command_executor.h"
#include "command_notifier.h"
#include "command_summarizer.h"
#include "command_synthesizer.h"
#include "config.h"
#include "confirmation_gate.h"
#include "console_input.h"
#include "console_transcriber.h"
#include "conversation_log.h"
#include "file_transcriber.h"
#include "ollama_client.h"
#include "session_loop.h"
#include "system_profile.h"
#include "tts_engine.h"

#ifdef VOICE_RELAY_STREAMING
#include "streaming_transcriber.h"
#endif

namespace {

// Signal handler for Ctrl+C
void signal_handler(int signal) {
    if (signal == SIGINT) {
        const char message[] = "\nShutting down...\n";
        ssize_t written = write(STDOUT_FILENO, message, sizeof(message) - 1);
        (void)written;
        g_running = 0;
    }
}

void print_usage() {
    std::cout << "Usage: voice_relay [options]\n"
              << "Options:\n"
              << "  --config FILE         Path to configuration file (default: config.json)\n"
              << "  --input-device DEV    Specify audio input device\n"
              << "  --output-device DEV   Specify audio output device\n"
              << "  --host URL            Ollama server address\n"
              << "  --text-mode           Type utterances instead of speaking them\n"
              << "  --streaming-mode      Real-time capture with voice activity detection\n"
              << "  --notify              Push proposed commands to a phone with KDE Connect\n"
              << "  --list-devices        List available audio devices\n"
              << "  --debug               Print extra diagnostics\n"
              << "  --log                 Log the conversation to relay_<timestamp>.log\n"
              << "  --log-file PATH       Log the conversation to PATH\n"
              << "  --help                Show this help message\n\n"
              << "Commands are recognised by the words: open, launch, execute, run, shutdown.\n"
              << "Every command is confirmed twice before it runs. Answer \"yes\" or \"run it\".\n";
}

} // namespace

int main(int argc, char** argv) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sa.sa_flags = 0; // interrupt blocking reads so the loop notices quickly
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, nullptr) == -1) {
        std::cerr << "Failed to set up signal handler." << std::endl;
        return 1;
    }

    std::string config_path = "config.json";
    std::string input_device;
    std::string output_device;
    std::string host;
    std::string log_file_path;
    bool list_devices = false;
    bool debug_mode = false;
    bool enable_logging = false;
    bool text_mode = false;
    bool streaming_mode = false;
    bool notify = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--input-device" && i + 1 < argc) {
            input_device = argv[++i];
        } else if (arg == "--output-device" && i + 1 < argc) {
            output_device = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--list-devices") {
            list_devices = true;
        } else if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--log") {
            enable_logging = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file_path = argv[++i];
            enable_logging = true;
        } else if (arg == "--text-mode") {
            text_mode = true;
        } else if (arg == "--streaming-mode") {
            streaming_mode = true;
        } else if (arg == "--notify") {
            notify = true;
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage();
            return 1;
        }
    }

    if (list_devices) {
        AudioInput::list_devices();
        TTSEngine::list_devices();
        return 0;
    }

    std::cout << "Voice Relay Starting..." << std::endl;

    Config loaded;
    try {
        if (loaded.load_or_create(config_path)) {
            std::cout << "Default configuration created at " << config_path << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        std::cerr << "Using default settings; " << config_path << " left unchanged" << std::endl;
        loaded = Config();
    }

    if (!input_device.empty()) loaded.audio.device = input_device;
    if (!output_device.empty()) loaded.tts.output_device = output_device;
    if (!host.empty()) loaded.ollama.host = host;
    if (notify) loaded.notify.enabled = true;

    const Config config = loaded;

#ifndef VOICE_RELAY_STREAMING
    if (streaming_mode) {
        std::cerr << "Warning: Built without streaming support, using file-based capture" << std::endl;
        streaming_mode = false;
    }
#endif

    const std::string system_profile = detect_system_profile();

    if (debug_mode) {
        std::cout << "Info: Voice Relay Configuration:" << std::endl;
        std::cout << "Info: - System: " << system_profile << std::endl;
        std::cout << "Info: - Ollama host: " << config.ollama.host << std::endl;
        std::cout << "Info: - Conversation model: " << config.ollama.conversation_model << std::endl;
        std::cout << "Info: - Command model: " << config.ollama.command_model << std::endl;
        std::cout << "Info: - Speech synthesis: " << config.tts.engine << " (voice: " << config.tts.voice << ")" << std::endl;
        std::cout << "Info: - Audio input device: " << config.audio.device << std::endl;
        std::cout << "Info: - Audio output device: " << config.tts.output_device << std::endl;
        if (text_mode) {
            std::cout << "Info: - Mode: Text input" << std::endl;
        } else if (streaming_mode) {
            std::cout << "Info: - Mode: Streaming (real-time) audio" << std::endl;
        } else {
            std::cout << "Info: - Mode: File-based audio" << std::endl;
        }
    }

    OllamaClient ollama(config.ollama, debug_mode);
    TTSEngine tts(config.tts, debug_mode);
    ConsoleInput console;

    std::unique_ptr<Transcriber> transcriber;
    if (text_mode) {
        transcriber = std::make_unique<ConsoleTranscriber>(console);
    }
#ifdef VOICE_RELAY_STREAMING
    else if (streaming_mode) {
        transcriber = std::make_unique<StreamingTranscriber>(config.audio, config.whisper, config.streaming, debug_mode);
    }
#endif
    else {
        transcriber = std::make_unique<FileTranscriber>(config.audio, config.whisper, debug_mode);
    }

    KeywordCommandClassifier classifier(config.relay.command_keywords, debug_mode);
    ConfirmationGate gate(tts, *transcriber, console, config.relay.typed_input_timeout_seconds, debug_mode);
    CommandSynthesizer synthesizer(ollama, config.ollama.command_model, debug_mode);
    CommandSummarizer summarizer(ollama, config.ollama.conversation_model, debug_mode);
    PosixProcessRunner runner;
    CommandExecutor executor(runner, debug_mode);

    std::unique_ptr<CommandNotifier> notifier;
    if (config.notify.enabled) {
        notifier = std::make_unique<KdeConnectNotifier>(runner, config.notify);
    }

    if (enable_logging) {
        if (log_file_path.empty()) {
            log_file_path = default_log_file_name();
        }
        if (begin_conversation_log(log_file_path)) {
            std::cout << "Info: Logging conversation to " << log_file_path << std::endl;
        } else {
            std::cerr << "Disabling logging..." << std::endl;
            log_file_path.clear();
        }
    } else {
        log_file_path.clear();
    }

    SessionParts parts{*transcriber, classifier, gate, synthesizer, summarizer, executor, tts, ollama, notifier.get()};
    SessionLoop loop(config, parts, system_profile, log_file_path, debug_mode);

    std::cout << "Info: Press Ctrl+C to exit." << std::endl;
    loop.run();

    end_conversation_log(log_file_path);
    std::cout << "Voice Relay Exiting" << std::endl;
    return 0;
}
