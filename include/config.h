#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Audio recording configuration
struct AudioConfig {
    std::string device = "default";
    int sample_rate = 16000;
};

// Whisper configuration
struct WhisperConfig {
    std::string model = "base.en";
    std::string executable = "./whisper.cpp/build/bin/whisper-cli";
    std::string model_dir = "./whisper.cpp/models";
    std::string params = "-l en";

    std::string model_path() const {
        return model_dir + "/ggml-" + model + ".bin";
    }
};

// Ollama configuration
struct OllamaConfig {
    std::string host = "http://localhost:11434";
    std::string conversation_model = "jarvis-at-home-model_llama3.2:3Bv1";
    std::string command_model = "jarvis-at-home-commands_model_qwen2.5-coder:3Bv3";
    long timeout_seconds = 120;
    long connect_timeout_seconds = 5;
};

// TTS configuration
struct TTSConfig {
    std::string engine = "espeak";
    std::string voice = "en";
    int speed = 170;
    std::string output_device = "default";
};

// Confirmation pipeline configuration
struct RelayConfig {
    std::vector<std::string> command_keywords = {
        "open", "launch", "execute", "run", "shutdown"
    };
    int listen_timeout_seconds = 15;
    int command_confirm_timeout_seconds = 15;
    int execute_confirm_timeout_seconds = 5;
    int typed_input_timeout_seconds = 30;   // 0 waits forever
    int cooldown_ms = 3000;
};

// Companion device notification
struct NotifyConfig {
    bool enabled = false;
    std::string program = "kdeconnect-cli";
    std::string device;                      // empty sends to every paired device
};

// Streaming (ALSA + VAD) configuration
struct StreamingConfig {
    float vad_threshold = 0.0005f;
    float vad_freq_threshold = 100.0f;
    int min_speech_ms = 300;
    int max_silence_ms = 1000;
    int padding_ms = 500;
};

// Main configuration. Built once in main() and handed out by const reference.
class Config {
public:
    AudioConfig audio;
    WhisperConfig whisper;
    OllamaConfig ollama;
    TTSConfig tts;
    RelayConfig relay;
    NotifyConfig notify;
    StreamingConfig streaming;

    // Load configuration from file. Keys that are absent keep their defaults.
    void load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config file " + filename + ": " + e.what());
        }

        try {
            if (j.contains("audio")) {
                const auto& a = j["audio"];
                audio.device = a.value("device", audio.device);
                audio.sample_rate = a.value("sample_rate", audio.sample_rate);
            }

            if (j.contains("whisper")) {
                const auto& w = j["whisper"];
                whisper.model = w.value("model", whisper.model);
                whisper.executable = w.value("executable", whisper.executable);
                whisper.model_dir = w.value("model_dir", whisper.model_dir);
                whisper.params = w.value("params", whisper.params);
            }

            if (j.contains("ollama")) {
                const auto& o = j["ollama"];
                ollama.host = o.value("host", ollama.host);
                ollama.conversation_model = o.value("conversation_model", ollama.conversation_model);
                ollama.command_model = o.value("command_model", ollama.command_model);
                ollama.timeout_seconds = o.value("timeout_seconds", ollama.timeout_seconds);
                ollama.connect_timeout_seconds = o.value("connect_timeout_seconds", ollama.connect_timeout_seconds);
            }

            if (j.contains("tts")) {
                const auto& t = j["tts"];
                tts.engine = t.value("engine", tts.engine);
                tts.voice = t.value("voice", tts.voice);
                tts.speed = t.value("speed", tts.speed);
                tts.output_device = t.value("output_device", tts.output_device);
            }

            if (j.contains("relay")) {
                const auto& r = j["relay"];
                relay.command_keywords = r.value("command_keywords", relay.command_keywords);
                relay.listen_timeout_seconds = r.value("listen_timeout_seconds", relay.listen_timeout_seconds);
                relay.command_confirm_timeout_seconds =
                    r.value("command_confirm_timeout_seconds", relay.command_confirm_timeout_seconds);
                relay.execute_confirm_timeout_seconds =
                    r.value("execute_confirm_timeout_seconds", relay.execute_confirm_timeout_seconds);
                relay.typed_input_timeout_seconds =
                    r.value("typed_input_timeout_seconds", relay.typed_input_timeout_seconds);
                relay.cooldown_ms = r.value("cooldown_ms", relay.cooldown_ms);
            }

            if (j.contains("notify")) {
                const auto& n = j["notify"];
                notify.enabled = n.value("enabled", notify.enabled);
                notify.program = n.value("program", notify.program);
                notify.device = n.value("device", notify.device);
            }

            if (j.contains("streaming")) {
                const auto& s = j["streaming"];
                streaming.vad_threshold = s.value("vad_threshold", streaming.vad_threshold);
                streaming.vad_freq_threshold = s.value("vad_freq_threshold", streaming.vad_freq_threshold);
                streaming.min_speech_ms = s.value("min_speech_ms", streaming.min_speech_ms);
                streaming.max_silence_ms = s.value("max_silence_ms", streaming.max_silence_ms);
                streaming.padding_ms = s.value("padding_ms", streaming.padding_ms);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config file " + filename + ": " + e.what());
        }
    }

    // Load filename, or write the defaults there when it does not exist.
    // Returns true when the file was created. An existing file that fails
    // to load is left untouched and the error is thrown.
    bool load_or_create(const std::string& filename) {
        std::error_code ec;
        if (!std::filesystem::exists(filename, ec) && !ec) {
            save(filename);
            return true;
        }
        load(filename);
        return false;
    }

    // Save configuration to file
    void save(const std::string& filename) const {
        nlohmann::json j;

        j["audio"]["device"] = audio.device;
        j["audio"]["sample_rate"] = audio.sample_rate;

        j["whisper"]["model"] = whisper.model;
        j["whisper"]["executable"] = whisper.executable;
        j["whisper"]["model_dir"] = whisper.model_dir;
        j["whisper"]["params"] = whisper.params;

        j["ollama"]["host"] = ollama.host;
        j["ollama"]["conversation_model"] = ollama.conversation_model;
        j["ollama"]["command_model"] = ollama.command_model;
        j["ollama"]["timeout_seconds"] = ollama.timeout_seconds;
        j["ollama"]["connect_timeout_seconds"] = ollama.connect_timeout_seconds;

        j["tts"]["engine"] = tts.engine;
        j["tts"]["voice"] = tts.voice;
        j["tts"]["speed"] = tts.speed;
        j["tts"]["output_device"] = tts.output_device;

        j["relay"]["command_keywords"] = relay.command_keywords;
        j["relay"]["listen_timeout_seconds"] = relay.listen_timeout_seconds;
        j["relay"]["command_confirm_timeout_seconds"] = relay.command_confirm_timeout_seconds;
        j["relay"]["execute_confirm_timeout_seconds"] = relay.execute_confirm_timeout_seconds;
        j["relay"]["typed_input_timeout_seconds"] = relay.typed_input_timeout_seconds;
        j["relay"]["cooldown_ms"] = relay.cooldown_ms;

        j["notify"]["enabled"] = notify.enabled;
        j["notify"]["program"] = notify.program;
        j["notify"]["device"] = notify.device;

        j["streaming"]["vad_threshold"] = streaming.vad_threshold;
        j["streaming"]["vad_freq_threshold"] = streaming.vad_freq_threshold;
        j["streaming"]["min_speech_ms"] = streaming.min_speech_ms;
        j["streaming"]["max_silence_ms"] = streaming.max_silence_ms;
        j["streaming"]["padding_ms"] = streaming.padding_ms;

        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not write config file: " + filename);
        }

        file << j.dump(2);
    }
};

#endif // CONFIG_H
