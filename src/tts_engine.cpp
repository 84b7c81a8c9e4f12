#include "tts_engine.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <regex>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

namespace {

void replace_all(std::string& str, const std::string& from, const std::string& to) {
    size_t start_pos = 0;
    while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
        str.replace(start_pos, from.length(), to);
        start_pos += to.length();
    }
}

// mkstemp-backed scratch file, removed when the guard goes out of scope
class TempFile {
public:
    explicit TempFile(const std::string& suffix) {
        std::string pattern = "/tmp/voice_relay_tts_XXXXXX";
        int fd = mkstemp(&pattern[0]);
        if (fd < 0) {
            return;
        }
        close(fd);
        std::remove(pattern.c_str());
        path_ = pattern + suffix;
    }

    ~TempFile() {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

std::string prepare_for_speech(const std::string& text) {
    std::string result = text;

    static const std::regex code_block_regex("```[\\s\\S]*?```");
    result = std::regex_replace(result, code_block_regex, "I've prepared some code for you, but I won't read it aloud.");

    static const std::regex inline_code_regex("`([^`]+)`");
    result = std::regex_replace(result, inline_code_regex, "$1");

    static const std::regex link_regex("\\[([^\\]]+)\\]\\([^\\)]+\\)");
    result = std::regex_replace(result, link_regex, "$1");

    static const std::regex url_regex("https?://\\S+");
    result = std::regex_replace(result, url_regex, "website link");

    static const std::regex heading_regex("(^|\\n)#{1,6} ([^\\n]+)");
    result = std::regex_replace(result, heading_regex, "$1$2. ");

    static const std::regex bullet_regex("(^|\\n)\\s*[\\*\\-] +");
    result = std::regex_replace(result, bullet_regex, "$1");

    replace_all(result, "**", "");
    replace_all(result, "__", "");

    replace_all(result, "\n\n", ". ");
    replace_all(result, "\n", " ");

    static const std::regex multi_spaces("\\s+");
    result = std::regex_replace(result, multi_spaces, " ");

    replace_all(result, ". . ", ". ");
    replace_all(result, ".. ", ". ");

    size_t start = result.find_first_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = result.find_last_not_of(' ');
    return result.substr(start, end - start + 1);
}

TTSEngine::TTSEngine(const TTSConfig& cfg, bool debug)
    : config(cfg), debug_enabled(debug) {
    if (config.engine != "espeak" && config.engine != "piper") {
        std::cerr << "Warning: Unsupported TTS engine: " << config.engine << ", falling back to espeak" << std::endl;
        config.engine = "espeak";
    }
}

void TTSEngine::list_devices() {
    std::cout << "Available audio output devices:" << std::endl;
    if (std::system("aplay -l 2>/dev/null") != 0) {
        std::cerr << "Warning: aplay could not list ALSA playback devices" << std::endl;
    }
    if (std::system("pactl list sinks 2>/dev/null | grep -E 'Name:|Description:'") != 0) {
        std::cerr << "Warning: pactl could not list PulseAudio sinks" << std::endl;
    }
}

void TTSEngine::speak(const std::string& text) {
    if (text.empty()) {
        return;
    }

    // The text goes through a file so model output never reaches the shell
    TempFile text_file(".txt");
    if (text_file.path().empty()) {
        std::cerr << "Error: Failed to create temporary text file" << std::endl;
        return;
    }
    {
        std::ofstream file(text_file.path());
        if (!file.is_open()) {
            std::cerr << "Error: Failed to write temporary text file" << std::endl;
            return;
        }
        file << text;
    }

    if (config.engine == "piper" && speak_piper(text_file.path())) {
        return;
    }
    if (!speak_espeak(text_file.path())) {
        std::cerr << "Error: Speech synthesis failed" << std::endl;
    }
}

bool TTSEngine::speak_espeak(const std::string& text_file) {
    std::stringstream cmd;
    cmd << "espeak"
        << " -v " << config.voice
        << " -s " << config.speed
        << " -f " << text_file;

    if (config.output_device == "default") {
        cmd << " 2>/dev/null";
        if (debug_enabled) {
            std::cout << "Debug: " << cmd.str() << std::endl;
        }
        return std::system(cmd.str().c_str()) == 0;
    }

    TempFile audio_file(".wav");
    if (audio_file.path().empty()) {
        return false;
    }
    cmd << " -w " << audio_file.path() << " 2>/dev/null";
    if (debug_enabled) {
        std::cout << "Debug: " << cmd.str() << std::endl;
    }
    if (std::system(cmd.str().c_str()) != 0) {
        std::cerr << "Error: Running espeak failed" << std::endl;
        return false;
    }
    return play_audio(audio_file.path());
}

bool TTSEngine::speak_piper(const std::string& text_file) {
    TempFile audio_file(".wav");
    if (audio_file.path().empty()) {
        return false;
    }

    std::stringstream cmd;
    cmd << "piper"
        << " --model piper-voices/" << config.voice << "/model.onnx"
        << " --output_file " << audio_file.path()
        << " < " << text_file
        << " 2>/dev/null";

    if (debug_enabled) {
        std::cout << "Debug: " << cmd.str() << std::endl;
    }
    if (std::system(cmd.str().c_str()) != 0) {
        std::cerr << "Warning: Running piper failed, falling back to espeak" << std::endl;
        return false;
    }
    return play_audio(audio_file.path());
}

bool TTSEngine::play_audio(const std::string& audio_file) {
    std::vector<std::string> players;
    if (config.output_device == "default") {
        players.push_back("aplay -q " + audio_file);
    } else if (config.output_device.find("hw:") != std::string::npos) {
        players.push_back("aplay -q -D " + config.output_device + " " + audio_file);
    } else {
        players.push_back("paplay --device=" + config.output_device + " " + audio_file);
    }
    players.push_back("paplay " + audio_file);
    players.push_back("play -q " + audio_file);

    for (const auto& player : players) {
        if (std::system((player + " 2>/dev/null").c_str()) == 0) {
            return true;
        }
    }
    std::cerr << "Error: No suitable audio player found" << std::endl;
    return false;
}
