#ifndef WHISPER_STT_H
#define WHISPER_STT_H

#include <string>
#include <sstream>
#include <fstream>
#include <iostream>
#include <cstdio>
#include <filesystem>
#include "config.h"
#include "transcriber.h"

namespace fs = std::filesystem;

// Runs the whisper.cpp command line tool on a recorded WAV file
class WhisperSTT {
private:
    WhisperConfig config;
    bool debug_enabled = false;

    // Pull the transcript out of whisper-cli console output
    static std::string extract_transcript(const std::string& whisper_output) {
        size_t pos = whisper_output.find("<|endoftext|>");
        if (pos != std::string::npos) {
            size_t start_pos = whisper_output.rfind('\n', pos);
            start_pos = (start_pos == std::string::npos) ? 0 : start_pos + 1;
            return whisper_output.substr(start_pos, pos - start_pos);
        }

        std::string transcript;
        std::stringstream output_stream(whisper_output);
        std::string line;
        while (std::getline(output_stream, line)) {
            if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }
            if (line.find("whisper_") != std::string::npos || line.find("output_") != std::string::npos ||
                line.find("Progress") != std::string::npos || line[0] == '*') {
                continue;
            }
            transcript += line + " ";
        }
        return transcript;
    }

public:
    WhisperSTT(const WhisperConfig& cfg, bool debug = false)
        : config(cfg), debug_enabled(debug) {}

    const std::string& get_executable() const {
        return config.executable;
    }

    // Transcribe a WAV file. Missing executable, model or audio and a
    // failing whisper run are reported as ServiceError.
    Transcription transcribe(const std::string& audio_file) {
        if (!fs::exists(config.executable)) {
            std::cerr << "Error: Whisper executable not found at " << config.executable << std::endl;
            std::cerr << "Please install whisper.cpp and update the config." << std::endl;
            return Transcription::missed(TranscriptionStatus::ServiceError);
        }

        if (!fs::exists(audio_file)) {
            std::cerr << "Error: Audio file not found: " << audio_file << std::endl;
            return Transcription::missed(TranscriptionStatus::ServiceError);
        }

        std::string model_path = config.model_path();
        if (!fs::exists(model_path)) {
            std::cerr << "Error: Whisper model not found: " << model_path << std::endl;
            std::cerr << "Please download the model with: ./whisper.cpp/models/download-ggml-model.sh "
                      << config.model << std::endl;
            return Transcription::missed(TranscriptionStatus::ServiceError);
        }

        std::stringstream cmd;
        cmd << config.executable
            << " -f " << audio_file
            << " -m " << model_path
            << " -nt";
        if (!config.params.empty()) {
            cmd << " " << config.params;
        }
        if (!debug_enabled) {
            cmd << " 2>/dev/null";
        }

        if (debug_enabled) {
            std::cout << "Info: Transcribing with command: " << cmd.str() << std::endl;
        }

        FILE* pipe = popen(cmd.str().c_str(), "r");
        if (!pipe) {
            std::cerr << "Error: Could not open pipe to whisper.cpp" << std::endl;
            return Transcription::missed(TranscriptionStatus::ServiceError);
        }

        std::string whisper_output;
        char buffer[1024];
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
            whisper_output += buffer;
        }

        int result = pclose(pipe);
        if (result != 0) {
            std::cerr << "Error: Running whisper.cpp failed (exit code: " << result << ")" << std::endl;
            return Transcription::missed(TranscriptionStatus::ServiceError);
        }

        Transcription transcription = classify_transcript(extract_transcript(whisper_output));
        if (debug_enabled) {
            std::cout << "Info: Whisper result (" << to_string(transcription.status) << "): \""
                      << transcription.text << "\"" << std::endl;
        }
        return transcription;
    }
};

#endif // WHISPER_STT_H
