#ifndef AUDIO_INPUT_H
#define AUDIO_INPUT_H

#include <string>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <csignal>
#include "config.h"

// Reference to the global running flag from session_loop.cpp
extern volatile sig_atomic_t g_running;

// Fixed-length microphone recording through the ALSA/PulseAudio command
// line tools. Each call produces one temporary WAV file.
class AudioInput {
private:
    AudioConfig config;
    bool debug_enabled = false;

    std::string record_command(const std::string& output_file, int duration_seconds, bool pulse) const {
        std::stringstream cmd;
        if (pulse) {
            cmd << "parecord"
                << " --device=@DEFAULT_SOURCE@"
                << " --file-format=wav"
                << " --rate=" << config.sample_rate
                << " --channels=1"
                << " " << output_file
                << " & sleep " << duration_seconds << "; kill $! 2>/dev/null";
        } else {
            cmd << "arecord"
                << " -D " << config.device
                << " -f S16_LE"
                << " -c 1"
                << " -r " << config.sample_rate
                << " -d " << duration_seconds
                << (debug_enabled ? " -v" : " -q")
                << " " << output_file;
        }
        return cmd.str();
    }

public:
    AudioInput(const AudioConfig& cfg, bool debug = false)
        : config(cfg), debug_enabled(debug) {}

    static void list_devices() {
        std::cout << "Available audio input devices:" << std::endl;
        if (std::system("arecord -l 2>/dev/null") != 0) {
            std::cerr << "Warning: arecord could not list ALSA capture devices" << std::endl;
        }
        if (std::system("pactl list sources 2>/dev/null | grep -E 'Name:|Description:' | grep -v monitor") != 0) {
            std::cerr << "Warning: pactl could not list PulseAudio sources" << std::endl;
        }
    }

    // Record up to duration_seconds of audio. Returns the WAV path, or an
    // empty string if recording failed or was interrupted by Ctrl+C.
    std::string record(int duration_seconds) {
        if (!g_running) {
            return "";
        }
        if (duration_seconds < 1) {
            duration_seconds = 1;
        }

        std::stringstream ss;
        ss << "/tmp/voice_relay_recording_" << std::time(nullptr) << ".wav";
        std::string output_file = ss.str();

        std::string cmd = record_command(output_file, duration_seconds, false);
        if (debug_enabled) {
            std::cout << "Info: Executing: " << cmd << std::endl;
        }

        int result = std::system(cmd.c_str());
        if (!g_running) {
            std::remove(output_file.c_str());
            return "";
        }

        if (result != 0) {
            std::cerr << "Error: Recording failed with exit code: " << result << std::endl;
            std::cout << "Trying PulseAudio as fallback..." << std::endl;

            cmd = record_command(output_file, duration_seconds, true);
            if (debug_enabled) {
                std::cout << "Info: Executing: " << cmd << std::endl;
            }
            result = std::system(cmd.c_str());
            if (result != 0) {
                std::cerr << "Error: Failed to record audio with any available method." << std::endl;
                std::remove(output_file.c_str());
                return "";
            }
        }

        std::ifstream file(output_file, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open recorded audio file" << std::endl;
            return "";
        }

        std::streamsize size = file.tellg();
        if (size < 100) {
            std::cerr << "Error: Recorded file is too small (" << size << " bytes)" << std::endl;
            std::remove(output_file.c_str());
            return "";
        }

        if (debug_enabled) {
            std::cout << "Info: Recorded " << size << " bytes to " << output_file << std::endl;
        }
        return output_file;
    }
};

#endif // AUDIO_INPUT_H
