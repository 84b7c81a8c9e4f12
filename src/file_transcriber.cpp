#include "file_transcriber.h"
#include <cstdio>
#include <iostream>

FileTranscriber::FileTranscriber(const AudioConfig& audio_cfg, const WhisperConfig& whisper_cfg, bool debug)
    : audio(audio_cfg, debug), whisper(whisper_cfg, debug), debug_enabled(debug) {}

Transcription FileTranscriber::listen(int timeout_seconds) {
    std::cout << "Listening (up to " << timeout_seconds << " seconds)..." << std::endl;

    std::string audio_file = audio.record(timeout_seconds);
    if (audio_file.empty()) {
        return Transcription::missed(TranscriptionStatus::ServiceError);
    }

    std::cout << "Transcribing..." << std::endl;
    Transcription result = whisper.transcribe(audio_file);

    if (!debug_enabled) {
        std::remove(audio_file.c_str());
    } else {
        std::cout << "Debug: Keeping recording " << audio_file << " for inspection" << std::endl;
    }

    switch (result.status) {
        case TranscriptionStatus::Ok:
            std::cout << "You said: " << result.text << std::endl;
            break;
        case TranscriptionStatus::Timeout:
            std::cout << "No speech detected within " << timeout_seconds << " seconds." << std::endl;
            break;
        case TranscriptionStatus::Unintelligible:
            std::cout << "Could not understand the audio." << std::endl;
            break;
        case TranscriptionStatus::ServiceError:
            std::cerr << "Error: Speech-to-text failed." << std::endl;
            break;
    }
    return result;
}
