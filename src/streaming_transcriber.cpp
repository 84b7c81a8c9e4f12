#include "streaming_transcriber.h"
#include <iostream>

StreamingTranscriber::StreamingTranscriber(const AudioConfig& audio_cfg, const WhisperConfig& whisper_cfg,
                                           const StreamingConfig& vad_cfg, bool debug)
    : audio(audio_cfg, vad_cfg, debug), whisper(whisper_cfg, debug) {}

Transcription StreamingTranscriber::listen(int timeout_seconds) {
    if (!whisper.is_ready()) {
        std::cerr << "Error: Whisper model is not loaded" << std::endl;
        return Transcription::missed(TranscriptionStatus::ServiceError);
    }

    std::cout << "Listening (up to " << timeout_seconds << " seconds)..." << std::endl;

    if (!audio.start()) {
        return Transcription::missed(TranscriptionStatus::ServiceError);
    }
    std::vector<float> speech = audio.wait_for_speech(timeout_seconds * 1000);
    bool capture_failed = !audio.is_running();
    audio.stop();

    if (speech.empty()) {
        if (capture_failed && g_running) {
            std::cerr << "Error: Audio capture stopped unexpectedly" << std::endl;
            return Transcription::missed(TranscriptionStatus::ServiceError);
        }
        std::cout << "No speech detected within " << timeout_seconds << " seconds." << std::endl;
        return Transcription::missed(TranscriptionStatus::Timeout);
    }

    std::cout << "Transcribing..." << std::endl;
    Transcription result = whisper.process_audio(speech);
    if (result.ok()) {
        std::cout << "You said: " << result.text << std::endl;
    } else if (result.status == TranscriptionStatus::Unintelligible) {
        std::cout << "Could not understand the audio." << std::endl;
    }
    return result;
}
