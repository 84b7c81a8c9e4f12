#ifndef STREAMING_WHISPER_STT_H
#define STREAMING_WHISPER_STT_H

#include <string>
#include <vector>
#include "config.h"
#include "transcriber.h"

// Forward declaration for whisper context to avoid including the full header
struct whisper_context;

// In-process whisper.cpp transcription of float PCM buffers
class StreamingWhisperSTT {
private:
    WhisperConfig config;
    whisper_context* ctx = nullptr;
    bool debug_enabled = false;

    bool initialize();
    void cleanup();

public:
    StreamingWhisperSTT(const WhisperConfig& cfg, bool debug = false);
    ~StreamingWhisperSTT();

    StreamingWhisperSTT(const StreamingWhisperSTT&) = delete;
    StreamingWhisperSTT& operator=(const StreamingWhisperSTT&) = delete;

    bool is_ready() const { return ctx != nullptr; }

    // Transcribe 16 kHz mono samples. A model that failed to load or a
    // failing decode is reported as ServiceError.
    Transcription process_audio(const std::vector<float>& audio_buffer);
};

#endif // STREAMING_WHISPER_STT_H
