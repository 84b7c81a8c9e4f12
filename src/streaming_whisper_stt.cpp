#include "streaming_whisper_stt.h"
#include <iostream>
#include <sstream>
#include <filesystem>
#include <whisper.h>

namespace fs = std::filesystem;

StreamingWhisperSTT::StreamingWhisperSTT(const WhisperConfig& cfg, bool debug)
    : config(cfg), debug_enabled(debug) {
    if (!initialize()) {
        std::cerr << "Error: Failed to initialize Whisper model" << std::endl;
    }
}

StreamingWhisperSTT::~StreamingWhisperSTT() {
    cleanup();
}

bool StreamingWhisperSTT::initialize() {
    if (ctx) {
        return true;
    }

    std::string model_path = config.model_path();
    if (!fs::exists(model_path)) {
        std::cerr << "Error: Whisper model not found: " << model_path << std::endl;
        std::cerr << "Please download it with: ./whisper.cpp/models/download-ggml-model.sh "
                  << config.model << std::endl;
        return false;
    }

    if (debug_enabled) {
        std::cout << "Info: Loading Whisper model from " << model_path << std::endl;
    }

    ctx = whisper_init_from_file_with_params(model_path.c_str(), whisper_context_default_params());
    return ctx != nullptr;
}

void StreamingWhisperSTT::cleanup() {
    if (ctx) {
        whisper_free(ctx);
        ctx = nullptr;
    }
}

Transcription StreamingWhisperSTT::process_audio(const std::vector<float>& audio_buffer) {
    if (!initialize()) {
        return Transcription::missed(TranscriptionStatus::ServiceError);
    }
    if (audio_buffer.empty()) {
        return Transcription::missed(TranscriptionStatus::Timeout);
    }

    // whisper keeps a pointer to the language string until whisper_full returns
    std::string language = "en";
    int threads = 4;
    bool translate = false;

    std::istringstream params_stream(config.params);
    std::string param;
    while (params_stream >> param) {
        if (param == "--translate") {
            translate = true;
        } else if (param == "-l" || param == "--language") {
            params_stream >> language;
        } else if (param == "-t" || param == "--threads") {
            params_stream >> threads;
        }
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    wparams.print_realtime = false;
    wparams.print_progress = debug_enabled;
    wparams.print_timestamps = false;
    wparams.translate = translate;
    wparams.language = language.c_str();
    wparams.n_threads = threads;
    wparams.beam_search.beam_size = 5;
    wparams.single_segment = true;
    wparams.temperature = 0.0f;

    if (debug_enabled) {
        std::cout << "Info: Processing " << audio_buffer.size() << " audio samples with Whisper" << std::endl;
    }

    if (whisper_full(ctx, wparams, audio_buffer.data(), static_cast<int>(audio_buffer.size())) != 0) {
        std::cerr << "Error: Failed to process audio with whisper" << std::endl;
        return Transcription::missed(TranscriptionStatus::ServiceError);
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(ctx);
    for (int i = 0; i < n_segments; i++) {
        std::string segment_text = whisper_full_get_segment_text(ctx, i);
        if (segment_text.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        if (!result.empty() && result.back() != ' ') {
            result += " ";
        }
        result += segment_text;
    }

    if (debug_enabled) {
        std::cout << "Info: Whisper transcription: \"" << result << "\"" << std::endl;
    }

    Transcription transcription = classify_transcript(result);
    // Audio that passed the VAD but decoded to nothing was not understood
    if (transcription.status == TranscriptionStatus::Timeout) {
        transcription.status = TranscriptionStatus::Unintelligible;
    }
    return transcription;
}
