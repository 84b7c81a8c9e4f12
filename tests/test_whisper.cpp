#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "transcriber.h"
#include "vad.h"
#include "whisper_stt.h"

namespace {

// Not a playable WAV; only needs to exist
std::string create_mock_audio_file() {
    std::string file_path = "/tmp/voice_relay_test_audio.wav";
    std::ofstream file(file_path, std::ios::binary);
    const char header[] = "RIFF\x24\x00\x00\x00WAVEfmt ";
    file.write(header, sizeof(header) - 1);
    return file_path;
}

} // namespace

TEST_CASE("Blank whisper output counts as silence", "[whisper]") {
    REQUIRE(classify_transcript("").status == TranscriptionStatus::Timeout);
    REQUIRE(classify_transcript("   \n").status == TranscriptionStatus::Timeout);
    REQUIRE(classify_transcript("[BLANK_AUDIO]").status == TranscriptionStatus::Timeout);
    REQUIRE(classify_transcript(" [BLANK_AUDIO] [BLANK_AUDIO]").status == TranscriptionStatus::Timeout);
    REQUIRE(classify_transcript("[silence]").status == TranscriptionStatus::Timeout);
    REQUIRE(classify_transcript("...").status == TranscriptionStatus::Timeout);
}

TEST_CASE("Non-speech markup counts as unintelligible", "[whisper]") {
    REQUIRE(classify_transcript("(inaudible)").status == TranscriptionStatus::Unintelligible);
    REQUIRE(classify_transcript("[noise]").status == TranscriptionStatus::Unintelligible);
    REQUIRE(classify_transcript("[Music]").status == TranscriptionStatus::Unintelligible);
    REQUIRE(classify_transcript("(wind blowing) ok").status == TranscriptionStatus::Unintelligible);
}

TEST_CASE("Speech is trimmed and kept", "[whisper]") {
    Transcription heard = classify_transcript("  Open the calculator.\n");
    REQUIRE(heard.ok());
    REQUIRE(heard.text == "Open the calculator.");

    REQUIRE_FALSE(is_silence_marker("run the backup script"));
    REQUIRE(is_silence_marker("[applause]"));
}

TEST_CASE("Background noise is only noise when it is the whole transcript", "[whisper]") {
    REQUIRE(classify_transcript("Background noise").status == TranscriptionStatus::Unintelligible);
    REQUIRE(classify_transcript(" background noise. ").status == TranscriptionStatus::Unintelligible);

    Transcription heard = classify_transcript("Open the background noise filter");
    REQUIRE(heard.ok());
    REQUIRE(heard.text == "Open the background noise filter");
}

TEST_CASE("WhisperSTT handles missing executable", "[whisper]") {
    WhisperConfig config;
    config.executable = "/nonexistent/whisper";

    WhisperSTT whisper(config);
    std::string audio_file = create_mock_audio_file();

    Transcription result = whisper.transcribe(audio_file);
    REQUIRE(result.status == TranscriptionStatus::ServiceError);
    REQUIRE(result.text.empty());

    std::remove(audio_file.c_str());
}

TEST_CASE("WhisperSTT handles missing audio and model", "[whisper]") {
    WhisperConfig config;
    config.executable = "/bin/sh";
    config.model_dir = "/nonexistent/models";

    WhisperSTT whisper(config);

    SECTION("missing audio file") {
        REQUIRE(whisper.transcribe("/tmp/voice_relay_no_such_audio.wav").status ==
                TranscriptionStatus::ServiceError);
    }

    SECTION("missing model") {
        std::string audio_file = create_mock_audio_file();
        REQUIRE(whisper.transcribe(audio_file).status == TranscriptionStatus::ServiceError);
        std::remove(audio_file.c_str());
    }
}

TEST_CASE("VAD separates silence from a voiced tone", "[whisper][vad]") {
    const int rate = 16000;

    std::vector<float> silence(rate / 2, 0.0f);
    REQUIRE_FALSE(detect_voice_activity(silence, rate, 0.0005f, 100.0f));

    // 200 Hz square wave at a quarter of full scale
    std::vector<float> tone(rate / 2);
    for (size_t i = 0; i < tone.size(); i++) {
        tone[i] = ((i / 40) % 2 == 0) ? 0.25f : -0.25f;
    }
    VoiceActivity activity = measure_voice_activity(tone, rate, 0.0005f, 100.0f);
    REQUIRE(activity.speech);
    REQUIRE(activity.frequency == Approx(200.0f).epsilon(0.05));

    REQUIRE(measure_voice_activity({}, rate, 0.0005f, 100.0f).energy == 0.0f);
}
