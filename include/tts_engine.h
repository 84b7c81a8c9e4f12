#ifndef TTS_ENGINE_H
#define TTS_ENGINE_H

#include <string>
#include "config.h"
#include "speech_output.h"

// Strip markdown and symbols that read badly aloud from model replies
std::string prepare_for_speech(const std::string& text);

// espeak / piper speech synthesis through their command line tools
class TTSEngine : public SpeechOutput {
private:
    TTSConfig config;
    bool debug_enabled = false;

    bool speak_espeak(const std::string& text_file);
    bool speak_piper(const std::string& text_file);
    bool play_audio(const std::string& audio_file);

public:
    TTSEngine(const TTSConfig& cfg, bool debug = false);

    static void list_devices();

    void speak(const std::string& text) override;
};

#endif // TTS_ENGINE_H
