#ifndef FILE_TRANSCRIBER_H
#define FILE_TRANSCRIBER_H

#include "audio_input.h"
#include "whisper_stt.h"
#include "transcriber.h"

// Records a fixed window the length of the listen timeout, then hands the
// WAV file to whisper.cpp
class FileTranscriber : public Transcriber {
private:
    AudioInput audio;
    WhisperSTT whisper;
    bool debug_enabled = false;

public:
    FileTranscriber(const AudioConfig& audio_cfg, const WhisperConfig& whisper_cfg, bool debug = false);

    Transcription listen(int timeout_seconds) override;
};

#endif // FILE_TRANSCRIBER_H
