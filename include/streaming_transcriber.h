#ifndef STREAMING_TRANSCRIBER_H
#define STREAMING_TRANSCRIBER_H

#include "streaming_audio_input.h"
#include "streaming_whisper_stt.h"
#include "transcriber.h"

// Real-time gateway: ALSA capture with VAD segmentation feeding an
// in-process whisper model. Capture only runs while listen() is active so
// the assistant's own speech is not picked up.
class StreamingTranscriber : public Transcriber {
private:
    StreamingAudioInput audio;
    StreamingWhisperSTT whisper;

public:
    StreamingTranscriber(const AudioConfig& audio_cfg, const WhisperConfig& whisper_cfg,
                         const StreamingConfig& vad_cfg, bool debug = false);

    Transcription listen(int timeout_seconds) override;
};

#endif // STREAMING_TRANSCRIBER_H
