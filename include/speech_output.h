#ifndef SPEECH_OUTPUT_H
#define SPEECH_OUTPUT_H

#include <string>

// Blocking text-to-speech. speak() returns once playback has finished.
class SpeechOutput {
public:
    virtual ~SpeechOutput() = default;

    virtual void speak(const std::string& text) = 0;
};

#endif // SPEECH_OUTPUT_H
