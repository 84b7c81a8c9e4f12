#ifndef TRANSCRIBER_H
#define TRANSCRIBER_H

#include <string>

// Why a listen produced no text. The session loop treats every non-Ok status
// the same way; the distinction only feeds the diagnostics.
enum class TranscriptionStatus {
    Ok,
    Timeout,          // nothing was said before the deadline
    Unintelligible,   // audio captured but no words recognized
    ServiceError      // capture or speech-to-text backend failed
};

struct Transcription {
    TranscriptionStatus status = TranscriptionStatus::Timeout;
    std::string text;
    bool typed = false;     // came from the keyboard, not a microphone

    bool ok() const { return status == TranscriptionStatus::Ok; }

    static Transcription heard(const std::string& text) {
        return {TranscriptionStatus::Ok, text, false};
    }

    static Transcription missed(TranscriptionStatus status) {
        return {status, "", false};
    }
};

const char* to_string(TranscriptionStatus status);

// True when whisper output carries no speech: empty, blank-audio tags,
// "[silence]" style markers or a lone bracketed/parenthesised description.
bool is_silence_marker(const std::string& text);

// Map raw whisper output to a Transcription. Blank output and explicit
// silence tags count as Timeout, other non-speech markup as Unintelligible.
Transcription classify_transcript(const std::string& raw_text);

// Audio capture plus speech-to-text behind a single blocking call
class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual Transcription listen(int timeout_seconds) = 0;
};

#endif // TRANSCRIBER_H
