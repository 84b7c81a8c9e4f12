#include "transcriber.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace {

std::string trim_copy(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string lower_copy(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Remove every [..] and (..) group
std::string strip_bracketed(std::string text) {
    for (char open : {'[', '('}) {
        char close = open == '[' ? ']' : ')';
        while (true) {
            size_t start = text.find(open);
            size_t end = text.find(close, start == std::string::npos ? 0 : start);
            if (start == std::string::npos || end == std::string::npos) {
                break;
            }
            text.erase(start, end - start + 1);
        }
    }
    return trim_copy(text);
}

bool is_blank(const std::string& lower_text) {
    static const std::vector<std::string> blank_markers = {
        "[blank_audio]",
        "[silence]",
        "silence"
    };

    if (lower_text.empty() || lower_text == "." || lower_text == "...") {
        return true;
    }
    for (const auto& marker : blank_markers) {
        if (lower_text == marker) {
            return true;
        }
    }
    return lower_text.find("[blank_audio]") != std::string::npos && strip_bracketed(lower_text).empty();
}

} // namespace

const char* to_string(TranscriptionStatus status) {
    switch (status) {
        case TranscriptionStatus::Ok: return "ok";
        case TranscriptionStatus::Timeout: return "timeout";
        case TranscriptionStatus::Unintelligible: return "unintelligible";
        case TranscriptionStatus::ServiceError: return "service error";
    }
    return "unknown";
}

bool is_silence_marker(const std::string& text) {
    std::string lower_text = lower_copy(trim_copy(text));

    static const std::vector<std::string> silence_markers = {
        "[silence]",
        "[noise]",
        "[inaudible]",
        "[blank_audio]",
        "[applause]",
        "[music]",
        "[laughter]"
    };

    if (is_blank(lower_text)) {
        return true;
    }

    // Only when it is the whole transcript, so commands mentioning it still pass
    if (lower_text == "background noise" || lower_text == "background noise.") {
        return true;
    }

    for (const auto& marker : silence_markers) {
        if (lower_text.find(marker) != std::string::npos) {
            return true;
        }
    }

    if ((lower_text.front() == '(' && lower_text.back() == ')') ||
        (lower_text.front() == '[' && lower_text.back() == ']')) {
        return true;
    }

    // Bracketed descriptions mixed with a few stray characters are still noise
    bool has_brackets = (lower_text.find('[') != std::string::npos && lower_text.find(']') != std::string::npos) ||
                        (lower_text.find('(') != std::string::npos && lower_text.find(')') != std::string::npos);
    if (has_brackets) {
        return strip_bracketed(lower_text).length() < 5;
    }

    return false;
}

Transcription classify_transcript(const std::string& raw_text) {
    std::string text = trim_copy(raw_text);

    if (is_blank(lower_copy(text))) {
        return Transcription::missed(TranscriptionStatus::Timeout);
    }
    if (is_silence_marker(text)) {
        return Transcription::missed(TranscriptionStatus::Unintelligible);
    }
    return Transcription::heard(text);
}
