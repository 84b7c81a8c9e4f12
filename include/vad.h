#ifndef VAD_H
#define VAD_H

#include <cstddef>
#include <vector>

// Measurements taken over one analysis window
struct VoiceActivity {
    float energy = 0.0f;          // mean squared amplitude
    float peak_energy = 0.0f;
    float frequency = 0.0f;       // zero-crossing estimate in Hz
    float activity_ratio = 0.0f;  // share of samples above half the threshold
    bool speech = false;
};

// Energy and zero-crossing voice activity detection on float PCM in [-1, 1].
// Speech needs energy above the threshold, a frequency estimate between
// freq_threshold and 3 kHz, and at least 10% of the window active.
inline VoiceActivity measure_voice_activity(const std::vector<float>& audio, int sample_rate,
                                            float threshold, float freq_threshold) {
    VoiceActivity result;
    if (audio.empty() || sample_rate <= 0) {
        return result;
    }

    int zero_crossings = 0;
    int samples_over_threshold = 0;
    const float sample_threshold = threshold * 0.5f;

    for (size_t i = 0; i < audio.size(); i++) {
        float sample_energy = audio[i] * audio[i];
        result.energy += sample_energy;
        if (sample_energy > result.peak_energy) result.peak_energy = sample_energy;
        if (sample_energy > sample_threshold) samples_over_threshold++;

        if (i > 0 && ((audio[i] >= 0 && audio[i - 1] < 0) || (audio[i] < 0 && audio[i - 1] >= 0))) {
            zero_crossings++;
        }
    }
    result.energy /= audio.size();

    float duration = static_cast<float>(audio.size()) / sample_rate;
    result.frequency = zero_crossings / (2 * duration);
    result.activity_ratio = static_cast<float>(samples_over_threshold) / audio.size();

    bool in_speech_range = result.frequency > freq_threshold && result.frequency < 3000.0f;
    bool sustained = result.activity_ratio > 0.10f;
    result.speech = result.energy > threshold && in_speech_range && sustained;
    return result;
}

inline bool detect_voice_activity(const std::vector<float>& audio, int sample_rate,
                                  float threshold, float freq_threshold) {
    return measure_voice_activity(audio, sample_rate, threshold, freq_threshold).speech;
}

#endif // VAD_H
