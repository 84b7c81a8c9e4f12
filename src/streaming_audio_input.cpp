#include "streaming_audio_input.h"
#include "vad.h"
#include <iostream>
#include <chrono>
#include <cstdlib>
#include <cerrno>

// ALSA headers
#include <alsa/asoundlib.h>

namespace {

// Open and configure a mono S16_LE capture handle. Returns nullptr on failure.
snd_pcm_t* open_capture_device(const std::string& device, unsigned int& rate) {
    snd_pcm_t* pcm_handle = nullptr;
    int err = snd_pcm_open(&pcm_handle, device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        std::cerr << "Error: Cannot open audio device " << device << ": " << snd_strerror(err) << std::endl;
        std::cerr << "Hint: adjust audio.device in config.json or use --input-device" << std::endl;
        return nullptr;
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(pcm_handle, hw_params);

    const char* step = nullptr;
    if ((err = snd_pcm_hw_params_set_access(pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        step = "set access type";
    } else if ((err = snd_pcm_hw_params_set_format(pcm_handle, hw_params, SND_PCM_FORMAT_S16_LE)) < 0) {
        step = "set sample format";
    } else if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle, hw_params, &rate, 0)) < 0) {
        step = "set sample rate";
    } else if ((err = snd_pcm_hw_params_set_channels(pcm_handle, hw_params, 1)) < 0) {
        step = "set channels";
    } else {
        snd_pcm_uframes_t buffer_size = rate / 10;
        if ((err = snd_pcm_hw_params_set_buffer_size_near(pcm_handle, hw_params, &buffer_size)) < 0) {
            step = "set buffer size";
        } else if ((err = snd_pcm_hw_params(pcm_handle, hw_params)) < 0) {
            step = "set hardware parameters";
        } else if ((err = snd_pcm_prepare(pcm_handle)) < 0) {
            step = "prepare audio interface";
        }
    }

    if (step) {
        std::cerr << "Error: Cannot " << step << ": " << snd_strerror(err) << std::endl;
        snd_pcm_close(pcm_handle);
        return nullptr;
    }
    return pcm_handle;
}

} // namespace

StreamingAudioInput::StreamingAudioInput(const AudioConfig& cfg, const StreamingConfig& vad_cfg, bool debug)
    : config(cfg), vad(vad_cfg), debug_enabled(debug) {}

StreamingAudioInput::~StreamingAudioInput() {
    stop();
}

bool StreamingAudioInput::start() {
    if (is_capturing.load()) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(buffer_mutex);
        segment.clear();
        history.clear();
        segment_ready = false;
    }

    is_capturing.store(true);
    try {
        capture_thread = std::thread(&StreamingAudioInput::capture_thread_func, this);
    } catch (const std::system_error& e) {
        std::cerr << "Error: Failed to start audio capture thread: " << e.what() << std::endl;
        is_capturing.store(false);
        return false;
    }

    if (debug_enabled) {
        std::cout << "Info: Audio capture thread started" << std::endl;
    }
    return true;
}

void StreamingAudioInput::stop() {
    is_capturing.store(false);
    cv.notify_all();

    if (capture_thread.joinable()) {
        capture_thread.join();
        if (debug_enabled) {
            std::cout << "Info: Audio capture thread stopped" << std::endl;
        }
    }
}

std::vector<float> StreamingAudioInput::wait_for_speech(int timeout_ms) {
    if (!is_capturing.load() && !start()) {
        return {};
    }

    std::unique_lock<std::mutex> lock(buffer_mutex);
    bool ready = cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return segment_ready || !is_capturing.load();
    });

    if (!ready || !segment_ready) {
        if (debug_enabled) {
            std::cout << "Info: No speech detected within timeout" << std::endl;
        }
        return {};
    }

    std::vector<float> result;
    result.swap(segment);
    segment_ready = false;
    return result;
}

void StreamingAudioInput::capture_thread_func() {
    unsigned int rate = static_cast<unsigned int>(config.sample_rate);
    snd_pcm_t* pcm_handle = open_capture_device(config.device, rate);
    if (!pcm_handle) {
        is_capturing.store(false);
        cv.notify_all();
        return;
    }

    if (rate != static_cast<unsigned int>(config.sample_rate)) {
        std::cerr << "Warning: Requested sample rate " << config.sample_rate
                  << " Hz, device gave " << rate << " Hz" << std::endl;
    }

    const int frames_per_chunk = static_cast<int>(rate / 10);
    const size_t vad_window = rate / 2;
    const size_t history_frames = static_cast<size_t>(vad.padding_ms) * rate / 1000;
    const int min_speech_frames = vad.min_speech_ms * static_cast<int>(rate) / 1000;
    const int max_silence_frames = vad.max_silence_ms * static_cast<int>(rate) / 1000;

    std::vector<int16_t> pcm_buffer(frames_per_chunk);
    std::vector<float> window;
    std::vector<float> current;          // segment being assembled
    bool speaking = false;
    int speech_frames = 0;
    int silence_frames = 0;

    while (is_capturing.load() && g_running) {
        int frames = snd_pcm_readi(pcm_handle, pcm_buffer.data(), frames_per_chunk);
        if (frames == -EPIPE) {
            snd_pcm_prepare(pcm_handle);
            std::cerr << "Warning: Buffer overrun occurred" << std::endl;
            continue;
        }
        if (frames < 0) {
            std::cerr << "Error: Cannot read from audio interface: " << snd_strerror(frames) << std::endl;
            break;
        }

        std::vector<float> chunk(frames);
        for (int i = 0; i < frames; i++) {
            chunk[i] = static_cast<float>(pcm_buffer[i]) / 32768.0f;
        }

        window.insert(window.end(), chunk.begin(), chunk.end());
        if (window.size() > vad_window) {
            window.erase(window.begin(), window.end() - vad_window);
        }

        VoiceActivity activity = measure_voice_activity(window, rate, vad.vad_threshold, vad.vad_freq_threshold);
        if (debug_enabled && activity.speech != speaking) {
            std::cout << "Debug: VAD energy " << activity.energy << ", frequency " << activity.frequency
                      << " Hz, active " << activity.activity_ratio * 100.0f << "%" << std::endl;
        }

        if (speaking) {
            current.insert(current.end(), chunk.begin(), chunk.end());
        }

        if (activity.speech) {
            speech_frames += frames;
            silence_frames = 0;
            if (!speaking && speech_frames >= min_speech_frames) {
                speaking = true;
                current = history;
                current.insert(current.end(), chunk.begin(), chunk.end());
                if (debug_enabled) {
                    std::cout << "Info: Speech detected" << std::endl;
                }
            }
        } else {
            silence_frames += frames;
            if (!speaking) {
                speech_frames = 0;
            } else if (silence_frames >= max_silence_frames) {
                if (debug_enabled) {
                    std::cout << "Info: Speech ended after " << speech_frames * 1000 / static_cast<int>(rate)
                              << " ms" << std::endl;
                }
                {
                    std::lock_guard<std::mutex> lock(buffer_mutex);
                    segment.swap(current);
                    segment_ready = true;
                }
                cv.notify_all();
                current.clear();
                speaking = false;
                speech_frames = 0;
            }
        }

        history.insert(history.end(), chunk.begin(), chunk.end());
        if (history.size() > history_frames) {
            history.erase(history.begin(), history.end() - history_frames);
        }
    }

    snd_pcm_close(pcm_handle);
    is_capturing.store(false);
    cv.notify_all();

    if (debug_enabled) {
        std::cout << "Info: Audio capture thread exiting" << std::endl;
    }
}
