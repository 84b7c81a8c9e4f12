#ifndef STREAMING_AUDIO_INPUT_H
#define STREAMING_AUDIO_INPUT_H

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include "config.h"

// Reference to the global running flag from session_loop.cpp
extern volatile sig_atomic_t g_running;

// Continuous ALSA capture on a background thread. The thread cuts the
// stream into speech segments with the VAD; callers block in
// wait_for_speech() until one segment is complete.
class StreamingAudioInput {
private:
    AudioConfig config;
    StreamingConfig vad;
    bool debug_enabled = false;

    std::vector<float> segment;          // last completed speech segment
    std::vector<float> history;          // rolling pre-speech context
    bool segment_ready = false;

    std::thread capture_thread;
    std::mutex buffer_mutex;
    std::condition_variable cv;
    std::atomic<bool> is_capturing{false};

    void capture_thread_func();

public:
    StreamingAudioInput(const AudioConfig& cfg, const StreamingConfig& vad_cfg, bool debug = false);
    ~StreamingAudioInput();

    StreamingAudioInput(const StreamingAudioInput&) = delete;
    StreamingAudioInput& operator=(const StreamingAudioInput&) = delete;

    bool start();
    void stop();

    // Block until a speech segment is captured or timeout_ms elapses.
    // An empty vector means nothing was said in time.
    std::vector<float> wait_for_speech(int timeout_ms);

    bool is_running() const { return is_capturing.load(); }
    int get_sample_rate() const { return config.sample_rate; }
};

#endif // STREAMING_AUDIO_INPUT_H
