#pragma once

#include <string>

#include "audio_types.hpp"

typedef struct _snd_pcm snd_pcm_t;

namespace kdm {

// Blocking float32 output on an ALSA PCM device. Failures are reported on
// std::cerr and leave the device closed; check ready() before writing.
class AlsaPlayback {
public:
    AlsaPlayback(int sampleRate, int channels, const std::string& device = "default");
    ~AlsaPlayback();

    AlsaPlayback(const AlsaPlayback&) = delete;
    AlsaPlayback& operator=(const AlsaPlayback&) = delete;

    bool ready() const { return pcm_ != nullptr; }
    int channels() const { return channels_; }

    // Plays the whole buffer, converting to float and mapping its channels
    // onto the device's. Returns the number of frames written.
    long play(const AudioBuffer& buffer);

    // Blocks until everything queued has been played.
    void drain();

private:
    snd_pcm_t* pcm_ = nullptr;
    int channels_;
};

} // namespace kdm
