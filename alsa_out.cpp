#include "alsa_out.hpp"

#include <alsa/asoundlib.h>

#include <iostream>
#include <vector>

namespace kdm {

namespace {

constexpr unsigned int kLatencyUs = 50000;

} // namespace

AlsaPlayback::AlsaPlayback(int sampleRate, int channels, const std::string& device) : channels_(channels) {
    int err = snd_pcm_open(&pcm_, device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        std::cerr << "AlsaPlayback: cannot open " << device << ": " << snd_strerror(err) << std::endl;
        pcm_ = nullptr;
        return;
    }

    err = snd_pcm_set_params(pcm_, SND_PCM_FORMAT_FLOAT, SND_PCM_ACCESS_RW_INTERLEAVED, channels_, sampleRate,
                             1, kLatencyUs);
    if (err < 0) {
        std::cerr << "AlsaPlayback: " << device << " rejects " << channels_ << " channels at " << sampleRate
                  << " Hz: " << snd_strerror(err) << std::endl;
        snd_pcm_close(pcm_);
        pcm_ = nullptr;
    }
}

AlsaPlayback::~AlsaPlayback() {
    if (pcm_ != nullptr) {
        drain();
        snd_pcm_close(pcm_);
    }
}

long AlsaPlayback::play(const AudioBuffer& buffer) {
    if (pcm_ == nullptr || buffer.empty()) return 0;

    const std::vector<float> samples = buffer.interleaved(channels_);
    const long total = buffer.numFrames();
    long written = 0;
    while (written < total) {
        snd_pcm_sframes_t n = snd_pcm_writei(pcm_, samples.data() + (size_t)written * channels_,
                                             (snd_pcm_uframes_t)(total - written));
        if (n < 0) {
            // Underruns and suspends are recoverable; anything else ends playback.
            n = snd_pcm_recover(pcm_, (int)n, 1);
            if (n < 0) {
                std::cerr << "AlsaPlayback: write failed: " << snd_strerror((int)n) << std::endl;
                break;
            }
            continue;
        }
        written += n;
    }
    return written;
}

void AlsaPlayback::drain() {
    if (pcm_ == nullptr) return;
    int err = snd_pcm_drain(pcm_);
    if (err < 0) {
        std::cerr << "AlsaPlayback: drain failed: " << snd_strerror(err) << std::endl;
    }
}

} // namespace kdm
