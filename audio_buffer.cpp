#include "audio_types.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace kdm {

const char* toString(SampleType type) {
    switch (type) {
        case SampleType::Int16: return "int16";
        case SampleType::Int32: return "int32";
        case SampleType::Float32: return "float32";
        case SampleType::Float64: return "float64";
    }
    return "unknown";
}

size_t sampleSize(SampleType type) {
    switch (type) {
        case SampleType::Int16: return sizeof(int16_t);
        case SampleType::Int32: return sizeof(int32_t);
        case SampleType::Float32: return sizeof(float);
        case SampleType::Float64: return sizeof(double);
    }
    return 0;
}

AudioBuffer::AudioBuffer(SampleType type, int numChannels, int numFrames)
    : type_(type), numChannels_(numChannels), numFrames_(numFrames) {
    if (numChannels < 0 || numFrames < 0) {
        throw std::invalid_argument("AudioBuffer: negative shape");
    }
    data_.assign((size_t)numChannels * numFrames * sampleSize(type), 0);
}

void* AudioBuffer::rawChannel(int ch) {
    return data_.data() + (size_t)ch * numFrames_ * sampleSize(type_);
}

const void* AudioBuffer::rawChannel(int ch) const {
    return data_.data() + (size_t)ch * numFrames_ * sampleSize(type_);
}

void AudioBuffer::checkType(SampleType expected) const {
    if (expected != type_) {
        throw std::invalid_argument(std::string("AudioBuffer holds ") + toString(type_) +
                                    " samples, requested " + toString(expected));
    }
}

double AudioBuffer::sampleAt(int ch, int frame) const {
    const void* base = rawChannel(ch);
    switch (type_) {
        case SampleType::Int16: return static_cast<const int16_t*>(base)[frame];
        case SampleType::Int32: return static_cast<const int32_t*>(base)[frame];
        case SampleType::Float32: return static_cast<const float*>(base)[frame];
        case SampleType::Float64: return static_cast<const double*>(base)[frame];
    }
    return 0.0;
}

double AudioBuffer::peak() const {
    double max_val = 0.0;
    for (int ch = 0; ch < numChannels_; ++ch) {
        for (int i = 0; i < numFrames_; ++i) {
            max_val = std::max(max_val, std::abs(sampleAt(ch, i)));
        }
    }
    return max_val;
}

std::vector<float> AudioBuffer::interleaved(int channels) const {
    if (channels <= 0 || numChannels_ == 0) return {};

    std::vector<float> out((size_t)numFrames_ * channels);
    for (int ch = 0; ch < channels; ++ch) {
        const int src = std::min(ch, numChannels_ - 1);
        for (int i = 0; i < numFrames_; ++i) {
            out[(size_t)i * channels + ch] = (float)sampleAt(src, i);
        }
    }
    return out;
}

AudioBuffer AudioBuffer::concatenate(const std::vector<AudioBuffer>& blocks) {
    if (blocks.empty()) return AudioBuffer();

    const SampleType type = blocks.front().type();
    const int channels = blocks.front().numChannels();
    int total_frames = 0;
    for (const auto& block : blocks) {
        if (block.type() != type || block.numChannels() != channels) {
            throw std::invalid_argument("AudioBuffer::concatenate: blocks differ in type or channel count");
        }
        total_frames += block.numFrames();
    }

    AudioBuffer out(type, channels, total_frames);
    const size_t bytes_per_sample = sampleSize(type);
    for (int ch = 0; ch < channels; ++ch) {
        auto* dst = static_cast<uint8_t*>(out.rawChannel(ch));
        for (const auto& block : blocks) {
            size_t bytes = (size_t)block.numFrames() * bytes_per_sample;
            if (bytes == 0) continue;
            std::memcpy(dst, block.rawChannel(ch), bytes);
            dst += bytes;
        }
    }
    return out;
}

} // namespace kdm
