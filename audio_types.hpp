#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kdm {

struct HostSettings {
    double sampleRate = 44100.0;
    int32_t blockSize = 512;
    bool verbose = false; // let plugin stdout/stderr through
};

struct MidiNoteEvent {
    int32_t sampleOffset;
    uint8_t channel;
    uint8_t pitch;
    float velocity; // 0.0 - 1.0
    bool isNoteOn;
};

enum class SampleType {
    Int16,
    Int32,
    Float32,
    Float64,
};

const char* toString(SampleType type);
size_t sampleSize(SampleType type);

template <typename T> struct SampleTypeOf;
template <> struct SampleTypeOf<int16_t> { static constexpr SampleType value = SampleType::Int16; };
template <> struct SampleTypeOf<int32_t> { static constexpr SampleType value = SampleType::Int32; };
template <> struct SampleTypeOf<float> { static constexpr SampleType value = SampleType::Float32; };
template <> struct SampleTypeOf<double> { static constexpr SampleType value = SampleType::Float64; };

// Channel-major block of samples. Every channel has numFrames() samples
// and all of them share one sample type.
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(SampleType type, int numChannels, int numFrames);

    SampleType type() const { return type_; }
    int numChannels() const { return numChannels_; }
    int numFrames() const { return numFrames_; }
    bool empty() const { return numChannels_ == 0 || numFrames_ == 0; }

    void* rawChannel(int ch);
    const void* rawChannel(int ch) const;

    // Throws std::invalid_argument when T is not the buffer's sample type.
    template <typename T> T* channel(int ch) {
        checkType(SampleTypeOf<T>::value);
        return static_cast<T*>(rawChannel(ch));
    }
    template <typename T> const T* channel(int ch) const {
        checkType(SampleTypeOf<T>::value);
        return static_cast<const T*>(rawChannel(ch));
    }

    // Sample as double regardless of storage type; integers are not rescaled.
    double sampleAt(int ch, int frame) const;
    double peak() const;

    // Frame-major float copy with `channels` samples per frame. Missing
    // channels repeat the last one; extra channels are dropped.
    std::vector<float> interleaved(int channels) const;

    // Joins blocks along the frame axis. All blocks must agree on type and
    // channel count.
    static AudioBuffer concatenate(const std::vector<AudioBuffer>& blocks);

private:
    void checkType(SampleType expected) const;

    SampleType type_ = SampleType::Float32;
    int numChannels_ = 0;
    int numFrames_ = 0;
    std::vector<uint8_t> data_;
};

struct ParamProperties {
    float stepFloat;
    float smallStepFloat;
    float largeStepFloat;
    std::string label;
    int32_t flags;
    int32_t minInteger;
    int32_t maxInteger;
    int32_t stepInteger;
    int32_t largeStepInteger;
    std::string shortLabel;
    int16_t displayIndex;
    int16_t category;
    int16_t numParametersInCategory;
    std::string categoryLabel;
};

struct PinProperties {
    std::string label;
    int32_t flags;
    int32_t arrangementType;
    std::string shortLabel;
};

struct ParameterDescriptor {
    int index;
    std::string name;
    std::string label;
    std::string display;
    float value;
    std::optional<ParamProperties> properties;
};

} // namespace kdm
