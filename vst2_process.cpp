#include "vst2_plugin.hpp"
#include "vst2_plugin_impl.hpp"

#include <string>
#include <vector>

#include "errors.hpp"
#include "stdio_capture.hpp"

namespace kdm {

namespace {

template <typename T>
std::vector<T*> channelPointers(AudioBuffer& buffer) {
    std::vector<T*> ptrs(buffer.numChannels());
    for (int ch = 0; ch < buffer.numChannels(); ++ch) {
        ptrs[ch] = buffer.channel<T>(ch);
    }
    return ptrs;
}

// The ABI takes non-const input pointers; plugins only read from them.
template <typename T>
std::vector<T*> channelPointers(const AudioBuffer& buffer) {
    std::vector<T*> ptrs(buffer.numChannels());
    for (int ch = 0; ch < buffer.numChannels(); ++ch) {
        ptrs[ch] = const_cast<T*>(buffer.channel<T>(ch));
    }
    return ptrs;
}

template <typename T, typename ProcessFn>
void runProcess(AEffect* effect, ProcessFn fn, AudioBuffer& outputs, const AudioBuffer* inputs, bool verbose) {
    // Pointer arrays live only for this call; the plugin may not keep them.
    std::vector<T*> outPtrs = channelPointers<T>(outputs);
    std::vector<T*> inPtrs;
    if (inputs != nullptr) {
        inPtrs = channelPointers<T>(*inputs);
    }

    ScopedStdioCapture capture(!verbose);
    fn(effect,
       inputs != nullptr ? inPtrs.data() : nullptr,
       outPtrs.data(),
       outputs.numFrames());
}

} // namespace

void Vst2Plugin::processInto(AudioBuffer& outputs, const AudioBuffer* inputs) {
    AEffect* e = liveEffect();

    if (inputs != nullptr) {
        if (inputs->type() != outputs.type()) {
            throw PluginError(ErrorKind::SampleTypeMismatch,
                              std::string("inputs are ") + toString(inputs->type()) +
                                  ", outputs are " + toString(outputs.type()));
        }
        if (inputs->numChannels() != e->numInputs) {
            throw PluginError(ErrorKind::ChannelCountMismatch,
                              "plugin has " + std::to_string(e->numInputs) + " inputs, buffer has " +
                                  std::to_string(inputs->numChannels()) + " channels");
        }
        if (inputs->numFrames() != outputs.numFrames()) {
            throw PluginError(ErrorKind::FrameCountMismatch,
                              "inputs have " + std::to_string(inputs->numFrames()) + " frames, outputs have " +
                                  std::to_string(outputs.numFrames()));
        }
    }
    if (outputs.numChannels() != e->numOutputs) {
        throw PluginError(ErrorKind::ChannelCountMismatch,
                          "plugin has " + std::to_string(e->numOutputs) + " outputs, buffer has " +
                              std::to_string(outputs.numChannels()) + " channels");
    }

    switch (outputs.type()) {
        case SampleType::Float32:
            if (e->processReplacing == nullptr) {
                throw PluginError(ErrorKind::PrecisionNotSupported, "plugin has no processReplacing");
            }
            runProcess<float>(e, e->processReplacing, outputs, inputs, impl->verbose);
            break;
        case SampleType::Float64:
            if (!(e->flags & effFlagsCanDoubleReplacing) || e->processDoubleReplacing == nullptr) {
                throw PluginError(ErrorKind::PrecisionNotSupported,
                                  "float64 processing requested but the plugin does not support it");
            }
            runProcess<double>(e, e->processDoubleReplacing, outputs, inputs, impl->verbose);
            break;
        default:
            throw PluginError(ErrorKind::UnsupportedSampleType,
                              std::string("cannot process ") + toString(outputs.type()) +
                                  " samples, only float32 and float64");
    }

    impl->pendingEvents.clear();
}

AudioBuffer Vst2Plugin::process(std::optional<int> sampleFrames, const AudioBuffer* inputs,
                                std::optional<bool> doublePrecision) {
    AEffect* e = liveEffect();

    if (inputs != nullptr && inputs->type() != SampleType::Float32 && inputs->type() != SampleType::Float64) {
        throw PluginError(ErrorKind::UnsupportedSampleType,
                          std::string("cannot process ") + toString(inputs->type()) +
                              " inputs, only float32 and float64");
    }
    if (sampleFrames && *sampleFrames < 0) {
        throw PluginError(ErrorKind::FrameCountMismatch,
                          "sampleFrames must not be negative, got " + std::to_string(*sampleFrames));
    }

    bool use_double;
    if (doublePrecision) {
        use_double = *doublePrecision;
    } else if (inputs != nullptr) {
        use_double = inputs->type() == SampleType::Float64;
    } else {
        use_double = canDoubleReplacing();
    }
    const SampleType type = use_double ? SampleType::Float64 : SampleType::Float32;

    int frames;
    if (inputs != nullptr) {
        frames = inputs->numFrames();
        if (sampleFrames && *sampleFrames != frames) {
            throw PluginError(ErrorKind::FrameCountMismatch,
                              "sampleFrames is " + std::to_string(*sampleFrames) + " but inputs have " +
                                  std::to_string(frames) + " frames");
        }
    } else if (sampleFrames) {
        frames = *sampleFrames;
    } else {
        throw PluginError(ErrorKind::MissingSampleFrames, "sampleFrames is required when no input is given");
    }

    if (inputs != nullptr && inputs->type() != type) {
        throw PluginError(ErrorKind::SampleTypeMismatch,
                          std::string("inputs are ") + toString(inputs->type()) + ", requested " + toString(type));
    }

    // A plugin with inputs gets silence rather than a null array.
    AudioBuffer silence;
    if (inputs == nullptr && e->numInputs > 0) {
        silence = AudioBuffer(type, e->numInputs, frames);
        inputs = &silence;
    }

    AudioBuffer outputs(type, e->numOutputs, frames);
    processInto(outputs, inputs);
    return outputs;
}

} // namespace kdm
