#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audio_types.hpp"
#include "vst2_abi.hpp"

namespace kdm {

struct Vst2PluginImpl;

// A loaded VST 2.4 plugin. Owns the library handle and the plugin's
// descriptor; obtained from loadPlugin(). Every call blocks until the
// plugin returns. Not thread safe.
class Vst2Plugin {
public:
    explicit Vst2Plugin(std::unique_ptr<Vst2PluginImpl> impl);
    ~Vst2Plugin();

    Vst2Plugin(const Vst2Plugin&) = delete;
    Vst2Plugin& operator=(const Vst2Plugin&) = delete;

    // Raw call through the plugin's dispatcher.
    intptr_t dispatch(int32_t opcode, int32_t index = 0, intptr_t value = 0, void* ptr = nullptr, float opt = 0.0f);

    // Lifecycle
    void open();
    // Sends effClose and unloads the library. Every later call throws
    // PluginError(PluginClosed).
    void close();
    void resume();
    void suspend();
    bool isClosed() const;

    void setSampleRate(float sampleRate);
    void setBlockSize(int32_t maxBlockSize);
    void setProcessPrecision(bool doublePrecision);

    // Descriptor fields, read on every call.
    int numParams() const;
    int numPrograms() const;
    int numInputs() const;
    int numOutputs() const;
    int32_t flags() const;
    int32_t uniqueId() const;
    int32_t version() const;
    int32_t initialDelay() const;
    bool isSynth() const;
    bool canDoubleReplacing() const;

    // Dispatcher queries
    int32_t vstVersion();
    int numMidiInputChannels();
    int numMidiOutputChannels();
    VstPlugCategory plugCategory();
    std::string effectName();
    std::string vendorString();
    std::string productString();
    int32_t vendorVersion();
    // 1: yes, -1: no, 0: don't know.
    int canDo(const std::string& feature);
    std::optional<PinProperties> inputProperties(int index);
    std::optional<PinProperties> outputProperties(int index);

    // Parameters. Indices are not checked against numParams().
    float getParamValue(int index);
    void setParamValue(int index, float value);
    std::string getParamName(int index);
    std::string getParamLabel(int index);
    std::string getParamDisplay(int index);
    std::optional<ParamProperties> getParamProperties(int index);
    ParameterDescriptor describeParameter(int index);

    // Events are kept alive until the next process call returns.
    void processEvents(const std::vector<MidiNoteEvent>& events);

    // Renders into caller-owned buffers. `inputs` may be null.
    void processInto(AudioBuffer& outputs, const AudioBuffer* inputs = nullptr);

    // Allocating variant. Frame count comes from `inputs` or `sampleFrames`;
    // precision from `doublePrecision`, else the inputs' type, else the best
    // the plugin supports.
    AudioBuffer process(std::optional<int> sampleFrames, const AudioBuffer* inputs = nullptr,
                        std::optional<bool> doublePrecision = std::nullopt);

    AEffect* effect() const;
    const std::string& getPath() const;

private:
    AEffect* liveEffect() const;
    std::string dispatchString(int32_t opcode, int32_t index);
    std::optional<PinProperties> pinProperties(int32_t opcode, int index);

    std::unique_ptr<Vst2PluginImpl> impl;
};

} // namespace kdm
