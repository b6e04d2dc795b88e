#include "vst2_plugin.hpp"
#include "vst2_plugin_impl.hpp"

#include <cstring>

#include "errors.hpp"
#include "stdio_capture.hpp"

namespace kdm {

namespace {

// Nominal limits are 8 to 64 bytes; some plugins write well past them.
constexpr size_t kStringBufferSize = 256;

std::string fixedString(const char* buf, size_t size) {
    return std::string(buf, strnlen(buf, size));
}

} // namespace

Vst2Plugin::Vst2Plugin(std::unique_ptr<Vst2PluginImpl> impl) : impl(std::move(impl)) {}

Vst2Plugin::~Vst2Plugin() {
    // effClose is also what frees the plugin instance, opened or not.
    if (impl && !impl->closed && impl->effect != nullptr) {
        ScopedStdioCapture capture(!impl->verbose);
        impl->effect->dispatcher(impl->effect, effClose, 0, 0, nullptr, 0.0f);
    }
}

AEffect* Vst2Plugin::liveEffect() const {
    if (impl->closed || impl->effect == nullptr) {
        throw PluginError(ErrorKind::PluginClosed, impl->path + " has been closed");
    }
    return impl->effect;
}

AEffect* Vst2Plugin::effect() const {
    return impl->closed ? nullptr : impl->effect;
}

const std::string& Vst2Plugin::getPath() const {
    return impl->path;
}

intptr_t Vst2Plugin::dispatch(int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt) {
    AEffect* e = liveEffect();
    ScopedStdioCapture capture(!impl->verbose);
    return e->dispatcher(e, opcode, index, value, ptr, opt);
}

void Vst2Plugin::open() {
    dispatch(effOpen);
}

void Vst2Plugin::close() {
    if (impl->closed) return;
    dispatch(effClose);
    impl->closed = true;
    impl->effect = nullptr;
    impl->pendingEvents.clear();
    impl->library.reset();
}

bool Vst2Plugin::isClosed() const {
    return impl->closed;
}

void Vst2Plugin::resume() {
    dispatch(effMainsChanged, 0, 1);
}

void Vst2Plugin::suspend() {
    dispatch(effMainsChanged, 0, 0);
}

void Vst2Plugin::setSampleRate(float sampleRate) {
    dispatch(effSetSampleRate, 0, 0, nullptr, sampleRate);
}

void Vst2Plugin::setBlockSize(int32_t maxBlockSize) {
    dispatch(effSetBlockSize, 0, maxBlockSize);
}

void Vst2Plugin::setProcessPrecision(bool doublePrecision) {
    dispatch(effSetProcessPrecision, 0, doublePrecision ? kVstProcessPrecision64 : kVstProcessPrecision32);
}

int Vst2Plugin::numParams() const { return liveEffect()->numParams; }
int Vst2Plugin::numPrograms() const { return liveEffect()->numPrograms; }
int Vst2Plugin::numInputs() const { return liveEffect()->numInputs; }
int Vst2Plugin::numOutputs() const { return liveEffect()->numOutputs; }
int32_t Vst2Plugin::flags() const { return liveEffect()->flags; }
int32_t Vst2Plugin::uniqueId() const { return liveEffect()->uniqueID; }
int32_t Vst2Plugin::version() const { return liveEffect()->version; }
int32_t Vst2Plugin::initialDelay() const { return liveEffect()->initialDelay; }

bool Vst2Plugin::isSynth() const {
    return (flags() & effFlagsIsSynth) != 0;
}

bool Vst2Plugin::canDoubleReplacing() const {
    return (flags() & effFlagsCanDoubleReplacing) != 0;
}

int32_t Vst2Plugin::vstVersion() {
    return (int32_t)dispatch(effGetVstVersion);
}

int Vst2Plugin::numMidiInputChannels() {
    return (int)dispatch(effGetNumMidiInputChannels);
}

int Vst2Plugin::numMidiOutputChannels() {
    return (int)dispatch(effGetNumMidiOutputChannels);
}

VstPlugCategory Vst2Plugin::plugCategory() {
    intptr_t category = dispatch(effGetPlugCategory);
    if (category < kPlugCategUnknown || category >= kPlugCategMaxCount) {
        return kPlugCategUnknown;
    }
    return static_cast<VstPlugCategory>(category);
}

std::string Vst2Plugin::dispatchString(int32_t opcode, int32_t index) {
    char buf[kStringBufferSize] = {};
    dispatch(opcode, index, 0, buf);
    return fixedString(buf, sizeof(buf));
}

std::string Vst2Plugin::effectName() {
    return dispatchString(effGetEffectName, 0);
}

std::string Vst2Plugin::vendorString() {
    return dispatchString(effGetVendorString, 0);
}

std::string Vst2Plugin::productString() {
    return dispatchString(effGetProductString, 0);
}

int32_t Vst2Plugin::vendorVersion() {
    return (int32_t)dispatch(effGetVendorVersion);
}

int Vst2Plugin::canDo(const std::string& feature) {
    return (int)dispatch(effCanDo, 0, 0, const_cast<char*>(feature.c_str()));
}

std::optional<PinProperties> Vst2Plugin::pinProperties(int32_t opcode, int index) {
    VstPinProperties props;
    std::memset(&props, 0, sizeof(props));
    if (dispatch(opcode, index, 0, &props) == 0) {
        // Unsupported: the struct may hold anything.
        return std::nullopt;
    }

    PinProperties out;
    out.label = fixedString(props.label, sizeof(props.label));
    out.flags = props.flags;
    out.arrangementType = props.arrangementType;
    out.shortLabel = fixedString(props.shortLabel, sizeof(props.shortLabel));
    return out;
}

std::optional<PinProperties> Vst2Plugin::inputProperties(int index) {
    return pinProperties(effGetInputProperties, index);
}

std::optional<PinProperties> Vst2Plugin::outputProperties(int index) {
    return pinProperties(effGetOutputProperties, index);
}

void Vst2Plugin::processEvents(const std::vector<MidiNoteEvent>& events) {
    liveEffect();
    impl->pendingEvents.emplace_back(events);
    dispatch(effProcessEvents, 0, 0, impl->pendingEvents.back().vstEvents());
}

} // namespace kdm
