// Test fixture: a minimal VST 2.4 synth. Sine voice, one note at a time.

#include <cmath>
#include <cstdio>
#include <cstring>

#include "vst2_abi.hpp"

using namespace kdm;

namespace {

constexpr int kNumParams = 2;
constexpr double kTwoPi = 6.283185307179586;

struct MockSynth {
    AEffect effect;
    AudioMasterCallback audioMaster = nullptr;
    float params[kNumParams] = {0.5f, 0.0f}; // gain, tune
    double sampleRate = 44100.0;
    double hostSampleRate = 0.0;
    int32_t blockSize = 512;
    bool noteOn = false;
    double phase = 0.0;
    double freq = 440.0;
};

const char* const kParamNames[kNumParams] = {"Gain", "Tune"};
const char* const kParamLabels[kNumParams] = {"amp", "st"};

MockSynth* self(AEffect* e) {
    return static_cast<MockSynth*>(e->object);
}

void handleEvents(MockSynth* s, const VstEvents* events) {
    for (int i = 0; i < events->numEvents; ++i) {
        const VstEvent* ev = events->events[i];
        if (ev->type != kVstMidiType) continue;
        const auto* midi = reinterpret_cast<const VstMidiEvent*>(ev);
        const uint8_t status = (uint8_t)midi->midiData[0] & 0xF0;
        const uint8_t note = (uint8_t)midi->midiData[1];
        const uint8_t velocity = (uint8_t)midi->midiData[2];
        if (status == 0x90 && velocity > 0) {
            s->noteOn = true;
            s->freq = 440.0 * std::pow(2.0, (note - 69.0) / 12.0);
        } else if (status == 0x80 || status == 0x90) {
            s->noteOn = false;
        }
    }
}

intptr_t dispatcher(AEffect* e, int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt) {
    MockSynth* s = self(e);
    switch (opcode) {
        case effOpen:
            std::printf("mock_synth: open\n");
            std::fflush(stdout);
            return 0;
        case effClose:
            delete s;
            return 0;
        case effGetParamName:
            std::strcpy(static_cast<char*>(ptr), kParamNames[index]);
            return 0;
        case effGetParamLabel:
            std::strcpy(static_cast<char*>(ptr), kParamLabels[index]);
            return 0;
        case effGetParamDisplay:
            std::snprintf(static_cast<char*>(ptr), kVstMaxParamStrLen, "%.3f", s->params[index]);
            return 0;
        case effSetSampleRate:
            s->sampleRate = opt;
            return 0;
        case effSetBlockSize:
            s->blockSize = (int32_t)value;
            return 0;
        case effMainsChanged:
            if (value != 0 && s->audioMaster) {
                s->hostSampleRate = (double)s->audioMaster(e, audioMasterGetSampleRate, 0, 0, nullptr, 0.0f);
            }
            return 0;
        case effProcessEvents:
            handleEvents(s, static_cast<const VstEvents*>(ptr));
            return 1;
        case effGetInputProperties:
            // No inputs. Leave junk behind the way some plugins do.
            std::strcpy(static_cast<VstPinProperties*>(ptr)->label, "junk");
            return 0;
        case effGetOutputProperties: {
            if (index < 0 || index >= 2) return 0;
            auto* props = static_cast<VstPinProperties*>(ptr);
            std::strcpy(props->label, index == 0 ? "Mock Out L" : "Mock Out R");
            std::strcpy(props->shortLabel, index == 0 ? "OutL" : "OutR");
            props->flags = kVstPinIsActive | kVstPinIsStereo;
            return 1;
        }
        case effGetPlugCategory:
            return kPlugCategSynth;
        case effGetEffectName:
            std::strcpy(static_cast<char*>(ptr), "MockSynth");
            return 1;
        case effGetVendorString:
            std::strcpy(static_cast<char*>(ptr), "kodama tests");
            return 1;
        case effGetProductString:
            std::strcpy(static_cast<char*>(ptr), "Mock Synth");
            return 1;
        case effGetVendorVersion:
            return 1000;
        case effCanDo:
            if (std::strcmp(static_cast<const char*>(ptr), "receiveVstMidiEvent") == 0) return 1;
            if (std::strcmp(static_cast<const char*>(ptr), "sendVstMidiEvent") == 0) return -1;
            return 0;
        case effGetParameterProperties: {
            auto* props = static_cast<VstParameterProperties*>(ptr);
            if (index != 0) {
                std::strcpy(props->label, "junk");
                props->flags = -1;
                return 0;
            }
            std::strcpy(props->label, "Gain");
            std::strcpy(props->shortLabel, "Gn");
            props->flags = kVstParameterUsesFloatStep | kVstParameterCanRamp;
            props->stepFloat = 0.01f;
            props->smallStepFloat = 0.001f;
            props->largeStepFloat = 0.1f;
            return 1;
        }
        case effGetVstVersion:
            return kVstVersion;
        case effGetNumMidiInputChannels:
            return 16;
        case effGetNumMidiOutputChannels:
            return 0;
        case effSetProcessPrecision:
            return 1;
        default:
            return 0;
    }
}

void setParameter(AEffect* e, int32_t index, float value) {
    self(e)->params[index] = value;
}

float getParameter(AEffect* e, int32_t index) {
    return self(e)->params[index];
}

template <typename T>
void render(AEffect* e, T** outputs, int32_t sampleFrames) {
    MockSynth* s = self(e);
    for (int32_t i = 0; i < sampleFrames; ++i) {
        T val = 0;
        if (s->noteOn) {
            val = (T)(s->params[0] * std::sin(s->phase));
            s->phase += kTwoPi * s->freq / s->sampleRate;
            if (s->phase > kTwoPi) s->phase -= kTwoPi;
        }
        outputs[0][i] = val;
        outputs[1][i] = val;
    }
}

void processReplacing(AEffect* e, float**, float** outputs, int32_t sampleFrames) {
    render<float>(e, outputs, sampleFrames);
}

void processDoubleReplacing(AEffect* e, double**, double** outputs, int32_t sampleFrames) {
    render<double>(e, outputs, sampleFrames);
}

} // namespace

extern "C" __attribute__((visibility("default"))) AEffect* VSTPluginMain(AudioMasterCallback audioMaster) {
    // Same handshake as the reference SDK: no host version, no plugin.
    if (audioMaster(nullptr, audioMasterVersion, 0, 0, nullptr, 0.0f) == 0) {
        return nullptr;
    }

    auto* s = new MockSynth();
    std::memset(&s->effect, 0, sizeof(s->effect));
    s->audioMaster = audioMaster;

    AEffect& e = s->effect;
    e.magic = kEffectMagic;
    e.dispatcher = dispatcher;
    e.setParameter = setParameter;
    e.getParameter = getParameter;
    e.processReplacing = processReplacing;
    e.processDoubleReplacing = processDoubleReplacing;
    e.numPrograms = 1;
    e.numParams = kNumParams;
    e.numInputs = 0;
    e.numOutputs = 2;
    e.flags = effFlagsCanReplacing | effFlagsIsSynth | effFlagsCanDoubleReplacing;
    e.object = s;
    e.uniqueID = 0x4B6D5379; // 'KmSy'
    e.version = 1000;

    std::printf("mock_synth: created\n");
    std::fflush(stdout);
    return &e;
}
