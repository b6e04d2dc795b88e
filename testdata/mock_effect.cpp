// Test fixture: a single-precision stereo gain exported only under the
// legacy "main" entry name. Reports an older VST version.

#include <cstdio>
#include <cstring>

#include "vst2_abi.hpp"

using namespace kdm;

namespace {

struct MockEffect {
    AEffect effect;
    float level = 1.0f;
};

MockEffect* self(AEffect* e) {
    return static_cast<MockEffect*>(e->object);
}

intptr_t dispatcher(AEffect* e, int32_t opcode, int32_t index, intptr_t, void* ptr, float) {
    switch (opcode) {
        case effClose:
            delete self(e);
            return 0;
        case effGetParamName:
            std::strcpy(static_cast<char*>(ptr), "Level");
            return 0;
        case effGetParamLabel:
            std::strcpy(static_cast<char*>(ptr), "x");
            return 0;
        case effGetParamDisplay:
            std::snprintf(static_cast<char*>(ptr), kVstMaxParamStrLen, "%.2f", self(e)->level);
            return 0;
        case effGetInputProperties:
        case effGetOutputProperties: {
            if (index < 0 || index >= 2) return 0;
            auto* props = static_cast<VstPinProperties*>(ptr);
            std::snprintf(props->label, sizeof(props->label), "%s %d",
                          opcode == effGetInputProperties ? "In" : "Out", index + 1);
            props->flags = kVstPinIsActive;
            return 1;
        }
        case effGetPlugCategory:
            return kPlugCategEffect;
        case effGetVstVersion:
            return 2300;
        default:
            return 0;
    }
}

void setParameter(AEffect* e, int32_t, float value) {
    self(e)->level = value;
}

float getParameter(AEffect* e, int32_t) {
    return self(e)->level;
}

void processReplacing(AEffect* e, float** inputs, float** outputs, int32_t sampleFrames) {
    const float level = self(e)->level;
    for (int ch = 0; ch < 2; ++ch) {
        for (int32_t i = 0; i < sampleFrames; ++i) {
            outputs[ch][i] = inputs != nullptr ? inputs[ch][i] * level : 0.0f;
        }
    }
}

} // namespace

extern "C" __attribute__((visibility("default"))) AEffect* mockEffectMain(AudioMasterCallback audioMaster) __asm__("main");

extern "C" AEffect* mockEffectMain(AudioMasterCallback) {
    auto* s = new MockEffect();
    std::memset(&s->effect, 0, sizeof(s->effect));

    AEffect& e = s->effect;
    e.magic = kEffectMagic;
    e.dispatcher = dispatcher;
    e.setParameter = setParameter;
    e.getParameter = getParameter;
    e.processReplacing = processReplacing;
    e.numPrograms = 1;
    e.numParams = 1;
    e.numInputs = 2;
    e.numOutputs = 2;
    e.flags = effFlagsCanReplacing;
    e.object = s;
    e.uniqueID = 0x4B6D4678; // 'KmFx'
    e.version = 1;
    return &e;
}
