// Test fixture: exports the entry point but returns a descriptor with the
// wrong magic.

#include <cstring>

#include "vst2_abi.hpp"

using namespace kdm;

namespace {

AEffect gEffect;

} // namespace

extern "C" __attribute__((visibility("default"))) AEffect* VSTPluginMain(AudioMasterCallback) {
    std::memset(&gEffect, 0, sizeof(gEffect));
    gEffect.magic = 0x50747356; // 'VstP' byte-swapped
    gEffect.numOutputs = 2;
    return &gEffect;
}
