#include "host_callback.hpp"

#include <exception>
#include <iostream>

namespace kdm {

namespace {

thread_local HostCallback* tLoadingCallback = nullptr;

} // namespace

intptr_t MinimalHostCallback::handle(AEffect*, int32_t opcode, int32_t, intptr_t, void*, float) {
    if (opcode == audioMasterVersion) {
        return kVstVersion;
    }
    return 0;
}

void registerHostCallback(AEffect* effect, HostCallback* callback) {
    effect->resvd1 = reinterpret_cast<intptr_t>(callback);
}

ScopedLoadingCallback::ScopedLoadingCallback(HostCallback* callback) : previous_(tLoadingCallback) {
    tLoadingCallback = callback;
}

ScopedLoadingCallback::~ScopedLoadingCallback() {
    tLoadingCallback = previous_;
}

intptr_t KDM_VSTCALL hostCallbackEntry(AEffect* effect, int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt) {
    HostCallback* callback = nullptr;
    if (effect != nullptr && effect->resvd1 != 0) {
        callback = reinterpret_cast<HostCallback*>(effect->resvd1);
    } else {
        callback = tLoadingCallback;
    }

    if (callback == nullptr) {
        // Nobody to ask; still tell the plugin what it is talking to.
        return opcode == audioMasterVersion ? kVstVersion : 0;
    }

    // Unwinding through plugin frames is undefined.
    try {
        return callback->handle(effect, opcode, index, value, ptr, opt);
    } catch (const std::exception& e) {
        std::cerr << "hostCallbackEntry: opcode " << opcode << " failed: " << e.what() << std::endl;
        return 0;
    } catch (...) {
        std::cerr << "hostCallbackEntry: opcode " << opcode << " failed with an unknown exception" << std::endl;
        return 0;
    }
}

} // namespace kdm
