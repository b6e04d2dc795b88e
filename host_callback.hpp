#pragma once

#include <cstdint>

#include "vst2_abi.hpp"

namespace kdm {

// Receives the plugin's calls back into the host (audioMaster opcodes).
// May be invoked during loading, with a null or not yet registered effect,
// and from inside any dispatch or process call.
class HostCallback {
public:
    virtual ~HostCallback() = default;
    virtual intptr_t handle(AEffect* effect, int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt) = 0;
};

// Answers audioMasterVersion and nothing else.
class MinimalHostCallback : public HostCallback {
public:
    intptr_t handle(AEffect* effect, int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt) override;
};

// The function pointer handed to the plugin's entry symbol. Routes to the
// HostCallback stored in effect->resvd1, or to the one whose plugin is being
// loaded on this thread.
intptr_t KDM_VSTCALL hostCallbackEntry(AEffect* effect, int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt);

void registerHostCallback(AEffect* effect, HostCallback* callback);

// Marks `callback` as the target for callbacks arriving while the entry
// symbol runs, before the effect exists.
class ScopedLoadingCallback {
public:
    explicit ScopedLoadingCallback(HostCallback* callback);
    ~ScopedLoadingCallback();

    ScopedLoadingCallback(const ScopedLoadingCallback&) = delete;
    ScopedLoadingCallback& operator=(const ScopedLoadingCallback&) = delete;

private:
    HostCallback* previous_;
};

} // namespace kdm
