#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>

#include "audio_types.hpp"
#include "host_callback.hpp"
#include "vst2_plugin.hpp"

namespace kdm {

enum class HostState {
    Unloaded,
    Loaded,
    Opened,
    Resumed,
    Suspended,
    Closed,
};

const char* toString(HostState state);

// Callback used by SimpleHost: version, sample rate, block size, vendor and
// product strings. Everything else is answered with 0.
class SimpleHostCallback : public HostCallback {
public:
    explicit SimpleHostCallback(const HostSettings& settings) : settings(settings) {}

    intptr_t handle(AEffect* effect, int32_t opcode, int32_t index, intptr_t value, void* ptr, float opt) override;

private:
    HostSettings settings;
};

// Drives one plugin through
// Unloaded -> Loaded -> Opened -> {Resumed <-> Suspended} -> Closed
// and renders single notes.
class SimpleHost {
public:
    // Throws PluginError(InvalidSettings) unless sample rate and block size
    // are positive.
    explicit SimpleHost(const HostSettings& settings = HostSettings());
    // Loads, opens and resumes the plugin at `path`.
    explicit SimpleHost(const std::string& path, const HostSettings& settings = HostSettings());
    ~SimpleHost();

    SimpleHost(const SimpleHost&) = delete;
    SimpleHost& operator=(const SimpleHost&) = delete;

    void load(const std::string& path);
    // effOpen, then sample rate and block size.
    void open();
    void resume();
    void suspend();
    void close();

    // Note-on, `duration` seconds of audio, note-off, one block of release.
    AudioBuffer playNote(uint8_t pitch, double duration, float velocity = 100.0f / 127.0f);

    HostState state() const { return state_; }
    const HostSettings& settings() const { return settings_; }
    Vst2Plugin& plugin();
    std::shared_ptr<HostCallback> callback() const { return callback_; }

private:
    void expectState(const char* operation, std::initializer_list<HostState> allowed) const;

    HostSettings settings_;
    std::shared_ptr<HostCallback> callback_;
    std::unique_ptr<Vst2Plugin> plugin_;
    HostState state_ = HostState::Unloaded;
};

} // namespace kdm
