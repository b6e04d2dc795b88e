#include "simple_host.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <vector>

#include "errors.hpp"
#include "plugin_loader.hpp"

namespace kdm {

namespace {

constexpr const char* kHostVendor = "kodama";
constexpr const char* kHostProduct = "kodama SimpleHost";
constexpr int32_t kHostVendorVersion = 100;

} // namespace

const char* toString(HostState state) {
    switch (state) {
        case HostState::Unloaded: return "Unloaded";
        case HostState::Loaded: return "Loaded";
        case HostState::Opened: return "Opened";
        case HostState::Resumed: return "Resumed";
        case HostState::Suspended: return "Suspended";
        case HostState::Closed: return "Closed";
    }
    return "Unknown";
}

intptr_t SimpleHostCallback::handle(AEffect*, int32_t opcode, int32_t, intptr_t, void* ptr, float) {
    switch (opcode) {
        case audioMasterVersion:
            return kVstVersion;
        case audioMasterGetSampleRate:
            return (intptr_t)settings.sampleRate;
        case audioMasterGetBlockSize:
            return settings.blockSize;
        case audioMasterGetVendorString:
            if (ptr == nullptr) return 0;
            std::strncpy(static_cast<char*>(ptr), kHostVendor, kVstMaxVendorStrLen - 1);
            return 1;
        case audioMasterGetProductString:
            if (ptr == nullptr) return 0;
            std::strncpy(static_cast<char*>(ptr), kHostProduct, kVstMaxProductStrLen - 1);
            return 1;
        case audioMasterGetVendorVersion:
            return kHostVendorVersion;
        case audioMasterGetCurrentProcessLevel:
            return 0; // unknown
        default:
            return 0;
    }
}

SimpleHost::SimpleHost(const HostSettings& settings)
    : settings_(settings), callback_(std::make_shared<SimpleHostCallback>(settings)) {
    if (!(settings_.sampleRate > 0.0)) {
        throw PluginError(ErrorKind::InvalidSettings,
                          "sample rate must be positive, got " + std::to_string(settings_.sampleRate));
    }
    if (settings_.blockSize <= 0) {
        throw PluginError(ErrorKind::InvalidSettings,
                          "block size must be positive, got " + std::to_string(settings_.blockSize));
    }
}

SimpleHost::SimpleHost(const std::string& path, const HostSettings& settings) : SimpleHost(settings) {
    load(path);
    open();
    resume();
}

SimpleHost::~SimpleHost() {
    if (plugin_ && state_ != HostState::Closed && !plugin_->isClosed()) {
        if (state_ == HostState::Resumed) {
            plugin_->suspend();
        }
        plugin_->close();
    }
}

void SimpleHost::expectState(const char* operation, std::initializer_list<HostState> allowed) const {
    if (std::find(allowed.begin(), allowed.end(), state_) == allowed.end()) {
        throw PluginError(ErrorKind::InvalidHostState,
                          std::string("cannot ") + operation + " while " + toString(state_));
    }
}

Vst2Plugin& SimpleHost::plugin() {
    if (!plugin_) {
        throw PluginError(ErrorKind::InvalidHostState, "no plugin loaded");
    }
    return *plugin_;
}

void SimpleHost::load(const std::string& path) {
    expectState("load", {HostState::Unloaded});
    plugin_ = loadPlugin(path, callback_, settings_.verbose);
    state_ = HostState::Loaded;
}

void SimpleHost::open() {
    expectState("open", {HostState::Loaded});
    plugin_->open();
    plugin_->setSampleRate((float)settings_.sampleRate);
    plugin_->setBlockSize(settings_.blockSize);
    if (plugin_->canDoubleReplacing()) {
        plugin_->setProcessPrecision(true);
    }
    state_ = HostState::Opened;
}

void SimpleHost::resume() {
    expectState("resume", {HostState::Opened, HostState::Suspended});
    plugin_->resume();
    state_ = HostState::Resumed;
}

void SimpleHost::suspend() {
    expectState("suspend", {HostState::Resumed});
    plugin_->suspend();
    state_ = HostState::Suspended;
}

void SimpleHost::close() {
    expectState("close", {HostState::Opened, HostState::Resumed, HostState::Suspended});
    if (state_ == HostState::Resumed) {
        plugin_->suspend();
    }
    plugin_->close();
    state_ = HostState::Closed;
}

AudioBuffer SimpleHost::playNote(uint8_t pitch, double duration, float velocity) {
    expectState("play a note", {HostState::Opened, HostState::Resumed, HostState::Suspended});

    MidiNoteEvent e;
    e.sampleOffset = 0;
    e.channel = 0;
    e.pitch = pitch;
    e.velocity = velocity;
    e.isNoteOn = true;
    plugin_->processEvents({e});

    std::vector<AudioBuffer> blocks;
    const long total_frames = std::max(0L, std::lround(duration * settings_.sampleRate));
    long rendered = 0;
    while (rendered < total_frames) {
        int frames = (int)std::min<long>(settings_.blockSize, total_frames - rendered);
        blocks.push_back(plugin_->process(frames));
        rendered += frames;
    }

    e.isNoteOn = false;
    e.velocity = 0.0f;
    plugin_->processEvents({e});

    // Release tail.
    blocks.push_back(plugin_->process(settings_.blockSize));

    return AudioBuffer::concatenate(blocks);
}

} // namespace kdm
