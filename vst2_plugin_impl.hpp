#pragma once

#include <memory>
#include <string>
#include <vector>

#include "host_callback.hpp"
#include "midi.hpp"
#include "plugin_loader.hpp"
#include "vst2_abi.hpp"

namespace kdm {

struct Vst2PluginImpl {
    // Declared first so the library is unloaded last.
    LibraryHandle library;
    std::shared_ptr<HostCallback> callback;

    AEffect* effect = nullptr;
    std::string path;
    bool verbose = false;
    bool closed = false;

    // Lists handed to effProcessEvents; released after the next process call.
    std::vector<MidiEventList> pendingEvents;
};

} // namespace kdm
