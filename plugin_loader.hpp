#pragma once

#include <array>
#include <memory>
#include <string>

#include "host_callback.hpp"
#include "vst2_plugin.hpp"

namespace kdm {

struct LibraryCloser {
    void operator()(void* handle) const;
};

using LibraryHandle = std::unique_ptr<void, LibraryCloser>;

// Entry symbols probed in order; the first one present is used.
constexpr std::array<const char*, 2> kEntryPointNames{"VSTPluginMain", "main"};

// Loads the binary at `path`, runs its entry point and validates the
// descriptor. Throws PluginError with LibraryLoadFailed, EntryPointNotFound or
// InvalidPlugin; on failure the library is unloaded again.
// A null `callback` installs a MinimalHostCallback. Unless `verbose`, plugin
// stdout/stderr is discarded during every call into the plugin.
std::unique_ptr<Vst2Plugin> loadPlugin(const std::string& path,
                                       std::shared_ptr<HostCallback> callback = nullptr,
                                       bool verbose = false);

} // namespace kdm
