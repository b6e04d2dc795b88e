#include "plugin_loader.hpp"
#include "vst2_plugin_impl.hpp"

#include <iostream>

#include <dlfcn.h>

#include "errors.hpp"
#include "stdio_capture.hpp"

namespace kdm {

void LibraryCloser::operator()(void* handle) const {
    if (handle != nullptr && dlclose(handle) != 0) {
        std::cerr << "LibraryCloser: dlclose failed: " << dlerror() << std::endl;
    }
}

namespace {

LibraryHandle openLibrary(const std::string& path, bool verbose) {
    void* handle = nullptr;
    {
        // Static constructors in the plugin run here.
        ScopedStdioCapture capture(!verbose);
        handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    }
    if (handle == nullptr) {
        const char* reason = dlerror();
        throw PluginError(ErrorKind::LibraryLoadFailed,
                          "cannot load " + path + ": " + (reason ? reason : "unknown error"));
    }
    return LibraryHandle(handle);
}

PluginEntryProc findEntryPoint(void* handle, const std::string& path) {
    for (const char* name : kEntryPointNames) {
        dlerror();
        void* sym = dlsym(handle, name);
        if (sym != nullptr) {
            return reinterpret_cast<PluginEntryProc>(sym);
        }
    }

    std::string names;
    for (const char* name : kEntryPointNames) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    throw PluginError(ErrorKind::EntryPointNotFound, "none of (" + names + ") found in " + path);
}

} // namespace

std::unique_ptr<Vst2Plugin> loadPlugin(const std::string& path, std::shared_ptr<HostCallback> callback, bool verbose) {
    if (!callback) {
        callback = std::make_shared<MinimalHostCallback>();
    }

    LibraryHandle library = openLibrary(path, verbose);
    PluginEntryProc entry = findEntryPoint(library.get(), path);

    AEffect* effect = nullptr;
    {
        ScopedLoadingCallback loading(callback.get());
        ScopedStdioCapture capture(!verbose);
        effect = entry(hostCallbackEntry);
    }

    if (effect == nullptr) {
        throw PluginError(ErrorKind::InvalidPlugin, "entry point of " + path + " returned no effect");
    }
    if (effect->magic != kEffectMagic) {
        throw PluginError(ErrorKind::InvalidPlugin,
                          "wrong effect magic " + std::to_string(effect->magic) + " in " + path);
    }

    registerHostCallback(effect, callback.get());

    auto impl = std::make_unique<Vst2PluginImpl>();
    impl->library = std::move(library);
    impl->callback = std::move(callback);
    impl->effect = effect;
    impl->path = path;
    impl->verbose = verbose;

    auto plugin = std::make_unique<Vst2Plugin>(std::move(impl));

    int32_t version = plugin->vstVersion();
    if (version != kVstVersion) {
        std::cerr << "Vst2Plugin::load: " << path << " reports VST version " << version
                  << ", expected " << kVstVersion << "; continuing" << std::endl;
    }

    return plugin;
}

} // namespace kdm
