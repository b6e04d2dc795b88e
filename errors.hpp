#pragma once

#include <stdexcept>
#include <string>

namespace kdm {

enum class ErrorKind {
    // Load time. No plugin handle is produced.
    LibraryLoadFailed,
    EntryPointNotFound,
    InvalidPlugin,

    // Processing time.
    UnsupportedSampleType,
    PrecisionNotSupported,
    MissingSampleFrames,
    ChannelCountMismatch,
    SampleTypeMismatch,
    FrameCountMismatch,

    PluginClosed,
    InvalidHostState,
    InvalidSettings,
};

const char* toString(ErrorKind kind);

// A crash inside plugin code is not reported through this type; it takes
// the whole process down.
class PluginError : public std::runtime_error {
public:
    PluginError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace kdm
