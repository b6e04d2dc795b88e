#include "errors.hpp"

namespace kdm {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LibraryLoadFailed: return "LibraryLoadFailed";
        case ErrorKind::EntryPointNotFound: return "EntryPointNotFound";
        case ErrorKind::InvalidPlugin: return "InvalidPlugin";
        case ErrorKind::UnsupportedSampleType: return "UnsupportedSampleType";
        case ErrorKind::PrecisionNotSupported: return "PrecisionNotSupported";
        case ErrorKind::MissingSampleFrames: return "MissingSampleFrames";
        case ErrorKind::ChannelCountMismatch: return "ChannelCountMismatch";
        case ErrorKind::SampleTypeMismatch: return "SampleTypeMismatch";
        case ErrorKind::FrameCountMismatch: return "FrameCountMismatch";
        case ErrorKind::PluginClosed: return "PluginClosed";
        case ErrorKind::InvalidHostState: return "InvalidHostState";
        case ErrorKind::InvalidSettings: return "InvalidSettings";
    }
    return "Unknown";
}

PluginError::PluginError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message), kind_(kind) {}

} // namespace kdm
