#pragma once

namespace kdm {

// Sends stdout and stderr to /dev/null for the lifetime of the object and
// restores them on destruction. Constructed around every call into plugin
// code. Scopes nest: an inner scope restores to whatever the outer one
// installed.
class ScopedStdioCapture {
public:
    explicit ScopedStdioCapture(bool enabled);
    ~ScopedStdioCapture();

    ScopedStdioCapture(const ScopedStdioCapture&) = delete;
    ScopedStdioCapture& operator=(const ScopedStdioCapture&) = delete;

    bool active() const { return savedStdout_ != -1; }

private:
    int savedStdout_ = -1;
    int savedStderr_ = -1;
};

} // namespace kdm
