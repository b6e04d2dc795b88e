#include "stdio_capture.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

namespace kdm {

ScopedStdioCapture::ScopedStdioCapture(bool enabled) {
    if (!enabled) return;

    std::cout.flush();
    std::cerr.flush();
    std::fflush(stdout);
    std::fflush(stderr);

    int sink = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (sink < 0) {
        std::cerr << "ScopedStdioCapture: cannot open /dev/null: " << std::strerror(errno) << std::endl;
        return;
    }

    savedStdout_ = ::dup(STDOUT_FILENO);
    savedStderr_ = ::dup(STDERR_FILENO);
    if (savedStdout_ < 0 || savedStderr_ < 0) {
        std::cerr << "ScopedStdioCapture: dup failed: " << std::strerror(errno) << std::endl;
        if (savedStdout_ >= 0) ::close(savedStdout_);
        if (savedStderr_ >= 0) ::close(savedStderr_);
        savedStdout_ = savedStderr_ = -1;
        ::close(sink);
        return;
    }

    if (::dup2(sink, STDOUT_FILENO) < 0 || ::dup2(sink, STDERR_FILENO) < 0) {
        const int err = errno;
        // Put back whichever descriptor was already redirected.
        ::dup2(savedStdout_, STDOUT_FILENO);
        ::dup2(savedStderr_, STDERR_FILENO);
        ::close(savedStdout_);
        ::close(savedStderr_);
        savedStdout_ = savedStderr_ = -1;
        std::cerr << "ScopedStdioCapture: dup2 failed: " << std::strerror(err) << std::endl;
    }
    ::close(sink);
}

ScopedStdioCapture::~ScopedStdioCapture() {
    if (savedStdout_ == -1) return;

    // Plugin output still sitting in stdio buffers belongs to the sink.
    std::fflush(stdout);
    std::fflush(stderr);

    if (::dup2(savedStdout_, STDOUT_FILENO) < 0 || ::dup2(savedStderr_, STDERR_FILENO) < 0) {
        std::cerr << "ScopedStdioCapture: cannot restore stdio: " << std::strerror(errno) << std::endl;
    }
    ::close(savedStdout_);
    ::close(savedStderr_);
}

} // namespace kdm
