#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "stdio_capture.hpp"

using namespace kdm;

namespace {

// Points one of the standard descriptors at a temporary file for the
// lifetime of the object.
class StreamToFile {
public:
    StreamToFile(int fd, FILE* stream) : fd_(fd), stream_(stream) {
        char name[] = "/tmp/kodama_stdio_XXXXXX";
        int file = ::mkstemp(name);
        REQUIRE(file >= 0);
        path_ = name;
        std::fflush(stream_);
        saved_ = ::dup(fd_);
        REQUIRE(::dup2(file, fd_) >= 0);
        ::close(file);
    }

    ~StreamToFile() {
        std::fflush(stream_);
        ::dup2(saved_, fd_);
        ::close(saved_);
        ::unlink(path_.c_str());
    }

    std::string contents() const {
        std::fflush(stream_);
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    int fd_;
    FILE* stream_;
    std::string path_;
    int saved_ = -1;
};

struct StdoutToFile : StreamToFile {
    StdoutToFile() : StreamToFile(STDOUT_FILENO, stdout) {}
};

void writeStdout(const char* text) {
    std::fputs(text, stdout);
    std::fflush(stdout);
}

void writeStderr(const char* text) {
    std::fputs(text, stderr);
    std::fflush(stderr);
}

} // namespace

TEST_CASE("Output inside a capture is discarded", "[stdio]") {
    StdoutToFile file;
    writeStdout("before;");
    {
        ScopedStdioCapture capture(true);
        REQUIRE(capture.active());
        writeStdout("hidden;");
    }
    writeStdout("after;");
    REQUIRE(file.contents() == "before;after;");
}

TEST_CASE("A disabled capture passes output through", "[stdio]") {
    StdoutToFile file;
    {
        ScopedStdioCapture capture(false);
        REQUIRE_FALSE(capture.active());
        writeStdout("visible;");
    }
    REQUIRE(file.contents() == "visible;");
}

TEST_CASE("Captures nest", "[stdio]") {
    StdoutToFile file;
    {
        ScopedStdioCapture outer(true);
        {
            ScopedStdioCapture inner(true);
            writeStdout("inner;");
        }
        writeStdout("outer;");
    }
    writeStdout("done;");
    REQUIRE(file.contents() == "done;");
}

TEST_CASE("Both streams are discarded and restored", "[stdio]") {
    StdoutToFile out;
    StreamToFile err(STDERR_FILENO, stderr);
    {
        ScopedStdioCapture capture(true);
        REQUIRE(capture.active());
        writeStdout("out hidden;");
        writeStderr("err hidden;");
    }
    writeStdout("out;");
    writeStderr("err;");
    REQUIRE(out.contents() == "out;");
    REQUIRE(err.contents() == "err;");
}
