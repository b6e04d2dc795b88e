#include <algorithm>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "simple_host.hpp"

namespace {

void printParams(kdm::Vst2Plugin& vst, int max_params = 10) {
    for (int i = 0; i < std::min(vst.numParams(), max_params); ++i) {
        std::cout << vst.getParamName(i) << ": " << vst.getParamValue(i) << "\n";
    }
}

void printSound(const kdm::AudioBuffer& sound) {
    std::cout << "[";
    for (int ch = 0; ch < sound.numChannels(); ++ch) {
        std::cout << (ch ? ",\n [" : "[");
        int n = sound.numFrames();
        for (int i = 0; i < n; ++i) {
            if (n > 6 && i == 3) {
                std::cout << " ...";
                i = n - 3;
            }
            std::cout << (i ? " " : "") << sound.sampleAt(ch, i);
        }
        std::cout << "]";
    }
    std::cout << "]\n";
    std::cout << "shape: (" << sound.numChannels() << ", " << sound.numFrames() << ") "
              << kdm::toString(sound.type()) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <plugin.so>" << std::endl;
        return 1;
    }

    kdm::HostSettings settings;
    settings.sampleRate = 48000.0;

    try {
        kdm::SimpleHost host(argv[1], settings);
        printParams(host.plugin());

        auto sound = host.playNote(64, 1.0);
        printSound(sound);

        if (host.plugin().numParams() > 0) host.plugin().setParamValue(0, 1.0f);
        if (host.plugin().numParams() > 1) host.plugin().setParamValue(1, 0.5f);

        printParams(host.plugin());

        sound = host.playNote(64, 1.0);
        printSound(sound);
    } catch (const kdm::PluginError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
