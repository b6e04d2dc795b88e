#include <iostream>
#include <string>

#include "alsa_out.hpp"
#include "errors.hpp"
#include "simple_host.hpp"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <plugin.so> [note] [seconds]" << std::endl;
        return 1;
    }

    int note = 60;
    double seconds = 1.0;
    try {
        if (argc >= 3) note = std::stoi(argv[2]);
        if (argc >= 4) seconds = std::stod(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }
    if (note < 0 || note > 127 || seconds < 0.0) {
        std::cerr << "note must be 0-127 and seconds non-negative" << std::endl;
        return 1;
    }

    kdm::HostSettings settings;
    try {
        kdm::SimpleHost host(argv[1], settings);
        std::cout << "Plugin: " << host.plugin().effectName() << " - Outputs: " << host.plugin().numOutputs() << "\n";

        auto sound = host.playNote((uint8_t)note, seconds);

        kdm::AlsaPlayback alsa((int)settings.sampleRate, 2);
        if (!alsa.ready()) return 1;
        long played = alsa.play(sound);
        std::cout << "Played " << played << " of " << sound.numFrames() << " frames\n";
    } catch (const kdm::PluginError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
