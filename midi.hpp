#pragma once

#include <vector>
#include <cstdint>

#include "audio_types.hpp"
#include "vst2_abi.hpp"

namespace kdm {

VstMidiEvent toVstMidiEvent(const MidiNoteEvent& ev);

bool isNoteOn(const VstMidiEvent& ev);

bool isNoteOff(const VstMidiEvent& ev);

// Owns the events and the variable-length VstEvents header that points at
// them, in the form effProcessEvents expects.
class MidiEventList {
public:
    MidiEventList() = default;
    explicit MidiEventList(const std::vector<MidiNoteEvent>& events);

    MidiEventList(const MidiEventList&) = delete;
    MidiEventList& operator=(const MidiEventList&) = delete;
    MidiEventList(MidiEventList&&) = default;
    MidiEventList& operator=(MidiEventList&&) = default;

    void add(const MidiNoteEvent& ev);
    void clear();
    int size() const { return (int)events_.size(); }
    bool empty() const { return events_.empty(); }
    const VstMidiEvent& at(int index) const { return events_[index]; }

    // Valid until the list is modified or destroyed.
    VstEvents* vstEvents();

private:
    std::vector<VstMidiEvent> events_;
    std::vector<uint8_t> header_;
};

} // namespace kdm
