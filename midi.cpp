#include "midi.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstring>

namespace kdm {

VstMidiEvent toVstMidiEvent(const MidiNoteEvent& ev) {
    VstMidiEvent out;
    std::memset(&out, 0, sizeof(out));
    out.type = kVstMidiType;
    out.byteSize = sizeof(VstMidiEvent);
    out.deltaFrames = ev.sampleOffset;
    out.flags = kVstMidiEventIsRealtime;

    const uint8_t status = (ev.isNoteOn ? 0x90 : 0x80) | (ev.channel & 0x0F);
    const float velocity = std::clamp(ev.velocity, 0.0f, 1.0f);
    out.midiData[0] = (char)status;
    out.midiData[1] = (char)(ev.pitch & 0x7F);
    out.midiData[2] = (char)std::lround(velocity * 127.0f);
    return out;
}

bool isNoteOn(const VstMidiEvent& ev) {
    const uint8_t type = (uint8_t)ev.midiData[0];
    return (type >= 0x90 && type <= 0x9F) && ev.midiData[2] > 0;
}

bool isNoteOff(const VstMidiEvent& ev) {
    const uint8_t type = (uint8_t)ev.midiData[0];
    return (type >= 0x80 && type <= 0x8F) || ((type >= 0x90 && type <= 0x9F) && ev.midiData[2] == 0);
}

MidiEventList::MidiEventList(const std::vector<MidiNoteEvent>& events) {
    events_.reserve(events.size());
    for (const auto& ev : events) {
        events_.push_back(toVstMidiEvent(ev));
    }
    // Hosts deliver events in block order.
    std::stable_sort(events_.begin(), events_.end(), [](const VstMidiEvent& a, const VstMidiEvent& b) {
        return a.deltaFrames < b.deltaFrames;
    });
}

void MidiEventList::add(const MidiNoteEvent& ev) {
    events_.push_back(toVstMidiEvent(ev));
}

void MidiEventList::clear() {
    events_.clear();
    header_.clear();
}

VstEvents* MidiEventList::vstEvents() {
    // VstEvents declares room for two pointers; larger lists extend past it.
    const size_t slots = std::max<size_t>(events_.size(), 2);
    const size_t bytes = offsetof(VstEvents, events) + slots * sizeof(VstEvent*);
    header_.assign(bytes, 0);

    auto* list = reinterpret_cast<VstEvents*>(header_.data());
    list->numEvents = (int32_t)events_.size();
    list->reserved = 0;
    for (size_t i = 0; i < events_.size(); ++i) {
        list->events[i] = reinterpret_cast<VstEvent*>(&events_[i]);
    }
    return list;
}

} // namespace kdm
