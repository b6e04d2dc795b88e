#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "midi.hpp"

using namespace kdm;

namespace {

MidiNoteEvent note(int32_t offset, uint8_t pitch, bool on, float velocity = 1.0f, uint8_t channel = 0) {
    MidiNoteEvent e;
    e.sampleOffset = offset;
    e.channel = channel;
    e.pitch = pitch;
    e.velocity = velocity;
    e.isNoteOn = on;
    return e;
}

} // namespace

TEST_CASE("Note events become VstMidiEvents", "[midi]") {
    VstMidiEvent on = toVstMidiEvent(note(10, 60, true, 1.0f, 3));
    CHECK(on.type == kVstMidiType);
    CHECK(on.byteSize == (int32_t)sizeof(VstMidiEvent));
    CHECK(on.deltaFrames == 10);
    CHECK((uint8_t)on.midiData[0] == 0x93);
    CHECK(on.midiData[1] == 60);
    CHECK(on.midiData[2] == 127);
    CHECK(isNoteOn(on));
    CHECK_FALSE(isNoteOff(on));

    VstMidiEvent off = toVstMidiEvent(note(0, 60, false, 0.0f));
    CHECK((uint8_t)off.midiData[0] == 0x80);
    CHECK(isNoteOff(off));
    CHECK_FALSE(isNoteOn(off));
}

TEST_CASE("Velocity is scaled and clamped", "[midi]") {
    CHECK(toVstMidiEvent(note(0, 64, true, 0.5f)).midiData[2] == 64);
    CHECK(toVstMidiEvent(note(0, 64, true, 2.0f)).midiData[2] == 127);
    CHECK(toVstMidiEvent(note(0, 64, true, -1.0f)).midiData[2] == 0);

    // Note-on with zero velocity is a note-off.
    VstMidiEvent silent = toVstMidiEvent(note(0, 64, true, 0.0f));
    CHECK(isNoteOff(silent));
    CHECK_FALSE(isNoteOn(silent));
}

TEST_CASE("Event lists are ordered by offset", "[midi]") {
    MidiEventList list({note(300, 62, true), note(0, 60, true), note(300, 64, true), note(100, 60, false)});
    REQUIRE(list.size() == 4);
    CHECK(list.at(0).deltaFrames == 0);
    CHECK(list.at(1).deltaFrames == 100);
    CHECK(list.at(2).deltaFrames == 300);
    CHECK(list.at(2).midiData[1] == 62);
    CHECK(list.at(3).midiData[1] == 64);

    VstEvents* events = list.vstEvents();
    REQUIRE(events->numEvents == 4);
    for (int i = 0; i < events->numEvents; ++i) {
        REQUIRE(events->events[i] == reinterpret_cast<const VstEvent*>(&list.at(i)));
        REQUIRE(events->events[i]->type == kVstMidiType);
    }
}

TEST_CASE("Small and empty event lists", "[midi]") {
    MidiEventList list;
    REQUIRE(list.empty());
    REQUIRE(list.vstEvents()->numEvents == 0);

    list.add(note(5, 70, true));
    REQUIRE(list.size() == 1);
    VstEvents* events = list.vstEvents();
    REQUIRE(events->numEvents == 1);
    REQUIRE(reinterpret_cast<VstMidiEvent*>(events->events[0])->midiData[1] == 70);

    list.clear();
    REQUIRE(list.empty());
}
