#include "Heartbeat.hpp"

Heartbeat::Heartbeat(std::ostream& output)
    : out(output), current_glyph(0), flush_output(false) {
}

void Heartbeat::print_output() {
    erase();
    out << next_glyph();
    out.flush();
}

void Heartbeat::erase() {
    if (flush_output) {
        out << '\b';
    } else {
        flush_output = true;
    }
}

void Heartbeat::dont_flush() {
    flush_output = false;
}

void Heartbeat::clean_up() {
    for (int i = 0; i < 3; i++) {
        out << '\b';
    }
    out.flush();
    flush_output = false;
}

char Heartbeat::next_glyph() {
    char glyph = GLYPHS[current_glyph];
    current_glyph = (current_glyph + 1) % GLYPH_COUNT;
    return glyph;
}
