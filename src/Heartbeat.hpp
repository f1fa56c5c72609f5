#ifndef HEARTBEAT_HPP
#define HEARTBEAT_HPP

#include <iostream>

// Prints a rotating character to the terminal while waiting for sensor events.
class Heartbeat {
public:
    static constexpr char GLYPHS[] = {'-', '\\', '|', '/'};
    static constexpr int GLYPH_COUNT = sizeof(GLYPHS);

    explicit Heartbeat(std::ostream& out = std::cout);

    void print_output();

    // Removes the previous glyph, if one is on screen.
    void erase();

    // The glyph on screen has been overwritten by other output; the next
    // print_output must not emit a backspace.
    void dont_flush();

    void clean_up();

private:
    char next_glyph();

    std::ostream& out;
    int current_glyph;
    bool flush_output;
};

#endif // HEARTBEAT_HPP
