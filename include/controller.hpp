#pragma once

#include <cstdint>

/**
 * Standard joypad - 4021 shift register
 *
 * Button state bit order (bit 0 first out of the register):
 * A, B, Select, Start, Up, Down, Left, Right
 *
 * Writing 1 to $4016 holds the register in parallel-load mode, where every
 * read reports button A. Writing 0 releases it and each read then shifts out
 * the next button. After eight reads the register reports 1.
 */
class Controller {
public:
    enum Button : uint8_t {
        A      = (1 << 0),
        B      = (1 << 1),
        SELECT = (1 << 2),
        START  = (1 << 3),
        UP     = (1 << 4),
        DOWN   = (1 << 5),
        LEFT   = (1 << 6),
        RIGHT  = (1 << 7),
    };

    // Upper bits of a $4016/$4017 read come from the open data bus
    static constexpr uint8_t OPEN_BUS_BITS = 0x40;

    Controller();

    void set_buttons(uint8_t state) { button_state = state; }
    uint8_t get_buttons() const { return button_state; }

    // $4016 write
    void write(uint8_t value);

    // $4016/$4017 read
    uint8_t read();

    bool get_strobe() const { return strobe; }
    uint8_t get_shift_index() const { return shift_index; }

private:
    uint8_t button_state;
    bool strobe;
    uint8_t shift_index;
};
