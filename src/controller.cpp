#include "controller.hpp"

Controller::Controller() : button_state(0x00), strobe(false), shift_index(0) {
}

void Controller::write(uint8_t value) {
    strobe = (value & 0x01) != 0;
    if (strobe) {
        shift_index = 0;
    }
}

uint8_t Controller::read() {
    if (shift_index >= 8) {
        return OPEN_BUS_BITS | 0x01;
    }

    uint8_t data = OPEN_BUS_BITS | ((button_state >> shift_index) & 0x01);

    // While strobe is high the register keeps reloading, so A is reported again
    if (!strobe) {
        shift_index++;
    }
    return data;
}
