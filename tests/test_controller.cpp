#include "controller.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Controller - serial read order", "[controller]") {
    Controller pad;
    pad.set_buttons(Controller::A | Controller::START | Controller::RIGHT);
    REQUIRE(pad.get_buttons() == 0x89);
    pad.write(1);
    pad.write(0);

    const uint8_t expected[8] = {1, 0, 0, 1, 0, 0, 0, 1};
    for (int i = 0; i < 8; i++) {
        uint8_t value = pad.read();
        REQUIRE((value & 0x01) == expected[i]);
        REQUIRE((value & 0xFE) == Controller::OPEN_BUS_BITS);
    }
    REQUIRE(pad.get_shift_index() == 8);
}

TEST_CASE("Controller - strobe behavior", "[controller]") {
    Controller pad;

    SECTION("Strobe high keeps reporting A") {
        pad.set_buttons(Controller::A);
        pad.write(1);
        for (int i = 0; i < 5; i++) {
            REQUIRE((pad.read() & 0x01) == 1);
        }
        REQUIRE(pad.get_shift_index() == 0);
        REQUIRE(pad.get_strobe());
    }

    SECTION("Reads past eight return 1") {
        pad.set_buttons(0x00);
        pad.write(1);
        pad.write(0);
        for (int i = 0; i < 8; i++) {
            REQUIRE((pad.read() & 0x01) == 0);
        }
        REQUIRE((pad.read() & 0x01) == 1);
        REQUIRE((pad.read() & 0x01) == 1);
        REQUIRE(pad.get_shift_index() == 8);
    }

    SECTION("Strobe restarts the sequence") {
        pad.set_buttons(Controller::B);
        pad.write(1);
        pad.write(0);
        REQUIRE((pad.read() & 0x01) == 0);
        REQUIRE((pad.read() & 0x01) == 1);
        pad.write(1);
        pad.write(0);
        REQUIRE(pad.get_shift_index() == 0);
        REQUIRE((pad.read() & 0x01) == 0);
    }

    SECTION("Bit 0 of the write selects strobe") {
        pad.write(0xFE);
        REQUIRE_FALSE(pad.get_strobe());
    }
}
