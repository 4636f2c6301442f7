#include "cartridge.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Cartridge - bank sizes follow the header", "[cartridge]") {
    SECTION("One PRG bank, one CHR bank") {
        Cartridge cart(make_ines(1, 1));
        REQUIRE(cart.prg_rom().size() == 16384);
        REQUIRE(cart.chr().size() == 8192);
        REQUIRE_FALSE(cart.has_chr_ram());
    }

    SECTION("Two PRG banks, two CHR banks") {
        Cartridge cart(make_ines(2, 2));
        REQUIRE(cart.get_prg_banks() == 2);
        REQUIRE(cart.get_chr_banks() == 2);
        REQUIRE(cart.prg_rom().size() == 2 * 16384);
        REQUIRE(cart.chr().size() == 2 * 8192);
    }

    SECTION("No CHR banks gives 8KB of CHR RAM") {
        Cartridge cart(make_ines(1, 0));
        REQUIRE(cart.has_chr_ram());
        REQUIRE(cart.chr().size() == 8192);
        REQUIRE(cart.chr()[0] == 0x00);
    }

    SECTION("Cartridge RAM is 8KB") {
        Cartridge cart(make_ines(1, 1));
        REQUIRE(cart.prg_ram().size() == 8192);
    }
}

TEST_CASE("Cartridge - header flags", "[cartridge]") {
    SECTION("Mapper number combines both nibbles") {
        Cartridge cart(make_ines(1, 1, 0x40, 0x10));
        REQUIRE(cart.get_mapper_id() == 0x14);
    }

    SECTION("Bit 0 clear selects vertical mirroring") {
        Cartridge cart(make_ines(1, 1, 0x00));
        REQUIRE(cart.get_mirroring() == Mirroring::Vertical);
    }

    SECTION("Bit 0 set selects horizontal mirroring") {
        Cartridge cart(make_ines(1, 1, 0x01));
        REQUIRE(cart.get_mirroring() == Mirroring::Horizontal);
    }

    SECTION("Four-screen overrides bit 0") {
        Cartridge cart(make_ines(1, 1, 0x09));
        REQUIRE(cart.get_mirroring() == Mirroring::FourScreen);
    }

    SECTION("Battery flag") {
        REQUIRE(Cartridge(make_ines(1, 1, 0x02)).has_battery());
        REQUIRE_FALSE(Cartridge(make_ines(1, 1, 0x00)).has_battery());
    }

    SECTION("Trainer is skipped") {
        Cartridge cart(make_ines(1, 1, 0x04, 0x00, 0x11, 0x22));
        REQUIRE(cart.has_trainer());
        REQUIRE(cart.prg_rom()[0] == 0x11);
        REQUIRE(cart.chr()[0] == 0x22);
    }
}

TEST_CASE("Cartridge - malformed images", "[cartridge][errors]") {
    SECTION("Bad magic") {
        auto rom = make_ines(1, 1);
        rom[3] = 0x00;
        try {
            Cartridge cart(rom);
            FAIL("expected RomError");
        } catch (const RomError& e) {
            REQUIRE(e.kind() == RomError::Kind::BadMagic);
        }
    }

    SECTION("Shorter than the header") {
        std::vector<uint8_t> rom = {'N', 'E', 'S', 0x1A, 0x01};
        try {
            Cartridge cart(rom);
            FAIL("expected RomError");
        } catch (const RomError& e) {
            REQUIRE(e.kind() == RomError::Kind::TruncatedData);
        }
    }

    SECTION("PRG shorter than declared") {
        auto rom = make_ines(2, 0);
        rom.resize(16 + 16384);
        try {
            Cartridge cart(rom);
            FAIL("expected RomError");
        } catch (const RomError& e) {
            REQUIRE(e.kind() == RomError::Kind::TruncatedData);
        }
    }

    SECTION("CHR shorter than declared") {
        auto rom = make_ines(1, 1);
        rom.pop_back();
        REQUIRE_THROWS_AS(Cartridge(rom), RomError);
    }
}

TEST_CASE("Cartridge - CHR writes", "[cartridge]") {
    SECTION("CHR RAM accepts writes") {
        Cartridge cart(make_ines(1, 0));
        cart.write_chr(0x0123, 0x5A);
        REQUIRE(cart.chr()[0x0123] == 0x5A);
    }

    SECTION("CHR ROM ignores writes") {
        Cartridge cart(make_ines(1, 1));
        uint8_t before = cart.chr()[0x0123];
        cart.write_chr(0x0123, static_cast<uint8_t>(before + 1));
        REQUIRE(cart.chr()[0x0123] == before);
    }
}
