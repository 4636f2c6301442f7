#include "system.hpp"
#include "cartridge.hpp"
#include "demo_rom.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

TEST_CASE("System - load", "[system]") {
    SECTION("Valid image powers on at the reset vector") {
        auto system = System::load(make_program_rom({0xEA}));
        REQUIRE(system != nullptr);
        REQUIRE(system->get_cpu().PC == 0xC000);
        REQUIRE(system->get_cpu().PC == system->read_word(0xFFFC));
        REQUIRE(system->get_cpu().SP == 0xFD);
        REQUIRE(system->get_mapper().get_mirroring() == Mirroring::Vertical);
        REQUIRE_FALSE(system->get_mapper().irq_pending());
    }

    SECTION("Bad magic is rejected") {
        auto rom = make_program_rom({0xEA});
        rom[0] = 'X';
        REQUIRE_THROWS_AS(System::load(rom), RomError);
    }

    SECTION("Unsupported mapper is rejected") {
        auto rom = make_ines(1, 1, 0x20, 0x00);
        try {
            System::load(rom);
            FAIL("expected RomError");
        } catch (const RomError& e) {
            REQUIRE(e.kind() == RomError::Kind::UnsupportedMapper);
            REQUIRE(e.mapper_id() == 2);
        }
    }
}

TEST_CASE("System - CPU memory map", "[system][bus]") {
    auto system = System::load(make_program_rom({0xEA}));

    SECTION("Internal RAM mirrors every 2KB") {
        system->cpu_write(0x0001, 0x5A);
        REQUIRE(system->cpu_read(0x0801) == 0x5A);
        REQUIRE(system->cpu_read(0x1801) == 0x5A);
        system->cpu_write(0x1FFF, 0x33);
        REQUIRE(system->cpu_read(0x07FF) == 0x33);
    }

    SECTION("PPU registers mirror every 8 bytes") {
        system->cpu_write(0x2008, 0x04);
        REQUIRE(system->get_ppu().get_control() == 0x04);
        system->cpu_write(0x3FF9, 0x18);
        REQUIRE(system->get_ppu().get_mask() == 0x18);
    }

    SECTION("Unmapped addresses read 0 and drop writes") {
        system->cpu_write(0x5000, 0xFF);
        REQUIRE(system->cpu_read(0x5000) == 0x00);
        REQUIRE(system->cpu_read(0x4000) == 0x00);
        REQUIRE(system->cpu_read(0x4015) == 0x00);
    }

    SECTION("Cartridge RAM at $6000-$7FFF") {
        system->cpu_write(0x6000, 0x12);
        system->cpu_write(0x7FFF, 0x34);
        REQUIRE(system->cpu_read(0x6000) == 0x12);
        REQUIRE(system->cartridge_ram()[0x0000] == 0x12);
        REQUIRE(system->cartridge_ram()[0x1FFF] == 0x34);
    }

    SECTION("ROM space goes through the mapper") {
        REQUIRE(system->cpu_read(0xC000) == 0xEA);
        REQUIRE(system->cpu_read(0x8000) == 0xEA);
        system->cpu_write(0xC000, 0x00);
        REQUIRE(system->cpu_read(0xC000) == 0xEA);
    }

    SECTION("Controller ports") {
        system->set_controller_input(0, Controller::A);
        system->set_controller_input(1, Controller::B);
        system->cpu_write(0x4016, 0x01);
        system->cpu_write(0x4016, 0x00);
        REQUIRE(system->cpu_read(0x4016) == (Controller::OPEN_BUS_BITS | 0x01));
        REQUIRE(system->cpu_read(0x4016) == Controller::OPEN_BUS_BITS);
        REQUIRE(system->cpu_read(0x4017) == Controller::OPEN_BUS_BITS);
        REQUIRE(system->cpu_read(0x4017) == (Controller::OPEN_BUS_BITS | 0x01));
    }
}

TEST_CASE("System - LDA then STA reaches PPUCTRL", "[system]") {
    auto system = System::load(make_program_rom({0xA9, 0x42, 0x8D, 0x00, 0x20}));

    REQUIRE(system->step_instruction() == 2);
    REQUIRE(system->step_instruction() == 4);
    REQUIRE(system->get_cpu().A == 0x42);
    REQUIRE_FALSE(system->get_cpu().get_zero());
    REQUIRE_FALSE(system->get_cpu().get_negative());
    REQUIRE(system->get_ppu().get_control() == 0x42);
}

TEST_CASE("System - PPU runs three dots per CPU cycle", "[system][timing]") {
    auto system = System::load(make_program_rom({0x4C, 0x00, 0xC0}));

    SECTION("Single instruction") {
        uint64_t dots = system->get_ppu().get_total_dots();
        int cycles = system->step_instruction();
        REQUIRE(cycles == 3);
        REQUIRE(system->get_ppu().get_total_dots() - dots == 9);
    }

    SECTION("Whole frames") {
        for (int frame = 0; frame < 3; frame++) {
            uint64_t dots = system->get_ppu().get_total_dots();
            uint64_t cycles = system->get_cycles();
            system->step_frame();

            uint64_t frame_cycles = system->get_cycles() - cycles;
            REQUIRE(frame_cycles == (uint64_t)system->get_last_frame_cycles());
            REQUIRE(frame_cycles >= (uint64_t)(System::CPU_CYCLES_PER_FRAME + (frame & 1)));
            REQUIRE(system->get_ppu().get_total_dots() - dots == 3 * frame_cycles);
        }
        REQUIRE(system->get_frame_number() == 3);
        REQUIRE(system->frame().size() == 61440);
    }

    SECTION("Reset cycles are counted on both sides") {
        REQUIRE(system->get_cycles() == 8);
        REQUIRE(system->get_ppu().get_total_dots() == 24);

        system->step_frame();
        system->step_frame();
        REQUIRE(system->get_cycles() * 3 == system->get_ppu().get_total_dots());

        system->reset();
        REQUIRE(system->get_cycles() * 3 == system->get_ppu().get_total_dots());
        REQUIRE(system->get_ppu().get_dot() == 24);

        system->step_frame();
        REQUIRE(system->get_cycles() * 3 == system->get_ppu().get_total_dots());
    }
}

TEST_CASE("System - OAM DMA", "[system][dma]") {
    SECTION("Even start cycle costs 513") {
        // LDA #$02; STA $4014
        auto system = System::load(make_program_rom({0xA9, 0x02, 0x8D, 0x14, 0x40}));
        for (int i = 0; i < 256; i++) {
            system->cpu_write(static_cast<uint16_t>(0x0200 + i), static_cast<uint8_t>(i ^ 0x5A));
        }

        system->step_instruction();
        REQUIRE((system->get_cycles() & 1) == 0);
        REQUIRE(system->step_instruction() == 4 + 513);

        for (int i = 0; i < 256; i++) {
            REQUIRE(system->get_ppu().get_oam_byte(static_cast<uint8_t>(i)) == (i ^ 0x5A));
        }
    }

    SECTION("Odd start cycle costs 514") {
        // LDA $00; LDA #$02; STA $4014
        auto system = System::load(make_program_rom({0xA5, 0x00, 0xA9, 0x02, 0x8D, 0x14, 0x40}));
        system->step_instruction();
        system->step_instruction();
        REQUIRE((system->get_cycles() & 1) == 1);
        REQUIRE(system->step_instruction() == 4 + 514);
    }

    SECTION("PPU is caught up across the stall") {
        auto system = System::load(make_program_rom({0xA9, 0x02, 0x8D, 0x14, 0x40}));
        system->step_instruction();
        uint64_t dots = system->get_ppu().get_total_dots();
        int cycles = system->step_instruction();
        REQUIRE(system->get_ppu().get_total_dots() - dots == (uint64_t)cycles * 3);
    }
}

TEST_CASE("System - interrupts", "[system]") {
    SECTION("NMI is delivered before the next instruction") {
        // LDA #$80; STA $2000; JMP $C005
        auto system = System::load(make_program_rom({0xA9, 0x80, 0x8D, 0x00, 0x20, 0x4C, 0x05, 0xC0}));
        system->step_instruction();
        system->step_instruction();

        bool entered_handler = false;
        for (int i = 0; i < 20000 && !entered_handler; i++) {
            system->step_instruction();
            entered_handler = system->get_cpu().PC == 0xC100;
        }
        REQUIRE(entered_handler);
        REQUIRE(system->get_cpu().get_interrupt_disable());
        REQUIRE_FALSE(system->get_ppu().nmi);
    }

    SECTION("Illegal opcode surfaces through step_frame") {
        auto system = System::load(make_program_rom({0xEA, 0x02}));
        try {
            system->step_frame();
            FAIL("expected CpuFault");
        } catch (const CpuFault& e) {
            REQUIRE(e.opcode() == 0x02);
            REQUIRE(e.pc() == 0xC001);
        }
    }
}

TEST_CASE("System - demo ROM", "[system][demo]") {
    auto system = System::load(make_demo_rom());
    for (int i = 0; i < 10; i++) {
        system->step_frame();
    }

    SECTION("NMI handler counts frames") {
        uint8_t count = system->cpu_read(DEMO_FRAME_COUNTER_ADDR);
        REQUIRE(count >= 5);
        REQUIRE(count <= 10);
    }

    SECTION("Checkerboard background") {
        const auto& frame = system->frame();
        REQUIRE(frame[0] == 0x30);
        REQUIRE(frame[1] == 0x16);
        REQUIRE(frame[256] == 0x16);
        REQUIRE(frame[257] == 0x30);
        REQUIRE(frame[200 * 256 + 100] == frame[0]);
    }

    SECTION("Sprite 0 drawn from OAM DMA") {
        REQUIRE(system->get_ppu().get_oam_byte(0) == 0x70);
        REQUIRE(system->get_ppu().get_oam_byte(3) == 0x80);
        REQUIRE(system->frame()[112 * 256 + 128] == 0x18);
        REQUIRE(system->frame()[119 * 256 + 128] == 0x18);
        REQUIRE(system->frame()[111 * 256 + 128] != 0x18);
        REQUIRE(system->frame()[120 * 256 + 128] != 0x18);
        REQUIRE(system->frame()[112 * 256 + 136] != 0x18);
    }

    SECTION("RGB output resolves the master palette") {
        System::RgbFrame rgb;
        system->frame_rgb(rgb);
        REQUIRE(rgb[0] == PPU::palette_colors[0x30][0]);
        REQUIRE(rgb[1] == PPU::palette_colors[0x30][1]);
        REQUIRE(rgb[2] == PPU::palette_colors[0x30][2]);
    }

    SECTION("Holding Right moves the sprite") {
        system->set_controller_input(0, Controller::RIGHT);
        for (int i = 0; i < 5; i++) {
            system->step_frame();
        }
        REQUIRE(system->cpu_read(DEMO_OAM_SHADOW_ADDR + 3) > 0x80);
    }

    SECTION("Soft reset keeps RAM and restarts the program") {
        uint8_t count = system->cpu_read(DEMO_FRAME_COUNTER_ADDR);
        system->reset();
        REQUIRE(system->get_cpu().PC == 0xC000);
        REQUIRE(system->get_ppu().get_control() == 0x00);
        REQUIRE(system->cpu_read(DEMO_FRAME_COUNTER_ADDR) == count);
        REQUIRE(system->get_ppu().get_oam_byte(0) == 0x70);
    }

    SECTION("No audio is produced") {
        REQUIRE(system->audio_samples().empty());
    }
}
