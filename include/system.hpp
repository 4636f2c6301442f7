#pragma once

#include "bus.hpp"
#include "cpu.hpp"
#include "ppu.hpp"
#include "controller.hpp"
#include "mapper.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <vector>

class Cartridge;

/**
 * NES System - owns every component and routes the CPU bus
 *
 * A System exists for exactly one loaded ROM. Loading another ROM or a
 * power cycle builds a new System; reset() is the console's reset button.
 *
 * TIMING:
 * - CPU: 1.789773 MHz, PPU: 3 dots per CPU cycle
 * - One frame: 29780.5 CPU cycles on average, so the per-frame target
 *   alternates between 29780 and 29781
 * - NMI and mapper IRQs are delivered before the next instruction fetch
 */
class System : public Bus {
public:
    static constexpr int CPU_CYCLES_PER_FRAME = 29780;
    static constexpr int OAM_DMA_CYCLES = 513;

    using RgbFrame = std::array<uint8_t, PPU::SCREEN_WIDTH * PPU::SCREEN_HEIGHT * 3>;

    // Parse an iNES image and build a powered-on System. Throws RomError.
    static std::unique_ptr<System> load(const std::vector<uint8_t>& rom);

    explicit System(std::shared_ptr<Cartridge> cart);
    ~System() override = default;

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    // Soft reset: CPU registers and PPU latches. RAM, VRAM and OAM survive.
    void reset();

    // Run one frame worth of CPU cycles. Throws CpuFault.
    void step_frame();

    // Deliver a pending interrupt or execute one instruction, then catch the
    // PPU up. Returns the CPU cycles consumed, DMA stalls included.
    int step_instruction();

    // Host input: 8-bit button mask for port 0 or 1
    void set_controller_input(uint8_t port, uint8_t buttons);

    // Bus interface
    uint8_t cpu_read(uint16_t addr) override;
    void cpu_write(uint16_t addr, uint8_t data) override;

    // ===== HOST OUTPUT =====
    const PPU::FrameBuffer& frame() const { return ppu.get_frame(); }
    void frame_rgb(RgbFrame& out) const;

    // Sound is not synthesised; hosts receive an empty buffer every frame
    const std::vector<float>& audio_samples() const { return audio; }

    // $6000-$7FFF RAM, for battery saves
    std::vector<uint8_t>& cartridge_ram();

    // ===== COMPONENT ACCESS (debugging and tests) =====
    CPU& get_cpu() { return cpu; }
    PPU& get_ppu() { return ppu; }
    Mapper& get_mapper() { return *mapper; }
    Controller& get_controller(uint8_t port) { return controllers[port & 0x01]; }
    const Cartridge& get_cartridge() const { return *cartridge; }

    uint64_t get_cycles() const { return cpu_cycles; }
    uint64_t get_frame_number() const { return frame_number; }
    int get_last_frame_cycles() const { return last_frame_cycles; }

private:
    std::shared_ptr<Cartridge> cartridge;
    std::unique_ptr<Mapper> mapper;
    CPU cpu;
    PPU ppu;
    std::array<Controller, 2> controllers;
    std::array<uint8_t, 2048> ram;
    std::vector<float> audio;

    uint64_t cpu_cycles;        // CPU cycles since power-on, stalls included
    uint64_t frame_number;      // Frames run through step_frame()
    int last_frame_cycles;
    int dma_stall;              // Cycles owed by an OAM DMA in this step

    void oam_dma(uint8_t page);
    void clock_ppu(int cpu_cycles_elapsed);
    void run_reset_sequence();
};
