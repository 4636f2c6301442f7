#include "system.hpp"
#include "cartridge.hpp"

std::unique_ptr<System> System::load(const std::vector<uint8_t>& rom) {
    // Both steps throw before anything is built
    auto cart = std::make_shared<Cartridge>(rom);
    return std::make_unique<System>(std::move(cart));
}

System::System(std::shared_ptr<Cartridge> cart)
    : cartridge(std::move(cart)), cpu_cycles(0), frame_number(0), last_frame_cycles(0), dma_stall(0) {
    mapper = Mapper::create(cartridge);
    ram.fill(0x00);

    ppu.connect_mapper(mapper.get());

    // Power-on
    run_reset_sequence();
}

void System::reset() {
    mapper->reset();
    ppu.reset();
    controllers[0].write(0x00);
    controllers[1].write(0x00);
    dma_stall = 0;
    run_reset_sequence();
}

// The PPU keeps running through the CPU's reset cycles
void System::run_reset_sequence() {
    int cycles = cpu.reset(*this);
    cpu_cycles += cycles;
    clock_ppu(cycles);
}

// ============================================================================
// CPU MEMORY MAP
// ============================================================================

uint8_t System::cpu_read(uint16_t addr) {
    if (addr <= 0x1FFF) {
        // 2KB internal RAM, mirrored 4 times
        return ram[addr & 0x07FF];
    } else if (addr <= 0x3FFF) {
        // PPU registers, mirrored every 8 bytes
        return ppu.cpu_read(addr & 0x0007);
    } else if (addr == 0x4016) {
        return controllers[0].read();
    } else if (addr == 0x4017) {
        return controllers[1].read();
    } else if (addr >= 0x6000 && addr <= 0x7FFF) {
        return cartridge->prg_ram()[addr & 0x1FFF];
    } else if (addr >= 0x8000) {
        return mapper->cpu_read(addr);
    }

    // Open bus
    return 0x00;
}

void System::cpu_write(uint16_t addr, uint8_t data) {
    if (addr <= 0x1FFF) {
        ram[addr & 0x07FF] = data;
    } else if (addr <= 0x3FFF) {
        ppu.cpu_write(addr & 0x0007, data);
    } else if (addr == 0x4014) {
        oam_dma(data);
    } else if (addr == 0x4016) {
        // One strobe line feeds both ports
        controllers[0].write(data);
        controllers[1].write(data);
    } else if (addr >= 0x6000 && addr <= 0x7FFF) {
        cartridge->prg_ram()[addr & 0x1FFF] = data;
    } else if (addr >= 0x8000) {
        mapper->cpu_write(addr, data);
    }
    // Everything else (APU registers included) is dropped
}

// ===== OAM DMA =====
// Copies $XX00-$XXFF into OAM through $2004. The CPU is halted for 513
// cycles, plus one alignment cycle when the transfer starts on an odd cycle.
void System::oam_dma(uint8_t page) {
    uint16_t base = (uint16_t)page << 8;
    for (uint16_t i = 0; i < 256; i++) {
        ppu.cpu_write(0x0004, cpu_read(base | i));
    }
    dma_stall += OAM_DMA_CYCLES + ((cpu_cycles & 0x01) ? 1 : 0);
}

void System::clock_ppu(int cpu_cycles_elapsed) {
    for (int dot = 0; dot < cpu_cycles_elapsed * 3; dot++) {
        ppu.step();
    }
}

int System::step_instruction() {
    int cycles = 0;
    dma_stall = 0;

    if (ppu.nmi) {
        ppu.nmi = false;
        cycles = cpu.nmi(*this);
    } else if (mapper->irq_pending() && !cpu.get_interrupt_disable()) {
        mapper->irq_clear();
        cycles = cpu.irq(*this);
    } else {
        cycles = cpu.step(*this);
    }

    cycles += dma_stall;
    dma_stall = 0;

    cpu_cycles += cycles;
    clock_ppu(cycles);
    return cycles;
}

void System::step_frame() {
    // Odd frames take the extra half cycle
    int target = CPU_CYCLES_PER_FRAME + (int)(frame_number & 0x01);
    int elapsed = 0;

    while (elapsed < target) {
        elapsed += step_instruction();
    }

    last_frame_cycles = elapsed;
    frame_number++;
}

void System::set_controller_input(uint8_t port, uint8_t buttons) {
    if (port < 2) {
        controllers[port].set_buttons(buttons);
    }
}

void System::frame_rgb(RgbFrame& out) const {
    const PPU::FrameBuffer& indices = ppu.get_frame();
    for (size_t i = 0; i < indices.size(); i++) {
        const uint8_t* color = PPU::palette_colors[indices[i] & 0x3F];
        out[i * 3 + 0] = color[0];
        out[i * 3 + 1] = color[1];
        out[i * 3 + 2] = color[2];
    }
}

std::vector<uint8_t>& System::cartridge_ram() {
    return cartridge->prg_ram();
}
