#include "mappers/mapper000.hpp"

// ===== MAPPER 000 - NROM =====
// Used by: Super Mario Bros, Donkey Kong, Ice Climber, Balloon Fight, etc.
//
// MEMORY MAP:
// CPU $8000-$BFFF: First 16KB of PRG ROM
// CPU $C000-$FFFF: Last 16KB of PRG ROM (or mirror of $8000-$BFFF if only 16KB)
// PPU $0000-$1FFF: 8KB CHR ROM/RAM
//
// VARIANTS:
// NROM-128: 16KB PRG ROM, mirrored at $C000-$FFFF
// NROM-256: 32KB PRG ROM, no mirroring

Mapper000::Mapper000(std::shared_ptr<Cartridge> cart)
    : Mapper(std::move(cart)) {
}

uint8_t Mapper000::cpu_read(uint16_t addr) {
    const std::vector<uint8_t>& prg = cartridge->prg_rom();
    if (addr < 0x8000 || prg.empty()) {
        return 0x00;
    }

    // NROM-128 masks to 16KB so both halves see the same bank
    uint32_t mapped_addr = (cartridge->get_prg_banks() == 1) ? (addr & 0x3FFF) : (addr & 0x7FFF);
    return prg[mapped_addr % prg.size()];
}

void Mapper000::cpu_write(uint16_t addr, uint8_t data) {
    // ROM - no registers on this board
    (void)addr;
    (void)data;
}

uint8_t Mapper000::ppu_read(uint16_t addr) {
    return cartridge->chr()[addr & 0x1FFF];
}

void Mapper000::ppu_write(uint16_t addr, uint8_t data) {
    // Cartridge drops the write unless CHR is RAM
    cartridge->write_chr(addr & 0x1FFF, data);
}
