#pragma once

#include "../mapper.hpp"

/**
 * Mapper 000 - NROM
 *
 * No bank switching
 * PRG ROM: 16KB (mirrored) or 32KB
 * CHR: 8KB ROM, or 8KB RAM when the image has none
 */
class Mapper000 : public Mapper {
public:
    explicit Mapper000(std::shared_ptr<Cartridge> cart);

    uint8_t cpu_read(uint16_t addr) override;
    void cpu_write(uint16_t addr, uint8_t data) override;
    uint8_t ppu_read(uint16_t addr) override;
    void ppu_write(uint16_t addr, uint8_t data) override;
};
