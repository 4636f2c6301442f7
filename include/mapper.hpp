#pragma once

#include "cartridge.hpp"
#include <cstdint>
#include <memory>

/**
 * Mapper Base Class
 *
 * Translates CPU addresses ($8000-$FFFF) and PPU addresses ($0000-$1FFF)
 * onto the cartridge's PRG and CHR storage. Bank-switching boards add
 * registers written through the CPU ROM range; nothing in the CPU or PPU
 * changes when a new board is added.
 */
class Mapper {
public:
    explicit Mapper(std::shared_ptr<Cartridge> cart);
    virtual ~Mapper() = default;

    // CPU memory access ($8000-$FFFF)
    virtual uint8_t cpu_read(uint16_t addr) = 0;
    virtual void cpu_write(uint16_t addr, uint8_t data) = 0;

    // PPU memory access ($0000-$1FFF)
    virtual uint8_t ppu_read(uint16_t addr) = 0;
    virtual void ppu_write(uint16_t addr, uint8_t data) = 0;

    // Reset bank registers (soft reset)
    virtual void reset() {}

    // IRQ line for boards with counters
    virtual bool irq_pending() const { return false; }
    virtual void irq_clear() {}

    // Boards with mirroring control override this
    virtual Mirroring get_mirroring() const { return cartridge->get_mirroring(); }

    Cartridge& get_cartridge() { return *cartridge; }
    const Cartridge& get_cartridge() const { return *cartridge; }

    // Build the board named by the cartridge header; throws RomError::UnsupportedMapper
    static std::unique_ptr<Mapper> create(std::shared_ptr<Cartridge> cart);

protected:
    std::shared_ptr<Cartridge> cartridge;
};
