#pragma once

#include <cstdint>

/**
 * CPU-side bus - everything the CPU can address
 *
 * CPU Memory Map (as routed by System):
 * $0000-$07FF: 2KB internal RAM
 * $0800-$1FFF: Mirrors of $0000-$07FF
 * $2000-$2007: PPU registers
 * $2008-$3FFF: Mirrors of $2000-$2007
 * $4014:       OAM DMA
 * $4016-$4017: Controller strobe / serial reads
 * $6000-$7FFF: Cartridge RAM
 * $8000-$FFFF: Cartridge ROM through the mapper
 *
 * Unmapped reads return 0 (open bus), unmapped writes are dropped.
 */
class Bus {
public:
    virtual ~Bus() = default;

    virtual uint8_t cpu_read(uint16_t addr) = 0;
    virtual void cpu_write(uint16_t addr, uint8_t data) = 0;

    // Little-endian 16-bit read, e.g. interrupt vectors
    uint16_t read_word(uint16_t addr) {
        uint16_t lo = cpu_read(addr);
        uint16_t hi = cpu_read(static_cast<uint16_t>(addr + 1));
        return (hi << 8) | lo;
    }
};
