#pragma once

#include <cstdint>
#include <vector>

/**
 * Built-in iNES image (mapper 0, 16KB PRG, 8KB CHR)
 *
 * Waits two VBlanks, uploads a palette and a checkerboard nametable,
 * parks sprite 0 at (128, 112) and enables NMI plus rendering. The NMI
 * handler counts frames in $00, moves sprite 0 with Left/Right on pad 1
 * and refreshes OAM from $0200 through $4014.
 */

// Zero-page frame counter incremented by the NMI handler
constexpr uint16_t DEMO_FRAME_COUNTER_ADDR = 0x0000;

// OAM shadow page copied by DMA
constexpr uint16_t DEMO_OAM_SHADOW_ADDR = 0x0200;

std::vector<uint8_t> make_demo_rom();
