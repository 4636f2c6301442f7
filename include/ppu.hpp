#pragma once

#include "cartridge.hpp"
#include <cstdint>
#include <array>

class Mapper;

/**
 * 2C02 picture unit, advanced one dot per step() at three dots per CPU cycle.
 *
 * Every frame is 262 scanlines of 341 dots:
 *   -1       pre-render; status flags cleared at dot 1, vertical scroll
 *            copied from t over dots 280-304
 *   0-239    visible
 *   240      idle
 *   241-260  VBlank; flag and NMI request at 241 dot 1
 *
 * Frames hold NES color indices (0-63). Hosts map them to RGB through
 * palette_colors.
 */
class PPU {
public:
    static constexpr int SCREEN_WIDTH = 256;
    static constexpr int SCREEN_HEIGHT = 240;
    static constexpr int DOTS_PER_SCANLINE = 341;
    static constexpr int SCANLINES_PER_FRAME = 262;

    using FrameBuffer = std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT>;

    PPU();

    // Connect cartridge board for CHR access and mirroring
    void connect_mapper(Mapper* m);

    // Soft reset - registers, latches and counters. VRAM, palette and OAM survive.
    void reset();

    // Advance one dot
    void step();

    // CPU interface - PPU registers ($2000-$2007)
    uint8_t cpu_read(uint16_t addr);
    void cpu_write(uint16_t addr, uint8_t data);

    // PPU memory bus (CHR, nametables, palette)
    uint8_t ppu_read(uint16_t addr);
    void ppu_write(uint16_t addr, uint8_t data);

    // Last completed frame
    const FrameBuffer& get_frame() const { return frame; }

    // True once per completed frame; reading clears it
    bool frame_complete();

    // Physical nametable index ($000-$FFF) for a PPU address in $2000-$3EFF
    static uint16_t mirror_nametable(uint16_t addr, Mirroring mode);

    // ===== STATE INSPECTION (no side effects) =====
    int16_t get_scanline() const { return scanline; }
    int16_t get_dot() const { return cycle; }
    uint64_t get_frame_count() const { return frame_count; }
    uint64_t get_total_dots() const { return total_dots; }
    uint8_t get_control() const { return control.reg; }
    uint8_t get_mask() const { return mask.reg; }
    uint8_t get_status() const { return status.reg; }
    uint8_t get_oam_addr() const { return oam_addr; }
    uint16_t get_vram_addr() const { return vram_addr.reg; }
    uint16_t get_tram_addr() const { return tram_addr.reg; }
    uint8_t get_fine_x() const { return fine_x; }
    bool get_write_toggle() const { return address_latch; }
    uint8_t get_sprite_count() const { return sprite_count; }
    uint8_t get_oam_byte(uint8_t index) const;

    // NMI request to CPU, consumed by the System
    bool nmi;

    // NES color palette (64 colors, RGB)
    static const uint8_t palette_colors[64][3];

private:
    Mapper* mapper;

    // PPU registers
    union {
        struct {
            uint8_t nametable_x : 1;
            uint8_t nametable_y : 1;
            uint8_t increment : 1;
            uint8_t sprite_table : 1;
            uint8_t background_table : 1;
            uint8_t sprite_size : 1;
            uint8_t master_slave : 1;
            uint8_t nmi_enable : 1;
        };
        uint8_t reg;
    } control;

    union {
        struct {
            uint8_t grayscale : 1;
            uint8_t show_background_left : 1;
            uint8_t show_sprites_left : 1;
            uint8_t show_background : 1;
            uint8_t show_sprites : 1;
            uint8_t emphasize_red : 1;
            uint8_t emphasize_green : 1;
            uint8_t emphasize_blue : 1;
        };
        uint8_t reg;
    } mask;

    union {
        struct {
            uint8_t unused : 5;
            uint8_t sprite_overflow : 1;
            uint8_t sprite_zero_hit : 1;
            uint8_t vblank : 1;
        };
        uint8_t reg;
    } status;

    // Internal registers
    uint8_t oam_addr;           // OAM address register
    uint8_t data_buffer;        // Data buffer for $2007 reads

    // Loopy registers (scrolling)
    union LoopyRegister {
        struct {
            uint16_t coarse_x : 5;
            uint16_t coarse_y : 5;
            uint16_t nametable_x : 1;
            uint16_t nametable_y : 1;
            uint16_t fine_y : 3;
            uint16_t unused : 1;
        };
        uint16_t reg;
    };

    LoopyRegister vram_addr;    // Current VRAM address (15 bits)
    LoopyRegister tram_addr;    // Temporary VRAM address (15 bits)
    uint8_t fine_x;             // Fine X scroll (3 bits)
    bool address_latch;         // First or second write toggle

    // Scanline and dot counters
    int16_t scanline;           // Current scanline (-1 to 260)
    int16_t cycle;              // Current dot (0 to 340)
    uint64_t frame_count;       // Total frames rendered
    uint64_t total_dots;        // Dots stepped since power-on
    bool frame_ready;           // Frame complete flag

    // Background rendering
    uint8_t bg_next_tile_id;
    uint8_t bg_next_tile_attrib;
    uint8_t bg_next_tile_lsb;
    uint8_t bg_next_tile_msb;

    uint16_t bg_shifter_pattern_lo;
    uint16_t bg_shifter_pattern_hi;
    uint16_t bg_shifter_attrib_lo;
    uint16_t bg_shifter_attrib_hi;

    // Sprite rendering
    struct ObjectAttributeEntry {
        uint8_t y;
        uint8_t id;
        uint8_t attribute;
        uint8_t x;
    };

    std::array<ObjectAttributeEntry, 64> oam;
    std::array<ObjectAttributeEntry, 8> secondary_oam;   // Secondary OAM
    uint8_t sprite_count;

    std::array<uint8_t, 8> sprite_pattern_lo;    // Row bits per secondary OAM slot
    std::array<uint8_t, 8> sprite_pattern_hi;

    bool sprite_zero_hit_possible;              // Slot 0 holds OAM entry 0

    struct SpritePixel {
        uint8_t value;      // 0 = transparent
        uint8_t palette;    // 4-7
        bool in_front;
        bool sprite_zero;
    };

    // Memory
    std::array<uint8_t, 2048> nametable;         // 2KB internal VRAM
    std::array<uint8_t, 2048> nametable_extra;   // Four-screen cartridge VRAM
    std::array<uint8_t, 32> palette;             // 32 bytes palette RAM

    // Frame buffers (256 * 240 color indices)
    FrameBuffer screen;   // Being drawn
    FrameBuffer frame;    // Last completed

    bool rendering_enabled() const { return mask.show_background || mask.show_sprites; }
    uint8_t& nametable_byte(uint16_t addr);
    static uint16_t palette_index(uint16_t addr);

    void advance_dot();
    void run_fetch_pipeline();
    void fetch_background_tile(int phase);
    uint8_t fetch_attribute_bits();
    void reload_background_shifters();
    void shift_background();

    // Loopy scroll updates, only while rendering is enabled
    void increment_scroll_x();
    void increment_scroll_y();
    void transfer_address_x();
    void transfer_address_y();

    void evaluate_sprites();
    void fetch_sprite_patterns();

    uint8_t background_pixel(int x, uint8_t& palette_select) const;
    SpritePixel sprite_pixel(int x) const;
    void render_pixel();
};
