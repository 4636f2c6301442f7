#include "ppu.hpp"
#include "mapper.hpp"

PPU::PPU() : nmi(false), mapper(nullptr) {
    // Power-on: memories cleared, OAM parked off-screen
    nametable.fill(0x00);
    nametable_extra.fill(0x00);
    palette.fill(0x00);
    oam.fill({0xFF, 0xFF, 0xFF, 0xFF});
    screen.fill(0x00);
    frame.fill(0x00);
    frame_count = 0;
    total_dots = 0;

    reset();
}

void PPU::connect_mapper(Mapper* m) {
    mapper = m;
}

void PPU::reset() {
    control.reg = 0x00;
    mask.reg = 0x00;
    status.reg = 0x00;
    oam_addr = 0x00;
    data_buffer = 0x00;

    vram_addr.reg = 0x0000;
    tram_addr.reg = 0x0000;
    fine_x = 0x00;
    address_latch = false;

    scanline = -1;
    cycle = 0;
    frame_ready = false;
    nmi = false;

    bg_next_tile_id = 0x00;
    bg_next_tile_attrib = 0x00;
    bg_next_tile_lsb = 0x00;
    bg_next_tile_msb = 0x00;

    bg_shifter_pattern_lo = 0x0000;
    bg_shifter_pattern_hi = 0x0000;
    bg_shifter_attrib_lo = 0x0000;
    bg_shifter_attrib_hi = 0x0000;

    sprite_count = 0;
    sprite_zero_hit_possible = false;
    secondary_oam.fill({0xFF, 0xFF, 0xFF, 0xFF});
    sprite_pattern_lo.fill(0x00);
    sprite_pattern_hi.fill(0x00);
}

bool PPU::frame_complete() {
    bool result = frame_ready;
    frame_ready = false;
    return result;
}

uint8_t PPU::get_oam_byte(uint8_t index) const {
    return reinterpret_cast<const uint8_t*>(oam.data())[index];
}

static uint8_t reverse_bits(uint8_t b) {
    b = (uint8_t)((b & 0xF0) >> 4 | (b & 0x0F) << 4);
    b = (uint8_t)((b & 0xCC) >> 2 | (b & 0x33) << 2);
    b = (uint8_t)((b & 0xAA) >> 1 | (b & 0x55) << 1);
    return b;
}

// Scanline -1 is the pre-render line, 0-239 are visible, 240 is idle and
// 241-260 are VBlank.
void PPU::step() {
    if (scanline == -1 && cycle == 1) {
        status.vblank = 0;
        status.sprite_zero_hit = 0;
        status.sprite_overflow = 0;
    }

    if (scanline < 240) {
        run_fetch_pipeline();
        if (scanline >= 0 && cycle >= 1 && cycle <= 256) {
            render_pixel();
        }
    } else if (scanline == 241 && cycle == 1) {
        status.vblank = 1;
        if (control.nmi_enable) {
            nmi = true;
        }
    }

    advance_dot();
}

void PPU::advance_dot() {
    total_dots++;
    if (++cycle < DOTS_PER_SCANLINE) {
        return;
    }
    cycle = 0;
    if (++scanline == SCANLINES_PER_FRAME - 1) {
        scanline = -1;
        frame = screen;
        frame_ready = true;
        frame_count++;
    }
}

// Memory accesses of the pre-render and visible lines. Background tiles are
// fetched in 8-dot groups over dots 1-256 and 321-336; sprites for the next
// line are chosen at dot 257 and their patterns loaded at dot 340.
void PPU::run_fetch_pipeline() {
    if ((cycle >= 2 && cycle <= 257) || (cycle >= 321 && cycle <= 337)) {
        shift_background();
        fetch_background_tile((cycle - 1) & 0x07);
    }

    switch (cycle) {
        case 256:
            increment_scroll_y();
            break;
        case 257:
            reload_background_shifters();
            transfer_address_x();
            evaluate_sprites();
            break;
        case 340:
            fetch_sprite_patterns();
            break;
        default:
            break;
    }

    if (scanline == -1 && cycle >= 280 && cycle <= 304) {
        transfer_address_y();
    }
}

void PPU::fetch_background_tile(int phase) {
    uint16_t pattern_addr = (uint16_t)((control.background_table << 12) | (bg_next_tile_id << 4) | vram_addr.fine_y);

    switch (phase) {
        case 0:
            reload_background_shifters();
            bg_next_tile_id = ppu_read(0x2000 | (vram_addr.reg & 0x0FFF));
            break;
        case 2:
            bg_next_tile_attrib = fetch_attribute_bits();
            break;
        case 4:
            bg_next_tile_lsb = ppu_read(pattern_addr);
            break;
        case 6:
            bg_next_tile_msb = ppu_read(pattern_addr + 8);
            break;
        case 7:
            increment_scroll_x();
            break;
        default:
            break;
    }
}

// Two palette bits for the current tile out of its 32x32 pixel attribute byte
uint8_t PPU::fetch_attribute_bits() {
    uint16_t addr = 0x23C0 | (vram_addr.reg & 0x0C00)
                           | ((vram_addr.reg >> 4) & 0x38)
                           | ((vram_addr.reg >> 2) & 0x07);
    uint8_t shift = (uint8_t)(((vram_addr.coarse_y & 0x02) << 1) | (vram_addr.coarse_x & 0x02));
    return (ppu_read(addr) >> shift) & 0x03;
}

// Copies the first eight OAM entries covering scanline + 1 into secondary
// OAM. A ninth match sets the overflow flag.
void PPU::evaluate_sprites() {
    sprite_count = 0;
    sprite_zero_hit_possible = false;
    sprite_pattern_lo.fill(0x00);
    sprite_pattern_hi.fill(0x00);

    if (!rendering_enabled()) {
        return;
    }

    int target = scanline + 1;
    int height = control.sprite_size ? 16 : 8;

    for (uint8_t n = 0; n < 64; n++) {
        int row = target - oam[n].y;
        if (row < 0 || row >= height) {
            continue;
        }
        if (sprite_count == 8) {
            status.sprite_overflow = 1;
            break;
        }
        secondary_oam[sprite_count++] = oam[n];
        if (n == 0) {
            sprite_zero_hit_possible = true;
        }
    }
}

// 8x16 sprites take their pattern table from tile id bit 0 and use the odd
// tile for rows 8-15.
void PPU::fetch_sprite_patterns() {
    int target = scanline + 1;

    for (uint8_t i = 0; i < sprite_count; i++) {
        const ObjectAttributeEntry& sprite = secondary_oam[i];
        int row = target - sprite.y;
        if (sprite.attribute & 0x80) {
            row = (control.sprite_size ? 15 : 7) - row;
        }

        uint16_t table = control.sprite_table;
        uint16_t tile = sprite.id;
        if (control.sprite_size) {
            table = sprite.id & 0x01;
            tile = (uint16_t)((sprite.id & 0xFE) + (row >> 3));
        }

        uint16_t addr = (uint16_t)((table << 12) | (tile << 4) | (row & 0x07));
        uint8_t lo = ppu_read(addr);
        uint8_t hi = ppu_read(addr + 8);
        if (sprite.attribute & 0x40) {
            lo = reverse_bits(lo);
            hi = reverse_bits(hi);
        }
        sprite_pattern_lo[i] = lo;
        sprite_pattern_hi[i] = hi;
    }
}

uint8_t PPU::background_pixel(int x, uint8_t& palette_select) const {
    palette_select = 0;
    if (!mask.show_background || (x < 8 && !mask.show_background_left)) {
        return 0;
    }

    int shift = 15 - fine_x;
    palette_select = (uint8_t)((((bg_shifter_attrib_hi >> shift) & 1) << 1) | ((bg_shifter_attrib_lo >> shift) & 1));
    return (uint8_t)((((bg_shifter_pattern_hi >> shift) & 1) << 1) | ((bg_shifter_pattern_lo >> shift) & 1));
}

// Lowest secondary OAM slot with an opaque pixel at x
PPU::SpritePixel PPU::sprite_pixel(int x) const {
    SpritePixel result = {0, 0, false, false};
    if (!mask.show_sprites || (x < 8 && !mask.show_sprites_left)) {
        return result;
    }

    for (uint8_t i = 0; i < sprite_count; i++) {
        int column = x - secondary_oam[i].x;
        if (column < 0 || column > 7) {
            continue;
        }
        int bit = 7 - column;
        uint8_t value = (uint8_t)((((sprite_pattern_hi[i] >> bit) & 1) << 1) | ((sprite_pattern_lo[i] >> bit) & 1));
        if (value == 0) {
            continue;
        }
        result.value = value;
        result.palette = 0x04 | (secondary_oam[i].attribute & 0x03);
        result.in_front = (secondary_oam[i].attribute & 0x20) == 0;
        result.sprite_zero = (i == 0) && sprite_zero_hit_possible;
        break;
    }
    return result;
}

void PPU::render_pixel() {
    int x = cycle - 1;

    uint8_t bg_palette = 0;
    uint8_t bg = background_pixel(x, bg_palette);
    SpritePixel sprite = sprite_pixel(x);

    // Offset into palette RAM; 0 is the universal background color
    uint8_t color = 0;
    if (sprite.value != 0 && (bg == 0 || sprite.in_front)) {
        color = (uint8_t)((sprite.palette << 2) | sprite.value);
    } else if (bg != 0) {
        color = (uint8_t)((bg_palette << 2) | bg);
    }

    if (sprite.sprite_zero && bg != 0 && x != 255
        && (x >= 8 || (mask.show_background_left && mask.show_sprites_left))) {
        status.sprite_zero_hit = 1;
    }

    screen[scanline * SCREEN_WIDTH + x] = ppu_read(0x3F00 + color) & 0x3F;
}

// coarse X lives in bits 0-4, nametable X in bit 10
void PPU::increment_scroll_x() {
    if (!rendering_enabled()) {
        return;
    }
    if ((vram_addr.reg & 0x001F) == 0x001F) {
        vram_addr.reg = (uint16_t)((vram_addr.reg & ~0x001F) ^ 0x0400);
    } else {
        vram_addr.reg++;
    }
}

void PPU::increment_scroll_y() {
    if (!rendering_enabled()) {
        return;
    }
    if (vram_addr.fine_y < 7) {
        vram_addr.fine_y++;
        return;
    }

    vram_addr.fine_y = 0;
    switch (vram_addr.coarse_y) {
        case 29:
            vram_addr.coarse_y = 0;
            vram_addr.nametable_y ^= 1;
            break;
        case 31:
            // Rows 30-31 are attribute data; leaving them keeps the nametable
            vram_addr.coarse_y = 0;
            break;
        default:
            vram_addr.coarse_y++;
            break;
    }
}

void PPU::transfer_address_x() {
    if (rendering_enabled()) {
        vram_addr.reg = (uint16_t)((vram_addr.reg & ~0x041F) | (tram_addr.reg & 0x041F));
    }
}

void PPU::transfer_address_y() {
    if (rendering_enabled()) {
        vram_addr.reg = (uint16_t)((vram_addr.reg & ~0x7BE0) | (tram_addr.reg & 0x7BE0));
    }
}

void PPU::reload_background_shifters() {
    bg_shifter_pattern_lo = (uint16_t)((bg_shifter_pattern_lo & 0xFF00) | bg_next_tile_lsb);
    bg_shifter_pattern_hi = (uint16_t)((bg_shifter_pattern_hi & 0xFF00) | bg_next_tile_msb);
    bg_shifter_attrib_lo = (uint16_t)((bg_shifter_attrib_lo & 0xFF00) | ((bg_next_tile_attrib & 0x01) ? 0xFF : 0x00));
    bg_shifter_attrib_hi = (uint16_t)((bg_shifter_attrib_hi & 0xFF00) | ((bg_next_tile_attrib & 0x02) ? 0xFF : 0x00));
}

void PPU::shift_background() {
    if (!mask.show_background) {
        return;
    }
    bg_shifter_pattern_lo <<= 1;
    bg_shifter_pattern_hi <<= 1;
    bg_shifter_attrib_lo <<= 1;
    bg_shifter_attrib_hi <<= 1;
}

uint8_t PPU::cpu_read(uint16_t addr) {
    uint8_t data = 0x00;

    switch (addr & 0x0007) {
        case 0x0002: // Status ($2002)
            // Bits 7-5: VBlank, Sprite 0 Hit, Sprite Overflow
            // Bits 4-0: Stale PPU bus contents
            //
            // SIDE EFFECTS: VBlank flag cleared, write toggle reset
            data = (status.reg & 0xE0) | (data_buffer & 0x1F);
            status.vblank = 0;
            address_latch = false;
            break;
        case 0x0004: // OAM Data - OAM address is not incremented on read
            data = get_oam_byte(oam_addr);
            break;
        case 0x0007: // PPU Data
            if ((vram_addr.reg & 0x3FFF) >= 0x3F00) {
                // Palette reads are immediate; the buffer picks up the nametable underneath
                data = ppu_read(vram_addr.reg);
                data_buffer = ppu_read(vram_addr.reg - 0x1000);
            } else {
                data = data_buffer;
                data_buffer = ppu_read(vram_addr.reg);
            }
            vram_addr.reg = (vram_addr.reg + (control.increment ? 32 : 1)) & 0x7FFF;
            break;
        default:
            // Write-only registers
            break;
    }

    return data;
}

void PPU::cpu_write(uint16_t addr, uint8_t data) {
    switch (addr & 0x0007) {
        case 0x0000: { // Control
            bool was_enabled = control.nmi_enable;
            control.reg = data;
            tram_addr.nametable_x = control.nametable_x;
            tram_addr.nametable_y = control.nametable_y;
            // Enabling NMI during VBlank fires immediately
            if (!was_enabled && control.nmi_enable && status.vblank) {
                nmi = true;
            }
            break;
        }
        case 0x0001: // Mask
            mask.reg = data;
            break;
        case 0x0003: // OAM Address
            oam_addr = data;
            break;
        case 0x0004: // OAM Data
            reinterpret_cast<uint8_t*>(oam.data())[oam_addr] = data;
            oam_addr++;
            break;
        case 0x0005: // Scroll
            if (!address_latch) {
                fine_x = data & 0x07;
                tram_addr.coarse_x = data >> 3;
                address_latch = true;
            } else {
                tram_addr.fine_y = data & 0x07;
                tram_addr.coarse_y = data >> 3;
                address_latch = false;
            }
            break;
        case 0x0006: // PPU Address
            if (!address_latch) {
                tram_addr.reg = (uint16_t)((data & 0x3F) << 8) | (tram_addr.reg & 0x00FF);
                address_latch = true;
            } else {
                tram_addr.reg = (tram_addr.reg & 0xFF00) | data;
                vram_addr = tram_addr;
                address_latch = false;
            }
            break;
        case 0x0007: // PPU Data
            ppu_write(vram_addr.reg, data);
            vram_addr.reg = (vram_addr.reg + (control.increment ? 32 : 1)) & 0x7FFF;
            break;
        default:
            // Status is read-only
            break;
    }
}

uint16_t PPU::mirror_nametable(uint16_t addr, Mirroring mode) {
    addr &= 0x0FFF;

    switch (mode) {
        case Mirroring::Vertical:
            // $2000=$2800, $2400=$2C00
            return addr & 0x07FF;
        case Mirroring::Horizontal:
            // $2000=$2400, $2800=$2C00
            return ((addr & 0x0800) >> 1) | (addr & 0x03FF);
        case Mirroring::OneScreenLo:
            return addr & 0x03FF;
        case Mirroring::OneScreenHi:
            return 0x0400 | (addr & 0x03FF);
        case Mirroring::FourScreen:
            return addr;
    }
    return addr & 0x07FF;
}

uint8_t& PPU::nametable_byte(uint16_t addr) {
    Mirroring mode = mapper ? mapper->get_mirroring() : Mirroring::Horizontal;
    uint16_t index = mirror_nametable(addr, mode);
    if (index < 0x0800) {
        return nametable[index];
    }
    return nametable_extra[index & 0x07FF];
}

uint16_t PPU::palette_index(uint16_t addr) {
    addr &= 0x001F;
    // Sprite palette entry 0 mirrors the background entry
    if (addr == 0x0010) addr = 0x0000;
    if (addr == 0x0014) addr = 0x0004;
    if (addr == 0x0018) addr = 0x0008;
    if (addr == 0x001C) addr = 0x000C;
    return addr;
}

uint8_t PPU::ppu_read(uint16_t addr) {
    addr &= 0x3FFF;

    if (addr <= 0x1FFF) {
        // Pattern tables (CHR ROM/RAM)
        return mapper ? mapper->ppu_read(addr) : 0x00;
    } else if (addr <= 0x3EFF) {
        return nametable_byte(addr);
    }
    return palette[palette_index(addr)] & (mask.grayscale ? 0x30 : 0x3F);
}

void PPU::ppu_write(uint16_t addr, uint8_t data) {
    addr &= 0x3FFF;

    if (addr <= 0x1FFF) {
        if (mapper) {
            mapper->ppu_write(addr, data);
        }
    } else if (addr <= 0x3EFF) {
        nametable_byte(addr) = data;
    } else {
        palette[palette_index(addr)] = data & 0x3F;
    }
}

// NES Color Palette (64 colors, RGB)
const uint8_t PPU::palette_colors[64][3] = {
    {84, 84, 84}, {0, 30, 116}, {8, 16, 144}, {48, 0, 136}, {68, 0, 100}, {92, 0, 48}, {84, 4, 0}, {60, 24, 0},
    {32, 42, 0}, {8, 58, 0}, {0, 64, 0}, {0, 60, 0}, {0, 50, 60}, {0, 0, 0}, {0, 0, 0}, {0, 0, 0},
    {152, 150, 152}, {8, 76, 196}, {48, 50, 236}, {92, 30, 228}, {136, 20, 176}, {160, 20, 100}, {152, 34, 32}, {120, 60, 0},
    {84, 90, 0}, {40, 114, 0}, {8, 124, 0}, {0, 118, 40}, {0, 102, 120}, {0, 0, 0}, {0, 0, 0}, {0, 0, 0},
    {236, 238, 236}, {76, 154, 236}, {120, 124, 236}, {176, 98, 236}, {228, 84, 236}, {236, 88, 180}, {236, 106, 100}, {212, 136, 32},
    {160, 170, 0}, {116, 196, 0}, {76, 208, 32}, {56, 204, 108}, {56, 180, 204}, {60, 60, 60}, {0, 0, 0}, {0, 0, 0},
    {236, 238, 236}, {168, 204, 236}, {188, 188, 236}, {212, 178, 236}, {236, 174, 236}, {236, 174, 212}, {236, 180, 176}, {228, 196, 144},
    {204, 210, 120}, {180, 222, 120}, {168, 226, 144}, {152, 226, 180}, {160, 214, 228}, {160, 162, 160}, {0, 0, 0}, {0, 0, 0}
};
