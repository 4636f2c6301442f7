#include "demo_rom.hpp"
#include "cartridge.hpp"
#include <algorithm>

static constexpr uint16_t PRG_BASE = 0xC000;

// Reset handler at $C000
static const uint8_t reset_code[] = {
    0x78,                   // C000 SEI
    0xD8,                   // C001 CLD
    0xA2, 0xFF,             // C002 LDX #$FF
    0x9A,                   // C004 TXS
    0x2C, 0x02, 0x20,       // C005 BIT $2002      ; first VBlank
    0x10, 0xFB,             // C008 BPL $C005
    0x2C, 0x02, 0x20,       // C00A BIT $2002      ; second VBlank
    0x10, 0xFB,             // C00D BPL $C00A

    // Palette upload
    0xA9, 0x3F,             // C00F LDA #$3F
    0x8D, 0x06, 0x20,       // C011 STA $2006
    0xA9, 0x00,             // C014 LDA #$00
    0x8D, 0x06, 0x20,       // C016 STA $2006
    0xA2, 0x00,             // C019 LDX #$00
    0xBD, 0x00, 0xC1,       // C01B LDA $C100,X
    0x8D, 0x07, 0x20,       // C01E STA $2007
    0xE8,                   // C021 INX
    0xE0, 0x20,             // C022 CPX #$20
    0xD0, 0xF5,             // C024 BNE $C01B

    // Nametable 0 filled with tile 1
    0xA9, 0x20,             // C026 LDA #$20
    0x8D, 0x06, 0x20,       // C028 STA $2006
    0xA9, 0x00,             // C02B LDA #$00
    0x8D, 0x06, 0x20,       // C02D STA $2006
    0xA9, 0x01,             // C030 LDA #$01
    0xA0, 0x04,             // C032 LDY #$04
    0xA2, 0x00,             // C034 LDX #$00
    0x8D, 0x07, 0x20,       // C036 STA $2007
    0xCA,                   // C039 DEX
    0xD0, 0xFA,             // C03A BNE $C036
    0x88,                   // C03C DEY
    0xD0, 0xF7,             // C03D BNE $C036

    // Attribute table back to palette 0
    0xA9, 0x23,             // C03F LDA #$23
    0x8D, 0x06, 0x20,       // C041 STA $2006
    0xA9, 0xC0,             // C044 LDA #$C0
    0x8D, 0x06, 0x20,       // C046 STA $2006
    0xA9, 0x00,             // C049 LDA #$00
    0xA2, 0x40,             // C04B LDX #$40
    0x8D, 0x07, 0x20,       // C04D STA $2007
    0xCA,                   // C050 DEX
    0xD0, 0xFA,             // C051 BNE $C04D

    // Hide every sprite in the OAM shadow page
    0xA9, 0xFF,             // C053 LDA #$FF
    0xA2, 0x00,             // C055 LDX #$00
    0x9D, 0x00, 0x02,       // C057 STA $0200,X
    0xE8,                   // C05A INX
    0xD0, 0xFA,             // C05B BNE $C057

    // Sprite 0: Y=$70, tile 2, attributes 0, X=$80
    0xA9, 0x70,             // C05D LDA #$70
    0x8D, 0x00, 0x02,       // C05F STA $0200
    0xA9, 0x02,             // C062 LDA #$02
    0x8D, 0x01, 0x02,       // C064 STA $0201
    0xA9, 0x00,             // C067 LDA #$00
    0x8D, 0x02, 0x02,       // C069 STA $0202
    0xA9, 0x80,             // C06C LDA #$80
    0x8D, 0x03, 0x02,       // C06E STA $0203

    // Scroll to (0, 0)
    0xA9, 0x00,             // C071 LDA #$00
    0x8D, 0x05, 0x20,       // C073 STA $2005
    0x8D, 0x05, 0x20,       // C076 STA $2005

    // NMI on, background and sprites on, left column shown
    0xA9, 0x80,             // C079 LDA #$80
    0x8D, 0x00, 0x20,       // C07B STA $2000
    0xA9, 0x1E,             // C07E LDA #$1E
    0x8D, 0x01, 0x20,       // C080 STA $2001

    0x4C, 0x83, 0xC0,       // C083 JMP $C083
};

static constexpr uint16_t NMI_ADDR = 0xC090;

// NMI handler at $C090
static const uint8_t nmi_code[] = {
    0x48,                   // C090 PHA
    0xE6, 0x00,             // C091 INC $00
    0xA9, 0x01,             // C093 LDA #$01
    0x8D, 0x16, 0x40,       // C095 STA $4016
    0xA9, 0x00,             // C098 LDA #$00
    0x8D, 0x16, 0x40,       // C09A STA $4016
    0xAD, 0x16, 0x40,       // C09D LDA $4016      ; A
    0xAD, 0x16, 0x40,       // C0A0 LDA $4016      ; B
    0xAD, 0x16, 0x40,       // C0A3 LDA $4016      ; Select
    0xAD, 0x16, 0x40,       // C0A6 LDA $4016      ; Start
    0xAD, 0x16, 0x40,       // C0A9 LDA $4016      ; Up
    0xAD, 0x16, 0x40,       // C0AC LDA $4016      ; Down
    0xAD, 0x16, 0x40,       // C0AF LDA $4016      ; Left
    0x29, 0x01,             // C0B2 AND #$01
    0xF0, 0x03,             // C0B4 BEQ $C0B9
    0xCE, 0x03, 0x02,       // C0B6 DEC $0203
    0xAD, 0x16, 0x40,       // C0B9 LDA $4016      ; Right
    0x29, 0x01,             // C0BC AND #$01
    0xF0, 0x03,             // C0BE BEQ $C0C3
    0xEE, 0x03, 0x02,       // C0C0 INC $0203
    0xA9, 0x02,             // C0C3 LDA #$02
    0x8D, 0x14, 0x40,       // C0C5 STA $4014
    0x68,                   // C0C8 PLA
    0x40,                   // C0C9 RTI
};

static constexpr uint16_t IRQ_ADDR = 0xC0C9;
static constexpr uint16_t PALETTE_ADDR = 0xC100;

static const uint8_t palette_data[32] = {
    0x0F, 0x30, 0x16, 0x27,  0x0F, 0x01, 0x21, 0x31,
    0x0F, 0x06, 0x16, 0x26,  0x0F, 0x09, 0x19, 0x29,
    0x0F, 0x16, 0x27, 0x18,  0x0F, 0x02, 0x22, 0x32,
    0x0F, 0x0A, 0x1A, 0x2A,  0x0F, 0x07, 0x17, 0x27,
};

template <size_t N>
static void place(std::vector<uint8_t>& prg, uint16_t addr, const uint8_t (&bytes)[N]) {
    std::copy(bytes, bytes + N, prg.begin() + (addr - PRG_BASE));
}

static void place_vector(std::vector<uint8_t>& prg, uint16_t addr, uint16_t target) {
    prg[addr - PRG_BASE] = target & 0xFF;
    prg[addr - PRG_BASE + 1] = target >> 8;
}

std::vector<uint8_t> make_demo_rom() {
    std::vector<uint8_t> prg(Cartridge::PRG_BANK_SIZE, 0xEA);
    place(prg, PRG_BASE, reset_code);
    place(prg, NMI_ADDR, nmi_code);
    place(prg, PALETTE_ADDR, palette_data);

    place_vector(prg, 0xFFFA, NMI_ADDR);
    place_vector(prg, 0xFFFC, PRG_BASE);
    place_vector(prg, 0xFFFE, IRQ_ADDR);

    // Tile 1: checkerboard of pixel values 1 and 2. Tile 2: solid value 3.
    std::vector<uint8_t> chr(Cartridge::CHR_BANK_SIZE, 0x00);
    for (int row = 0; row < 8; row++) {
        chr[16 + row] = (row & 1) ? 0x55 : 0xAA;
        chr[16 + 8 + row] = (row & 1) ? 0xAA : 0x55;
    }
    std::fill(chr.begin() + 32, chr.begin() + 48, 0xFF);

    std::vector<uint8_t> rom = {'N', 'E', 'S', 0x1A, 0x01, 0x01, 0x00, 0x00,
                                0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    rom.insert(rom.end(), prg.begin(), prg.end());
    rom.insert(rom.end(), chr.begin(), chr.end());
    return rom;
}
