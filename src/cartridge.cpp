#include "cartridge.hpp"
#include <cstring>
#include <iostream>
#include <sstream>
#include <iomanip>

// ============================================================================
// CARTRIDGE - iNES IMAGE PARSER
// ============================================================================
//
// LAYOUT:
// [16-byte header][512-byte trainer, if flag 6 bit 2][PRG ROM][CHR ROM]
//
// The trainer is skipped. CHR ROM is absent when byte 5 is zero; the board
// then carries 8KB of CHR RAM instead.

Cartridge::Cartridge(const std::vector<uint8_t>& data) {
    // ===== HEADER VALIDATION =====
    if (data.size() < HEADER_SIZE) {
        std::ostringstream msg;
        msg << "ROM image too small (" << data.size() << " bytes, header needs " << HEADER_SIZE << ")";
        throw RomError(RomError::Kind::TruncatedData, msg.str());
    }

    if (data[0] != 'N' || data[1] != 'E' || data[2] != 'S' || data[3] != 0x1A) {
        std::ostringstream msg;
        msg << "Invalid NES header magic: got " << std::hex << std::setfill('0')
            << std::setw(2) << (int)data[0] << " " << std::setw(2) << (int)data[1] << " "
            << std::setw(2) << (int)data[2] << " " << std::setw(2) << (int)data[3]
            << ", expected 4e 45 53 1a";
        throw RomError(RomError::Kind::BadMagic, msg.str());
    }

    // ===== HEADER FIELDS =====
    prg_banks = data[4];
    chr_banks = data[5];
    mapper_id = (data[6] >> 4) | (data[7] & 0xF0);
    battery = (data[6] & 0x02) != 0;
    trainer = (data[6] & 0x04) != 0;

    // Bit 3 (four-screen) overrides bit 0
    // Bit 0: 0 = vertical mirroring, 1 = horizontal mirroring
    if (data[6] & 0x08) {
        mirroring = Mirroring::FourScreen;
    } else {
        mirroring = (data[6] & 0x01) ? Mirroring::Horizontal : Mirroring::Vertical;
    }

    size_t offset = HEADER_SIZE;
    if (trainer) {
        offset += TRAINER_SIZE;
    }

    // ===== PRG ROM =====
    size_t prg_size = prg_banks * PRG_BANK_SIZE;
    if (offset + prg_size > data.size()) {
        std::ostringstream msg;
        msg << "PRG ROM size (" << prg_size << " bytes) exceeds file size ("
            << (data.size() > offset ? data.size() - offset : 0) << " bytes available)";
        throw RomError(RomError::Kind::TruncatedData, msg.str());
    }
    prg.resize(prg_size);
    if (prg_size > 0) {
        std::memcpy(prg.data(), &data[offset], prg_size);
    }
    offset += prg_size;

    // ===== CHR ROM/RAM =====
    if (chr_banks == 0) {
        chr_mem.assign(CHR_BANK_SIZE, 0x00);
    } else {
        size_t chr_size = chr_banks * CHR_BANK_SIZE;
        if (offset + chr_size > data.size()) {
            std::ostringstream msg;
            msg << "CHR ROM size (" << chr_size << " bytes) exceeds file size ("
                << (data.size() - offset) << " bytes available)";
            throw RomError(RomError::Kind::TruncatedData, msg.str());
        }
        chr_mem.resize(chr_size);
        std::memcpy(chr_mem.data(), &data[offset], chr_size);
    }

    ram.assign(PRG_RAM_SIZE, 0x00);

    std::cout << "PRG ROM: " << (int)prg_banks << " x 16KB, CHR "
              << (chr_banks == 0 ? "RAM: 8KB" : "ROM: " + std::to_string(chr_banks * 8) + "KB")
              << ", Mapper: " << (int)mapper_id << std::endl;
    if (battery) {
        std::cout << "Battery-backed RAM: Yes" << std::endl;
    }
}

void Cartridge::write_chr(uint32_t offset, uint8_t data) {
    if (chr_banks == 0 && offset < chr_mem.size()) {
        chr_mem[offset] = data;
    }
}
