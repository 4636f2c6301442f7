#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Nametable mirroring modes
 *
 * Horizontal: $2000=$2400, $2800=$2C00
 * Vertical:   $2000=$2800, $2400=$2C00
 * FourScreen: four independent 1KB nametables (cartridge supplies extra VRAM)
 * OneScreen*: every quadrant maps to the same 1KB bank (bank-switching boards)
 */
enum class Mirroring {
    Horizontal,
    Vertical,
    FourScreen,
    OneScreenLo,
    OneScreenHi
};

/**
 * ROM load failure - thrown before any System state is built
 */
class RomError : public std::runtime_error {
public:
    enum class Kind {
        BadMagic,           // Header does not start with "NES\x1A"
        TruncatedData,      // Declared bank sizes exceed file length
        UnsupportedMapper   // No Mapper implementation for this id
    };

    RomError(Kind kind, const std::string& message, uint8_t mapper_id = 0)
        : std::runtime_error(message), error_kind(kind), bad_mapper_id(mapper_id) {}

    Kind kind() const { return error_kind; }
    uint8_t mapper_id() const { return bad_mapper_id; }

private:
    Kind error_kind;
    uint8_t bad_mapper_id;
};

/**
 * Cartridge - parsed iNES image
 *
 * iNES HEADER FORMAT (16 bytes):
 * Bytes 0-3: "NES" + $1A (magic number)
 * Byte 4: PRG ROM size in 16KB units
 * Byte 5: CHR ROM size in 8KB units (0 = 8KB CHR RAM)
 * Byte 6: mirroring, battery, trainer, four-screen, mapper low nibble
 * Byte 7: mapper high nibble
 *
 * PRG ROM and mirroring are fixed once loaded. CHR storage is writable only
 * when the image carries no CHR ROM.
 */
class Cartridge {
public:
    static constexpr size_t HEADER_SIZE = 16;
    static constexpr size_t TRAINER_SIZE = 512;
    static constexpr size_t PRG_BANK_SIZE = 16384;
    static constexpr size_t CHR_BANK_SIZE = 8192;
    static constexpr size_t PRG_RAM_SIZE = 8192;

    // Throws RomError on a malformed image
    explicit Cartridge(const std::vector<uint8_t>& data);

    const std::vector<uint8_t>& prg_rom() const { return prg; }
    const std::vector<uint8_t>& chr() const { return chr_mem; }

    // CHR RAM write access; CHR ROM images ignore writes
    void write_chr(uint32_t offset, uint8_t data);

    // $6000-$7FFF work RAM
    std::vector<uint8_t>& prg_ram() { return ram; }
    const std::vector<uint8_t>& prg_ram() const { return ram; }

    uint8_t get_prg_banks() const { return prg_banks; }
    uint8_t get_chr_banks() const { return chr_banks; }
    uint8_t get_mapper_id() const { return mapper_id; }
    Mirroring get_mirroring() const { return mirroring; }
    bool has_battery() const { return battery; }
    bool has_trainer() const { return trainer; }
    bool has_chr_ram() const { return chr_banks == 0; }

private:
    std::vector<uint8_t> prg;
    std::vector<uint8_t> chr_mem;
    std::vector<uint8_t> ram;

    uint8_t prg_banks;
    uint8_t chr_banks;
    uint8_t mapper_id;
    Mirroring mirroring;
    bool battery;
    bool trainer;
};
