#pragma once
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

#include "mapper.h"

#define PRG_BANK_SIZE 0x4000 // 16KB
#define CHR_BANK_SIZE 0x2000 // 8KB

// Bad bank sizes or a mapper this emulator doesn't implement
class CartridgeError : public std::runtime_error {
public:
    explicit CartridgeError(const std::string& what) : std::runtime_error(what) {}
};

// The .nes file itself couldn't be read or parsed
class RomError : public std::runtime_error {
public:
    explicit RomError(const std::string& what) : std::runtime_error(what) {}
};

/*
 * In-memory cartridge image. PRG/CHR banks are fixed at construction
 * and the mapper picked by id; an unknown id is an error, never a
 * fallback to NROM.
 */
class Cartridge {
public:
    Cartridge(std::vector<uint8_t> prg, std::vector<uint8_t> chr, uint8_t mapper_id, Mirroring mirroring);

    uint8_t read_cpu(uint16_t addr) { return mapper->read_cpu(addr); }
    void write_cpu(uint16_t addr, uint8_t data) { mapper->write_cpu(addr, data); }
    uint8_t read_ppu(uint16_t addr) { return mapper->read_ppu(addr); }
    void write_ppu(uint16_t addr, uint8_t data) { mapper->write_ppu(addr, data); }

    uint8_t get_mapper_id() const { return mapper_id; }
    Mirroring get_mirroring() const { return mirroring; }
    size_t get_prg_size() const { return prg_size; }
    size_t get_chr_size() const { return chr_size; }
    bool has_chr_ram() const { return chr_size == 0; }

private:
    std::unique_ptr<Mapper> mapper;
    uint8_t mapper_id;
    Mirroring mirroring;
    size_t prg_size;
    size_t chr_size;
};

// Parse an iNES (.nes) file into a cartridge. Throws RomError or CartridgeError.
std::unique_ptr<Cartridge> load_ines(const std::string& filename);

/* .INES file format

1.  Header (16 bytes)
2.  Trainer, if present (0 or 512 bytes)
3.  PRG ROM data (16384 * x bytes) (x is flag 4)
4.  CHR ROM data, if present (8192 * y bytes)  (y is flag 5)

Header format
___________________________________________________________________
bytes  | description
0-3    | Constant $4E $45 $53 $1A (ASCII "NES" followed by MS-DOS end-of-file)
4      | Size of PRG ROM in 16 KB units
5      | Size of CHR ROM in 8 KB units (value 0 means the board uses CHR RAM)
6      | Flags 6 - Mapper low nibble, mirroring, battery, trainer, four-screen
7      | Flags 7 - Mapper high nibble, VS/Playchoice, NES 2.0
8-15   | Rarely used extensions / padding
___________________________________________________________________
*/
