#include "mapper.h"

#include <utility>

Mapper0::Mapper0(std::vector<uint8_t> prg, std::vector<uint8_t> chr)
    : prgROM(std::move(prg)), chrROM(std::move(chr)), chr_is_ram(false)
{
    // boards without CHR ROM carry 8KB of CHR RAM instead
    if (chrROM.empty()) {
        chrROM.resize(0x2000, 0);
        chr_is_ram = true;
    }
}

uint8_t Mapper0::read_cpu(uint16_t addr) {
    if (addr >= 0x8000) {
        // NROM-128 (16KB) repeats at $C000, NROM-256 (32KB) fills the window
        return prgROM[(addr - 0x8000) & (prgROM.size() - 1)];
    }
    // no PRG RAM on this board
    return 0;
}

void Mapper0::write_cpu(uint16_t addr, uint8_t data) {
    (void)addr;
    (void)data;
}

uint8_t Mapper0::read_ppu(uint16_t addr) {
    if (addr < 0x2000) {
        return chrROM[addr];
    }
    return 0;
}

void Mapper0::write_ppu(uint16_t addr, uint8_t data) {
    if (addr < 0x2000 && chr_is_ram) {
        chrROM[addr] = data;
    }
}
