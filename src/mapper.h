#pragma once
#include <stdint.h>
#include <vector>

// Nametable layout soldered on the cartridge board
enum class Mirroring {
    Horizontal, // $2000/$2400 share a table, $2800/$2C00 share the other
    Vertical    // $2000/$2800 share a table, $2400/$2C00 share the other
};

/*
 * Cartridge-side address decoding. The Bus hands over CPU addresses in
 * $4020-$FFFF and PPU addresses in $0000-$1FFF; everything else on the
 * PPU side (nametables, palette) lives inside the console.
 */
class Mapper {
public:
    virtual uint8_t read_cpu(uint16_t addr) = 0;
    virtual void write_cpu(uint16_t addr, uint8_t data) = 0;
    virtual uint8_t read_ppu(uint16_t addr) = 0;
    virtual void write_ppu(uint16_t addr, uint8_t data) = 0;
    virtual ~Mapper() = default;
};

// Mapper0 / NROM subclass
class Mapper0 : public Mapper {
    std::vector<uint8_t> prgROM;
    std::vector<uint8_t> chrROM;
    bool chr_is_ram;

public:
    Mapper0(std::vector<uint8_t> prg, std::vector<uint8_t> chr);
    uint8_t read_cpu(uint16_t addr) override;
    void write_cpu(uint16_t addr, uint8_t data) override;
    uint8_t read_ppu(uint16_t addr) override;
    void write_ppu(uint16_t addr, uint8_t data) override;
};
