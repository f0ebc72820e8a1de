#pragma once
#include <memory>
#include <stdint.h>

#include "cartridge.h"

#define RAM_SIZE 0x0800
#define OAMDMA   0x4014
#define JOY1     0x4016
#define JOY2     0x4017

class PPU; // forward declaration
class Input;

/*
 * Every CPU and PPU memory access goes through here, so mirroring and
 * register side effects are handled in exactly one place.
 */
class Bus {
public:
    explicit Bus(std::unique_ptr<Cartridge> cart);

    void connectPPU(PPU*);
    void connectInput(Input*);

    // CPU address space
    uint8_t read(uint16_t address);
    void write(uint16_t address, uint8_t value);

    // PPU address space (14 bit). Without a PPU connected only CHR answers,
    // like the PPU register window on the CPU side.
    uint8_t ppu_read(uint16_t address);
    void ppu_write(uint16_t address, uint8_t value);

    // True once after each write to $4014, so the CPU can charge the stall
    bool take_dma_request();

    Cartridge& get_cartridge();

private:
    uint16_t mirror_nametable(uint16_t address) const;

    uint8_t ram[RAM_SIZE];
    std::unique_ptr<Cartridge> cartridge;
    PPU* ppu;
    Input* input;
    bool dma_request;
};

/*
===================================
 NES CPU Memory Map (Summary)
===================================

$0000-$07FF : 2KB internal RAM
$0800-$1FFF : Mirrors of $0000-$07FF

$2000-$2007 : PPU registers
$2008-$3FFF : Mirrors of $2000-$2007 (every 8 bytes)

$4000-$4013 : APU registers (not emulated, reads return 0)
$4014       : OAM DMA
$4015       : APU status (not emulated)
$4016-$4017 : Controller ports ($4016 write = strobe)
$4018-$401F : APU/IO test mode, disabled

$4020-$FFFF : Cartridge space

===================================
 PPU Memory Map
===================================

$0000-$1FFF : Pattern tables (cartridge CHR)
$2000-$2FFF : 4 nametable windows onto 2KB of console VRAM
$3000-$3EFF : Mirror of $2000-$2EFF
$3F00-$3FFF : Palette RAM (32 bytes, mirrored)
*/
