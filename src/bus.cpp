#include "bus.h"

#include <cstring>
#include <utility>

#include "input.h"
#include "ppu.h"

Bus::Bus(std::unique_ptr<Cartridge> cart)
    : cartridge(std::move(cart)), ppu(nullptr), input(nullptr), dma_request(false)
{
  memset(ram, 0, sizeof(ram));
}

void Bus::connectPPU(PPU* ppu_ref) {
  ppu = ppu_ref;
}

void Bus::connectInput(Input* input_ref) {
  input = input_ref;
}

Cartridge& Bus::get_cartridge() { return *cartridge; }

uint8_t Bus::read(uint16_t address) {
  if (address < 0x2000) {
    return ram[address % RAM_SIZE];
  }

  // PPU registers are mirrored every 8 bytes in 0x2000-0x3FFF
  if (address < 0x4000) {
    return ppu ? ppu->read_register(0x2000 + (address % 8)) : 0;
  }

  if (address == JOY1 || address == JOY2) {
    return input ? input->read_controller(address - JOY1) : 0;
  }

  // APU and test registers
  if (address < 0x4020) {
    return 0;
  }

  return cartridge->read_cpu(address);
}

void Bus::write(uint16_t address, uint8_t value) {
  if (address < 0x2000) {
    ram[address % RAM_SIZE] = value;
    return;
  }

  if (address < 0x4000) {
    if (ppu) {
      ppu->write_register(0x2000 + (address % 8), value);
    }
    return;
  }

  if (address == OAMDMA) {
    uint16_t base_addr = value << 8;
    for (int i = 0; i < 256; i++) {
      uint8_t byte = read((uint16_t)(base_addr + i));
      if (ppu) {
        ppu->oam_write(byte);
      }
    }
    dma_request = true;
    return;
  }

  if (address == JOY1) {
    if (input) {
      input->write_strobe(value);
    }
    return;
  }

  if (address < 0x4020) {
    return;
  }

  cartridge->write_cpu(address, value);
}

uint8_t Bus::ppu_read(uint16_t address) {
  address &= 0x3FFF;

  if (address < 0x2000) {
    return cartridge->read_ppu(address);
  }

  // nametables and palette live in the PPU
  if (!ppu) {
    return 0;
  }

  if (address < 0x3F00) {
    return ppu->read_vram(mirror_nametable(address));
  }

  return ppu->read_palette(address);
}

void Bus::ppu_write(uint16_t address, uint8_t value) {
  address &= 0x3FFF;

  if (address < 0x2000) {
    cartridge->write_ppu(address, value);
  } else if (!ppu) {
    return;
  } else if (address < 0x3F00) {
    ppu->write_vram(mirror_nametable(address), value);
  } else {
    ppu->write_palette(address, value);
  }
}

bool Bus::take_dma_request() {
  bool requested = dma_request;
  dma_request = false;
  return requested;
}

// Map $2000-$3EFF to an offset in the 2KB of VRAM
uint16_t Bus::mirror_nametable(uint16_t address) const {
  address = address & 0x0FFF; // wrap $3000-$3EFF onto $2000-$2EFF
  uint16_t table = address / 0x400;
  uint16_t offset = address % 0x400;

  if (cartridge->get_mirroring() == Mirroring::Vertical) {
    return (table & 1) * 0x400 + offset;
  }
  return (table >> 1) * 0x400 + offset;
}
