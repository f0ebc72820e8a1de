#include "ppu.h"

#include <algorithm>
#include <cstring>

#include "bus.h"

/* Pixel processing unit (PPU). Runs 3 dots per CPU cycle; the driver
   does the stepping so the two stay in lockstep. */

PPU::PPU()
  : bus(nullptr),
    odd_frame_skip(true),
    front_buffer(SCREEN_WIDTH * SCREEN_HEIGHT, 0xFF000000u),
    back_buffer(SCREEN_WIDTH * SCREEN_HEIGHT, 0xFF000000u)
{
  memset(name_tables, 0, sizeof(name_tables));
  memset(palette_RAM, 0, sizeof(palette_RAM));
  memset(OAM,         0, sizeof(OAM));

  reset();
}

void PPU::connectBus(Bus* bus_ref) {
  bus = bus_ref;
}

// Power-on register state. Memory contents are left alone.
void PPU::reset() {
  control = 0;
  mask = 0;
  status = 0;
  oam_addr = 0;
  io_latch = 0;
  buffer = 0;

  vram_addr = 0;
  t_addr = 0;
  fine_x = 0;
  write_latch = false;

  // start on the pre-render line so the first frame is a whole one
  scanline = PRERENDER_SCANLINE;
  dot = 0;
  odd_frame = false;
  NMI = false;
  frame_count = 0;

  next_tile_id = 0;
  next_tile_attrib = 0;
  next_tile_lsb = 0;
  next_tile_msb = 0;
  shifter_pattern_lo = 0;
  shifter_pattern_hi = 0;
  shifter_attrib_lo = 0;
  shifter_attrib_hi = 0;
}

void PPU::write_register(uint16_t cpu_addr, uint8_t value) {
  io_latch = value;

  switch (cpu_addr % 8) {
    case 0: // $2000 - PPUCTRL
      control = value;
      t_addr = (t_addr & 0xF3FF) | ((value & CTRL_NAMETABLE) << 10);
      break;
    case 1: // $2001 - PPUMASK
      mask = value;
      break;
    case 2: // $2002 - PPUSTATUS
      // ignore since there's no write
      break;
    case 3: // $2003 - OAMADDR
      oam_addr = value;
      break;
    case 4: // $2004 - OAMDATA
      OAM[oam_addr] = value;
      oam_addr++;
      break;
    case 5: // $2005 - PPUSCROLL
      if (!write_latch) {
          // first write = X scroll
          fine_x = value & 0x07;
          t_addr = (t_addr & 0xFFE0) | (value >> 3);
          write_latch = true;
      } else {
          // second write = Y scroll
          t_addr = (t_addr & 0x8FFF) | ((value & 0x07) << 12);
          t_addr = (t_addr & 0xFC1F) | ((value & 0xF8) << 2);
          write_latch = false;
      }
      break;
    case 6: // $2006 - PPUADDR
      if (!write_latch) {
          t_addr = (t_addr & 0x00FF) | ((value & 0x3F) << 8);
          write_latch = true;
      } else {
          t_addr = (t_addr & 0xFF00) | value;
          vram_addr = t_addr;
          write_latch = false;
      }
      break;
    case 7: // $2007 - PPUDATA
      bus->ppu_write(vram_addr & 0x3FFF, value);
      vram_addr = (vram_addr + ((control & CTRL_INCREMENT_32) ? 32 : 1)) & 0x7FFF;
      break;
  }
}


uint8_t PPU::read_register(uint16_t cpu_addr) {
    uint8_t data = io_latch;
    switch (cpu_addr % 8) {
        case 2: // $2002 - PPUSTATUS
            data = (status & 0xE0) | (io_latch & 0x1F);
            status &= ~STATUS_VBLANK;
            write_latch = false;
            break;
        case 4: // $2004 - OAMDATA
            data = OAM[oam_addr];
            break;
        case 7: { // $2007 - PPUDATA
            uint16_t addr = vram_addr & 0x3FFF;
            if (addr < 0x3F00) {
                // buffered read for VRAM
                data = buffer;
                buffer = bus->ppu_read(addr);
            } else {
                // palette comes straight out, buffer gets the nametable underneath
                data = bus->ppu_read(addr);
                buffer = bus->ppu_read(addr - 0x1000);
            }

            vram_addr = (vram_addr + ((control & CTRL_INCREMENT_32) ? 32 : 1)) & 0x7FFF;
            break;
        }
    }
    io_latch = data;
    return data;
}

void PPU::oam_write(uint8_t byte) {
  OAM[oam_addr] = byte;
  oam_addr++;
}


bool PPU::tick() {
    bool rendering = rendering_enabled();

    if (scanline < SCREEN_HEIGHT || scanline == PRERENDER_SCANLINE) {
        if (rendering) {
            background_fetch();
        }
        if (scanline < SCREEN_HEIGHT && dot >= 1 && dot <= SCREEN_WIDTH) {
            output_pixel();
        }
    }

    // Start of vblank, the only place NMI is raised
    if (scanline == VBLANK_SCANLINE && dot == 1) {
        status |= STATUS_VBLANK;
        if (control & CTRL_NMI) {
            NMI = true;
        }
    }

    // End of vblank
    if (scanline == PRERENDER_SCANLINE && dot == 1) {
        status &= ~(STATUS_VBLANK | STATUS_SPRITE0 | STATUS_OVERFLOW);
        NMI = false;
    }

    // odd frames drop dot 340 of the pre-render line when rendering is on
    if (scanline == PRERENDER_SCANLINE && dot == 339 && odd_frame && odd_frame_skip && rendering) {
        scanline = 0;
        dot = 0;
        return false;
    }

    dot++;
    if (dot < DOTS_PER_SCANLINE) {
        return false;
    }

    dot = 0;
    scanline++;
    if (scanline > PRERENDER_SCANLINE) {
        scanline = 0;
    }

    if (scanline == PRERENDER_SCANLINE) {
        // everything visible has been drawn, hand it over
        std::swap(front_buffer, back_buffer);
        frame_count++;
        odd_frame = !odd_frame;
        return true;
    }
    return false;
}

/*
 * Background fetches for one dot. Every 8 dots the PPU reads the
 * nametable byte, attribute byte and both pattern planes for the
 * next tile, and the 16-bit shifters move one pixel to the left.
 * Dots 321-336 prefetch the first two tiles of the next line.
 */
void PPU::background_fetch() {
  if ((dot >= 2 && dot <= 257) || (dot >= 321 && dot <= 337)) {
    update_shifters();

    switch ((dot - 1) % 8) {
      case 0:
        load_background_shifters();
        next_tile_id = bus->ppu_read(0x2000 | (vram_addr & 0x0FFF));
        break;
      case 2: {
        uint8_t attribute = bus->ppu_read(0x23C0 | (vram_addr & 0x0C00) |
                                          ((vram_addr >> 4) & 0x38) | ((vram_addr >> 2) & 0x07));
        // pick the 2 bits for this tile's quadrant of the 32x32 block
        if (vram_addr & 0x0040) attribute >>= 4;
        if (vram_addr & 0x0002) attribute >>= 2;
        next_tile_attrib = attribute & 0x03;
        break;
      }
      case 4: {
        uint16_t table = (control & CTRL_BG_TABLE) ? 0x1000 : 0x0000;
        next_tile_lsb = bus->ppu_read(table + next_tile_id * 16 + ((vram_addr >> 12) & 0x07));
        break;
      }
      case 6: {
        uint16_t table = (control & CTRL_BG_TABLE) ? 0x1000 : 0x0000;
        next_tile_msb = bus->ppu_read(table + next_tile_id * 16 + ((vram_addr >> 12) & 0x07) + 8);
        break;
      }
      case 7:
        increment_scroll_x();
        break;
    }
  }

  if (dot == 256) {
    increment_scroll_y();
  }

  if (dot == 257) {
    load_background_shifters();
    transfer_address_x();
  }

  // unused nametable fetches at the end of the line
  if (dot == 338 || dot == 340) {
    next_tile_id = bus->ppu_read(0x2000 | (vram_addr & 0x0FFF));
  }

  if (scanline == PRERENDER_SCANLINE && dot >= 280 && dot <= 304) {
    transfer_address_y();
  }
}

void PPU::output_pixel() {
  int x = dot - 1; // 0 - 255
  int y = scanline; // 0 - 239

  uint8_t pixel = 0;
  uint8_t palette = 0;

  if ((mask & MASK_BG) && (x >= 8 || (mask & MASK_BG_LEFT))) {
    uint16_t bit = 0x8000 >> fine_x;
    pixel = ((shifter_pattern_lo & bit) ? 1 : 0) | ((shifter_pattern_hi & bit) ? 2 : 0);
    palette = ((shifter_attrib_lo & bit) ? 1 : 0) | ((shifter_attrib_hi & bit) ? 2 : 0);
  }

  // colour 0 of every palette is the shared backdrop at $3F00
  uint16_t palette_addr = 0x3F00;
  if (pixel != 0) {
    palette_addr += (palette << 2) | pixel;
  }

  uint8_t entry = bus->ppu_read(palette_addr);
  if (mask & MASK_GREYSCALE) {
    entry &= 0x30;
  }

  back_buffer[y * SCREEN_WIDTH + x] = nesColor(entry);
}

void PPU::update_shifters() {
  if (mask & MASK_BG) {
    shifter_pattern_lo <<= 1;
    shifter_pattern_hi <<= 1;
    shifter_attrib_lo <<= 1;
    shifter_attrib_hi <<= 1;
  }
}

void PPU::load_background_shifters() {
  shifter_pattern_lo = (shifter_pattern_lo & 0xFF00) | next_tile_lsb;
  shifter_pattern_hi = (shifter_pattern_hi & 0xFF00) | next_tile_msb;
  shifter_attrib_lo = (shifter_attrib_lo & 0xFF00) | ((next_tile_attrib & 0x01) ? 0xFF : 0x00);
  shifter_attrib_hi = (shifter_attrib_hi & 0xFF00) | ((next_tile_attrib & 0x02) ? 0xFF : 0x00);
}

void PPU::increment_scroll_x() {
  if ((vram_addr & 0x001F) == 31) {
    vram_addr &= ~0x001F;
    vram_addr ^= 0x0400; // switch horizontal nametable
  } else {
    vram_addr++;
  }
}

void PPU::increment_scroll_y() {
  if ((vram_addr & 0x7000) != 0x7000) {
    vram_addr += 0x1000; // fine Y
    return;
  }

  vram_addr &= ~0x7000;
  uint16_t coarse_y = (vram_addr & 0x03E0) >> 5;
  if (coarse_y == 29) {
    coarse_y = 0;
    vram_addr ^= 0x0800; // switch vertical nametable
  } else if (coarse_y == 31) {
    // out of range rows wrap without switching tables
    coarse_y = 0;
  } else {
    coarse_y++;
  }
  vram_addr = (vram_addr & ~0x03E0) | (coarse_y << 5);
}

void PPU::transfer_address_x() {
  vram_addr = (vram_addr & 0xFBE0) | (t_addr & 0x041F);
}

void PPU::transfer_address_y() {
  vram_addr = (vram_addr & 0x841F) | (t_addr & 0x7BE0);
}

uint8_t PPU::read_vram(uint16_t index) const {
  return name_tables[index & 0x07FF];
}

void PPU::write_vram(uint16_t index, uint8_t value) {
  name_tables[index & 0x07FF] = value;
}

// $3F10/$3F14/$3F18/$3F1C are the same bytes as $3F00/$3F04/$3F08/$3F0C
static uint8_t palette_index(uint16_t addr) {
  uint8_t index = addr & 0x1F;
  if ((index & 0x13) == 0x10) {
    index &= ~0x10;
  }
  return index;
}

uint8_t PPU::read_palette(uint16_t addr) const {
  return palette_RAM[palette_index(addr)];
}

void PPU::write_palette(uint16_t addr, uint8_t value) {
  palette_RAM[palette_index(addr)] = value & 0x3F;
}

const uint32_t* PPU::get_frame() const {
  return front_buffer.data();
}


// Color pallete function
uint32_t PPU::nesColor(uint8_t idx) {
    static const uint32_t nesColors[64] = {
        0x666666,0x002A88,0x1412A7,0x3B00A4,0x5C007E,0x6E0040,0x6C0700,0x561D00,
        0x333500,0x0B4800,0x005200,0x004F08,0x00404D,0x000000,0x000000,0x000000,
        0xADADAD,0x155FD9,0x4240FF,0x7527FE,0xA01ACC,0xB71E7B,0xB53120,0x994E00,
        0x6B6D00,0x388700,0x0E9300,0x008F32,0x007C8D,0x000000,0x000000,0x000000,
        0xFFFEFF,0x64B0FF,0x9290FF,0xC676FF,0xF36AFF,0xFE6ECC,0xFE8170,0xEA9E22,
        0xBCBE00,0x88D800,0x5CE430,0x45E082,0x48CDDE,0x4F4F4F,0x000000,0x000000,
        0xFFFEFF,0xC0DFFF,0xD3D2FF,0xE8C8FF,0xFBC2FF,0xFEC4EA,0xFECCC5,0xF7D8A5,
        0xE4E594,0xCFEF96,0xBDF4AB,0xB3F3CC,0xB5EBF2,0xB8B8B8,0x000000,0x000000
    };
    return 0xFF000000 | nesColors[idx % 64];
}


bool PPU::getNMI() {
  return NMI;
}

void PPU::setNMI(bool val) {
  NMI = val;
}
