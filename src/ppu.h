#pragma once
#include <stdint.h>
#include <vector>

#define PPUCTRL 0x2000
#define PPUMASK 0x2001
#define PPUSTATUS 0x2002
#define OAMADDR 0x2003
#define OAMDATA 0x2004
#define PPUSCROLL 0x2005
#define PPUADDR 0x2006
#define PPUDATA 0x2007

// PPUCTRL bits
#define CTRL_NAMETABLE    0x03
#define CTRL_INCREMENT_32 0x04
#define CTRL_SPRITE_TABLE 0x08
#define CTRL_BG_TABLE     0x10
#define CTRL_SPRITE_SIZE  0x20
#define CTRL_NMI          0x80

// PPUMASK bits
#define MASK_GREYSCALE    0x01
#define MASK_BG_LEFT      0x02
#define MASK_SPRITES_LEFT 0x04
#define MASK_BG           0x08
#define MASK_SPRITES      0x10

// PPUSTATUS bits
#define STATUS_OVERFLOW   0x20
#define STATUS_SPRITE0    0x40
#define STATUS_VBLANK     0x80

#define SCREEN_WIDTH  256
#define SCREEN_HEIGHT 240

#define DOTS_PER_SCANLINE   341
#define SCANLINES_PER_FRAME 262
#define VBLANK_SCANLINE     241
#define PRERENDER_SCANLINE  261

class Bus; // forward declaration
class PPU
{
public:
  PPU();
  void connectBus(Bus*);
  void reset();

  // CPU facing registers, address already folded into $2000-$2007
  void write_register(uint16_t, uint8_t);
  uint8_t read_register(uint16_t);
  void oam_write(uint8_t);

  // Advance one dot. Returns true when this dot finished a frame.
  bool tick();

  bool getNMI();
  void setNMI(bool);

  // Most recently completed frame, 0xAARRGGBB, SCREEN_WIDTH * SCREEN_HEIGHT
  const uint32_t* get_frame() const;
  uint64_t get_frame_count() const { return frame_count; }

  // Hardware skips the last pre-render dot on odd frames while rendering
  void set_odd_frame_skip(bool enabled) { odd_frame_skip = enabled; }

  // Console side of the PPU address space, reached through the Bus
  uint8_t read_vram(uint16_t index) const;
  void write_vram(uint16_t index, uint8_t value);
  uint8_t read_palette(uint16_t addr) const;
  void write_palette(uint16_t addr, uint8_t value);

  static uint32_t nesColor(uint8_t);

  // Basic getters for debug purposes
  int get_scanline() const { return scanline; }
  int get_dot() const { return dot; }
  uint8_t get_control() const { return control; }
  uint8_t get_mask() const { return mask; }
  uint8_t get_status() const { return status; }
  uint16_t get_v() const { return vram_addr; }
  uint16_t get_t() const { return t_addr; }
  uint8_t get_fine_x() const { return fine_x; }
  bool get_write_toggle() const { return write_latch; }
  uint8_t get_oam(uint8_t index) const { return OAM[index]; }
  bool is_odd_frame() const { return odd_frame; }

private:
  bool rendering_enabled() const { return (mask & (MASK_BG | MASK_SPRITES)) != 0; }

  void background_fetch();
  void output_pixel();
  void update_shifters();
  void load_background_shifters();
  void increment_scroll_x();
  void increment_scroll_y();
  void transfer_address_x();
  void transfer_address_y();

    Bus* bus;

    uint8_t control;     // $2000 - PPUCTRL
    uint8_t mask;        // $2001 - PPUMASK
    uint8_t status;      // $2002 - PPUSTATUS
    uint8_t oam_addr;    // $2003 - OAMADDR
    uint8_t io_latch;    // last value written to any register, read back as open bus
    uint8_t buffer;      // read buffer for $2007

    /*
     * Internal scroll registers ("loopy" registers)
     *
     * v and t are 15 bits wide:
     *   yyy NN YYYYY XXXXX
     *   ||| || ||||| +++++-- coarse X scroll (tile column)
     *   ||| || +++++-------- coarse Y scroll (tile row)
     *   ||| ++-------------- nametable select
     *   +++----------------- fine Y scroll
     *
     * v is the address the PPU is about to use, t holds the top left
     * of the screen until it is copied into v. x is the fine X scroll.
     * w picks the first or second half of a $2005/$2006 write pair.
     */
    uint16_t vram_addr;  // v
    uint16_t t_addr;     // t
    uint8_t fine_x;      // x
    bool write_latch;    // w

    int scanline;        // 0-239 visible, 240 post-render, 241-260 vblank, 261 pre-render
    int dot;             // 0-340, the dot the next tick() processes
    bool odd_frame;
    bool odd_frame_skip;
    bool NMI; //non-maskable interrupt
    uint64_t frame_count;

    // Background pipeline
    uint8_t next_tile_id;
    uint8_t next_tile_attrib;
    uint8_t next_tile_lsb;
    uint8_t next_tile_msb;
    uint16_t shifter_pattern_lo;
    uint16_t shifter_pattern_hi;
    uint16_t shifter_attrib_lo;
    uint16_t shifter_attrib_hi;

  //2 Name Tables - (2) * 1 KB, mirrored into 4 windows by the Bus
  uint8_t name_tables[0x800];

  //Palette RAM - 32 Bytes
  uint8_t palette_RAM[32]; // $3F00-$3F1F

  //OAM 64 sprites = (64) * 4 bytes = 256 bytes
  uint8_t OAM[256];

  /*  The 4 bytes:
   *  Byte 0 - Y position of top of sprite (sprite data delayed one scanline)
   *  Byte 1 - Tile index number (bits 7-1 for number. bit 0 for bank of tiles)
   *  Byte 2 - Attributes
   *  Byte 3 - X position of left of sprite
   * */

  // The PPU draws into back_buffer; it is swapped to the front when a frame
  // completes so the presented image is never touched mid-frame.
  std::vector<uint32_t> front_buffer;
  std::vector<uint32_t> back_buffer;
};


/*
 * When reading or writing on an address in the PPU
 * It's modulo'd by 8 to choose any of the 8 registers

 * PPU REGISTERS
 * --------------------------
 * PPUCTRL (write) - Address: 0x2000 - Nametable select, increment, pattern tables, NMI enable
 *
 * PPUMASK (write) - Address: 0x2001 - Used for rendering settings
 *
 * PPUSTATUS (read) - Address: 0x2002 - Reading clears vblank and resets w
 *
 * OAMADDR (write) - Address: 0x2003 - Sprite RAM address
 *
 * OAMDATA (read/write) - Address: 0x2004 - Sprite RAM data
 *
 * PPUSCROLL (write x2) - Address: 0x2005 - X and Y scroll
 *
 * PPUADDR (write x2) - Address: 0x2006 - VRAM address, high byte first
 *
 * PPUDATA (read/write) - Address: 0x2007 - VRAM data, v += 1 or 32 after each access
 *
 * OAMDMA (write) - Address: 0x4014 - Sprite DMA, handled by the Bus
 */
