#include "cartridge.h"

#include <fstream>
#include <utility>

static std::unique_ptr<Mapper> create_mapper(uint8_t mapper_id, std::vector<uint8_t> prg, std::vector<uint8_t> chr) {
  switch (mapper_id) {
    case 0:
      if (prg.size() != PRG_BANK_SIZE && prg.size() != 2 * PRG_BANK_SIZE) {
        throw CartridgeError("NROM needs 16KB or 32KB of PRG ROM, got " + std::to_string(prg.size()) + " bytes");
      }
      if (!chr.empty() && chr.size() != CHR_BANK_SIZE) {
        throw CartridgeError("NROM needs 0 or 8KB of CHR ROM, got " + std::to_string(chr.size()) + " bytes");
      }
      return std::unique_ptr<Mapper>(new Mapper0(std::move(prg), std::move(chr)));
    default:
      throw CartridgeError("unsupported mapper " + std::to_string(mapper_id));
  }
}

Cartridge::Cartridge(std::vector<uint8_t> prg, std::vector<uint8_t> chr, uint8_t id, Mirroring layout)
    : mapper_id(id), mirroring(layout), prg_size(prg.size()), chr_size(chr.size())
{
  if (prg.empty() || prg.size() % PRG_BANK_SIZE != 0) {
    throw CartridgeError("PRG ROM size " + std::to_string(prg.size()) + " is not a whole number of 16KB banks");
  }
  if (chr.size() % CHR_BANK_SIZE != 0) {
    throw CartridgeError("CHR ROM size " + std::to_string(chr.size()) + " is not a whole number of 8KB banks");
  }
  mapper = create_mapper(id, std::move(prg), std::move(chr));
}


// function to parse and load ROM
std::unique_ptr<Cartridge> load_ines(const std::string& filename) {
  std::ifstream file(filename, std::ios::binary); //opening file in binary mode and read
  if (!file) {
    throw RomError("can't open " + filename);
  }

  // Since read can only read char* we use reinterpret cast the header pointer.
  std::vector<uint8_t> header(16);
  file.read(reinterpret_cast<char*>(header.data()), header.size());
  if (!file) {
    throw RomError(filename + ": file is shorter than the 16 byte iNES header");
  }

  if (header[0] != 'N' || header[1] != 'E' || header[2] != 'S' || header[3] != 0x1A) {
    throw RomError(filename + ": missing iNES magic");
  }

  // take the 4 high nibbles of flags 6 and 7 and combine into one 8-bit value
  uint8_t high_map = (header.at(7) & 0xF0);
  uint8_t low_map = (header.at(6) & 0xF0) >> 4;
  uint8_t map = high_map | low_map;

  if (header.at(6) & 0x08) {
    throw RomError(filename + ": four-screen nametable layout is not supported");
  }
  bool vertical = (header.at(6) & 0x01) != 0;

  // 512 byte trainer sits between the header and PRG data
  if (header.at(6) & 0x04) {
    file.seekg(512, std::ios::cur);
  }

  size_t prg_size = header.at(4) * PRG_BANK_SIZE;
  std::vector<uint8_t> prg_data(prg_size);
  file.read(reinterpret_cast<char*>(prg_data.data()), prg_size);
  if (!file) {
    throw RomError(filename + ": truncated PRG ROM");
  }

  size_t chr_size = header.at(5) * CHR_BANK_SIZE;
  std::vector<uint8_t> chr_data(chr_size);
  if (chr_size > 0) {
    file.read(reinterpret_cast<char*>(chr_data.data()), chr_size);
    if (!file) {
      throw RomError(filename + ": truncated CHR ROM");
    }
  }

  return std::unique_ptr<Cartridge>(new Cartridge(std::move(prg_data), std::move(chr_data), map,
                                                  vertical ? Mirroring::Vertical : Mirroring::Horizontal));
}
