#include "nes.h"

#include <utility>

const int NES::PPU_DOTS_PER_CPU_CYCLE = 3; // NTSC

NES::NES(std::unique_ptr<Cartridge> cartridge)
    : bus(std::move(cartridge)), frame_ready(false)
{
  bus.connectPPU(&ppu);
  bus.connectInput(&input);
  ppu.connectBus(&bus);
  cpu.connectBus(&bus);

  cpu.reset();
  run_ppu((uint32_t)cpu.get_cycles());
}

void NES::reset() {
  ppu.reset();
  cpu.reset();
  frame_ready = false;
  // the reset sequence takes 7 cycles, the PPU runs through them too
  run_ppu((uint32_t)cpu.get_cycles());
}

// For every CPU cycle, tick the PPU 3 times
void NES::run_ppu(uint32_t cpu_cycles) {
  for (uint32_t i = 0; i < cpu_cycles * PPU_DOTS_PER_CPU_CYCLE; ++i) {
    if (ppu.tick()) {
      frame_ready = true;
    }
  }
}

uint32_t NES::step() {
  uint32_t used = cpu.step();
  run_ppu(used);

  // vblank started during that instruction, take it before the next fetch
  if (ppu.getNMI()) {
    ppu.setNMI(false);
    cpu.nmi();
  }

  return used;
}

bool NES::run_frame(FrameSink* sink) {
  while (!frame_ready) {
    if (cpu.halted()) {
      return false;
    }
    step();
  }

  frame_ready = false;
  if (sink) {
    sink->present(ppu.get_frame());
  }
  return true;
}
