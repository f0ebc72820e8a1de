#pragma once
#include <memory>
#include <stdint.h>

#include "bus.h"
#include "cartridge.h"
#include "cpu.h"
#include "input.h"
#include "ppu.h"

// Whoever shows the picture. Called once per completed frame with
// SCREEN_WIDTH * SCREEN_HEIGHT ARGB pixels that stay valid until the next frame.
class FrameSink {
public:
    virtual void present(const uint32_t* pixels) = 0;
    virtual ~FrameSink() = default;
};

/*
 * One console. Owns the CPU, PPU, bus and controller ports and keeps
 * the CPU and PPU in lockstep: every CPU cycle is followed by
 * PPU_DOTS_PER_CPU_CYCLE dots before the next instruction starts.
 */
class NES {
public:
    static const int PPU_DOTS_PER_CPU_CYCLE;

    explicit NES(std::unique_ptr<Cartridge> cartridge);

    void reset();

    // One instruction (or interrupt entry) plus its dots. Returns CPU cycles, 0 when halted.
    uint32_t step();

    // Run until the PPU finishes a frame, then hand it to sink.
    // Returns false if the CPU halted on a bad opcode first.
    bool run_frame(FrameSink* sink = nullptr);

    const uint32_t* frame_buffer() const { return ppu.get_frame(); }
    uint64_t frame_count() const { return ppu.get_frame_count(); }

    void set_irq(bool asserted) { cpu.set_irq(asserted); }

    CPU& get_cpu() { return cpu; }
    PPU& get_ppu() { return ppu; }
    Bus& get_bus() { return bus; }
    Input& get_input() { return input; }

private:
    void run_ppu(uint32_t cpu_cycles);

    PPU ppu;
    Input input;
    Bus bus;
    CPU cpu;
    bool frame_ready;
};
