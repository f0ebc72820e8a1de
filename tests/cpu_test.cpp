#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <memory>

#include "bus.h"
#include "cpu.h"
#include "rom_fixture.h"

// CPU on a bare bus: RAM and cartridge only, no PPU or controllers
class CPUTest : public ::testing::Test {
protected:
  void boot(const RomBuilder& rom) {
    bus.reset(new Bus(rom.build()));
    cpu.connectBus(bus.get());
    cpu.reset();
  }

  std::unique_ptr<Bus> bus;
  CPU cpu;
};

TEST_F(CPUTest, ResetLoadsVectorAndPowerOnState) {
  RomBuilder rom;
  rom.vector(RESET_VECTOR, 0x8123);
  boot(rom);

  EXPECT_EQ(cpu.get_PC(), 0x8123);
  EXPECT_EQ(cpu.get_SP(), 0xFD);
  EXPECT_EQ(cpu.get_P(), 0x24);
  EXPECT_EQ(cpu.get_A(), 0);
  EXPECT_EQ(cpu.get_cycles(), 7u);
  EXPECT_FALSE(cpu.halted());
}

TEST_F(CPUTest, LoadSetsZeroAndNegative) {
  RomBuilder rom;
  rom.code(0x8000, {0xA9, 0x00, 0xA9, 0x80});
  boot(rom);

  cpu.step();
  EXPECT_TRUE(cpu.get_flag(FLAG_ZERO));
  EXPECT_FALSE(cpu.get_flag(FLAG_NEGATIVE));

  cpu.step();
  EXPECT_EQ(cpu.get_A(), 0x80);
  EXPECT_FALSE(cpu.get_flag(FLAG_ZERO));
  EXPECT_TRUE(cpu.get_flag(FLAG_NEGATIVE));
}

TEST_F(CPUTest, BaseCycleCounts) {
  RomBuilder rom;
  rom.code(0x8000, {
    0xA9, 0x01,       // LDA #$01      2
    0x85, 0x10,       // STA $10       3
    0xAD, 0x00, 0x02, // LDA $0200     4
    0xEE, 0x00, 0x02, // INC $0200     6
    0x0A,             // ASL A         2
    0x20, 0x00, 0x90, // JSR $9000     6
  });
  rom.code(0x9000, {0x60}); // RTS     6
  boot(rom);

  EXPECT_EQ(cpu.step(), 2u);
  EXPECT_EQ(cpu.step(), 3u);
  EXPECT_EQ(cpu.step(), 4u);
  EXPECT_EQ(cpu.step(), 6u);
  EXPECT_EQ(cpu.step(), 2u);
  EXPECT_EQ(cpu.step(), 6u);
  EXPECT_EQ(cpu.step(), 6u);
  EXPECT_EQ(cpu.get_cycles(), 7u + 29u);
}

TEST_F(CPUTest, IndexedReadAcrossPageCostsOneMore) {
  RomBuilder rom;
  rom.code(0x8000, {
    0xA2, 0x01,       // LDX #$01
    0xBD, 0x00, 0x02, // LDA $0200,X
    0xBD, 0xFF, 0x02, // LDA $02FF,X
    0xA0, 0x01,       // LDY #$01
    0xB1, 0x20,       // LDA ($20),Y
  });
  boot(rom);
  bus->write(0x0020, 0xFF);
  bus->write(0x0021, 0x03);
  bus->write(0x0400, 0x99);

  cpu.step();
  EXPECT_EQ(cpu.step(), 4u);
  EXPECT_EQ(cpu.step(), 5u);
  cpu.step();
  EXPECT_EQ(cpu.step(), 6u);
  EXPECT_EQ(cpu.get_A(), 0x99);
}

TEST_F(CPUTest, StoreIndexedAlwaysPaysFiveCycles) {
  RomBuilder rom;
  rom.code(0x8000, {0xA2, 0x01, 0x9D, 0x00, 0x02});
  boot(rom);

  cpu.step();
  EXPECT_EQ(cpu.step(), 5u);
}

TEST_F(CPUTest, BranchCycles) {
  RomBuilder rom;
  rom.vector(RESET_VECTOR, 0x80F0);
  rom.code(0x80F0, {
    0x18,       // CLC
    0xB0, 0x10, // BCS, not taken
    0x90, 0x02, // BCC +2, same page
    0xEA, 0xEA,
    0x90, 0x10, // BCC +16, into the next page
  });
  boot(rom);

  cpu.step();
  EXPECT_EQ(cpu.step(), 2u);
  EXPECT_EQ(cpu.get_PC(), 0x80F3);

  EXPECT_EQ(cpu.step(), 3u);
  EXPECT_EQ(cpu.get_PC(), 0x80F7);

  EXPECT_EQ(cpu.step(), 4u);
  EXPECT_EQ(cpu.get_PC(), 0x8109);
}

TEST_F(CPUTest, BackwardBranch) {
  RomBuilder rom;
  rom.code(0x8000, {
    0xA2, 0x03, // LDX #$03
    0xCA,       // DEX
    0xD0, 0xFD, // BNE -3
  });
  boot(rom);

  cpu.step();
  for (int i = 0; i < 6; i++) {
    cpu.step();
  }
  EXPECT_EQ(cpu.get_X(), 0);
  EXPECT_EQ(cpu.get_PC(), 0x8005);
}

TEST_F(CPUTest, StackWrapsInsidePageOne) {
  RomBuilder rom;
  rom.code(0x8000, {
    0xA2, 0x00, // LDX #$00
    0x9A,       // TXS
    0xA9, 0x42, // LDA #$42
    0x48,       // PHA
    0xA9, 0x00, // LDA #$00
    0x68,       // PLA
  });
  boot(rom);

  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_SP(), 0x00);

  cpu.step();
  cpu.step();
  EXPECT_EQ(bus->read(0x0100), 0x42);
  EXPECT_EQ(cpu.get_SP(), 0xFF);

  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_A(), 0x42);
  EXPECT_EQ(cpu.get_SP(), 0x00);
}

TEST_F(CPUTest, JsrPushesReturnMinusOne) {
  RomBuilder rom;
  rom.code(0x8000, {0x20, 0x00, 0x90});
  rom.code(0x9000, {0x60});
  boot(rom);

  cpu.step();
  EXPECT_EQ(cpu.get_PC(), 0x9000);
  EXPECT_EQ(cpu.get_SP(), 0xFB);
  EXPECT_EQ(bus->read(0x01FD), 0x80);
  EXPECT_EQ(bus->read(0x01FC), 0x02);

  cpu.step();
  EXPECT_EQ(cpu.get_PC(), 0x8003);
  EXPECT_EQ(cpu.get_SP(), 0xFD);
}

TEST_F(CPUTest, AdcSetsOverflowOnSignedWrap) {
  RomBuilder rom;
  rom.code(0x8000, {0xA9, 0x50, 0x69, 0x50});
  boot(rom);

  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_A(), 0xA0);
  EXPECT_TRUE(cpu.get_flag(FLAG_OVERFLOW));
  EXPECT_TRUE(cpu.get_flag(FLAG_NEGATIVE));
  EXPECT_FALSE(cpu.get_flag(FLAG_CARRY));
}

TEST_F(CPUTest, SbcBorrowClearsCarry) {
  RomBuilder rom;
  rom.code(0x8000, {0x38, 0xA9, 0x00, 0xE9, 0x01});
  boot(rom);

  cpu.step();
  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_A(), 0xFF);
  EXPECT_FALSE(cpu.get_flag(FLAG_CARRY));
  EXPECT_TRUE(cpu.get_flag(FLAG_NEGATIVE));
  EXPECT_FALSE(cpu.get_flag(FLAG_OVERFLOW));
}

TEST_F(CPUTest, CompareSetsCarryWhenRegisterIsLarger) {
  RomBuilder rom;
  rom.code(0x8000, {0xA9, 0x40, 0xC9, 0x40, 0xC9, 0x41});
  boot(rom);

  cpu.step();
  cpu.step();
  EXPECT_TRUE(cpu.get_flag(FLAG_ZERO));
  EXPECT_TRUE(cpu.get_flag(FLAG_CARRY));

  cpu.step();
  EXPECT_FALSE(cpu.get_flag(FLAG_ZERO));
  EXPECT_FALSE(cpu.get_flag(FLAG_CARRY));
  EXPECT_TRUE(cpu.get_flag(FLAG_NEGATIVE));
}

TEST_F(CPUTest, RotateThroughCarry) {
  RomBuilder rom;
  rom.code(0x8000, {
    0x38,       // SEC
    0xA9, 0x80, // LDA #$80
    0x2A,       // ROL A
    0x66, 0x10, // ROR $10
  });
  boot(rom);
  bus->write(0x0010, 0x02);

  cpu.step();
  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_A(), 0x01);
  EXPECT_TRUE(cpu.get_flag(FLAG_CARRY));

  cpu.step();
  EXPECT_EQ(bus->read(0x0010), 0x81);
  EXPECT_FALSE(cpu.get_flag(FLAG_CARRY));
}

TEST_F(CPUTest, JmpIndirectDoesNotCrossPage) {
  RomBuilder rom;
  rom.code(0x8000, {0x6C, 0xFF, 0x02});
  boot(rom);
  bus->write(0x02FF, 0x34);
  bus->write(0x0200, 0x12);
  bus->write(0x0300, 0x56);

  EXPECT_EQ(cpu.step(), 5u);
  EXPECT_EQ(cpu.get_PC(), 0x1234);
}

TEST_F(CPUTest, ZeroPageIndexWrapsInPageZero) {
  RomBuilder rom;
  rom.code(0x8000, {0xA2, 0x10, 0xB5, 0xF8});
  boot(rom);
  bus->write(0x0008, 0x77);
  bus->write(0x0108, 0x11);

  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_A(), 0x77);
}

TEST_F(CPUTest, IllegalOpcodeHaltsAtItsAddress) {
  RomBuilder rom;
  rom.code(0x8000, {0xEA, 0x02});
  boot(rom);

  cpu.step();
  uint64_t cycles = cpu.get_cycles();
  EXPECT_EQ(cpu.step(), 0u);
  EXPECT_TRUE(cpu.halted());
  EXPECT_EQ(cpu.get_bad_address(), 0x8001);
  EXPECT_EQ(cpu.get_PC(), 0x8001);
  EXPECT_EQ(cpu.get_cycles(), cycles);

  // stays halted
  EXPECT_EQ(cpu.step(), 0u);
  EXPECT_EQ(cpu.get_PC(), 0x8001);

  cpu.reset();
  EXPECT_FALSE(cpu.halted());
  EXPECT_EQ(cpu.get_PC(), 0x8000);
}

TEST_F(CPUTest, NmiPushesStateAndJumps) {
  RomBuilder rom;
  rom.vector(NMI_VECTOR, 0x9000);
  boot(rom);

  cpu.nmi();
  EXPECT_EQ(cpu.step(), 7u);
  EXPECT_EQ(cpu.get_PC(), 0x9000);
  EXPECT_EQ(cpu.get_SP(), 0xFA);
  EXPECT_EQ(bus->read(0x01FD), 0x80);
  EXPECT_EQ(bus->read(0x01FC), 0x00);
  uint8_t pushed = bus->read(0x01FB);
  EXPECT_EQ(pushed & FLAG_BREAK, 0);
  EXPECT_EQ(pushed & FLAG_UNUSED, FLAG_UNUSED);
  EXPECT_TRUE(cpu.get_flag(FLAG_INTERRUPT));

  // serviced once
  EXPECT_EQ(cpu.step(), 2u);
  EXPECT_EQ(cpu.get_PC(), 0x9001);
}

TEST_F(CPUTest, RtiRestoresStatusAndPC) {
  RomBuilder rom;
  rom.vector(NMI_VECTOR, 0x9000);
  rom.code(0x8000, {0x38});       // SEC
  rom.code(0x9000, {0x18, 0x40}); // CLC, RTI
  boot(rom);

  cpu.step();
  cpu.nmi();
  cpu.step();
  cpu.step();
  EXPECT_FALSE(cpu.get_flag(FLAG_CARRY));
  EXPECT_EQ(cpu.step(), 6u);
  EXPECT_EQ(cpu.get_PC(), 0x8001);
  EXPECT_TRUE(cpu.get_flag(FLAG_CARRY));
  EXPECT_EQ(cpu.get_SP(), 0xFD);
}

TEST_F(CPUTest, IrqIsMaskedByInterruptDisable) {
  RomBuilder rom;
  rom.vector(IRQ_VECTOR, 0x9000);
  rom.code(0x8000, {0xEA, 0x58, 0xEA});
  boot(rom);

  cpu.set_irq(true);
  EXPECT_EQ(cpu.step(), 2u); // I is set after reset
  EXPECT_EQ(cpu.get_PC(), 0x8001);

  cpu.step(); // CLI
  EXPECT_EQ(cpu.step(), 7u);
  EXPECT_EQ(cpu.get_PC(), 0x9000);
  EXPECT_TRUE(cpu.get_flag(FLAG_INTERRUPT));
}

TEST_F(CPUTest, BrkPushesBreakFlag) {
  RomBuilder rom;
  rom.vector(IRQ_VECTOR, 0x9000);
  rom.code(0x8000, {0x00});
  boot(rom);

  EXPECT_EQ(cpu.step(), 7u);
  EXPECT_EQ(cpu.get_PC(), 0x9000);
  EXPECT_EQ(bus->read(0x01FD), 0x80);
  EXPECT_EQ(bus->read(0x01FC), 0x02);
  EXPECT_EQ(bus->read(0x01FB) & FLAG_BREAK, FLAG_BREAK);
}

TEST_F(CPUTest, PhpAndPlpHandleBreakBit) {
  RomBuilder rom;
  rom.code(0x8000, {
    0x08,       // PHP
    0xA9, 0xFF, // LDA #$FF
    0x48,       // PHA
    0x28,       // PLP
  });
  boot(rom);

  cpu.step();
  EXPECT_EQ(bus->read(0x01FD), 0x34);

  cpu.step();
  cpu.step();
  cpu.step();
  EXPECT_EQ(cpu.get_P(), 0xEF);
}

TEST_F(CPUTest, OamDmaStallsTheCpu) {
  RomBuilder rom;
  rom.code(0x8000, {0xA9, 0x02, 0x8D, 0x14, 0x40});
  boot(rom);

  cpu.step();
  // STA ends on cycle 13, odd, so the stall is 514
  EXPECT_EQ(cpu.step(), 4u + 514u);
}

TEST_F(CPUTest, TraceWritesOneLinePerInstruction) {
  RomBuilder rom;
  rom.code(0x8000, {0xA9, 0x05, 0x8D, 0x00, 0x02});
  boot(rom);

  FILE* log = tmpfile();
  ASSERT_NE(log, nullptr);
  cpu.set_trace(log);
  cpu.step();
  cpu.step();
  cpu.set_trace(nullptr);

  rewind(log);
  char line[128];
  ASSERT_NE(fgets(line, sizeof(line), log), nullptr);
  EXPECT_STREQ(line, "8000  A9 05     LDA  A:00 X:00 Y:00 P:24 SP:FD CYC:7\n");
  ASSERT_NE(fgets(line, sizeof(line), log), nullptr);
  EXPECT_STREQ(line, "8002  8D 00 02  STA  A:05 X:00 Y:00 P:24 SP:FD CYC:9\n");
  fclose(log);
}

namespace {

struct OpcodeCost {
  uint8_t opcode;
  uint32_t cycles;
};

// Documented base costs. Operands are $00 / $0200, X = Y = 0, so nothing crosses a page.
const OpcodeCost OFFICIAL_COSTS[] = {
  {0x69, 2}, {0x65, 3}, {0x75, 4}, {0x6D, 4}, {0x7D, 4}, {0x79, 4}, {0x61, 6}, {0x71, 5}, // ADC
  {0x29, 2}, {0x25, 3}, {0x35, 4}, {0x2D, 4}, {0x3D, 4}, {0x39, 4}, {0x21, 6}, {0x31, 5}, // AND
  {0x0A, 2}, {0x06, 5}, {0x16, 6}, {0x0E, 6}, {0x1E, 7},                                  // ASL
  {0x24, 3}, {0x2C, 4},                                                                   // BIT
  {0x00, 7},                                                                              // BRK
  {0x18, 2}, {0xD8, 2}, {0x58, 2}, {0xB8, 2},                                             // CLC CLD CLI CLV
  {0xC9, 2}, {0xC5, 3}, {0xD5, 4}, {0xCD, 4}, {0xDD, 4}, {0xD9, 4}, {0xC1, 6}, {0xD1, 5}, // CMP
  {0xE0, 2}, {0xE4, 3}, {0xEC, 4},                                                        // CPX
  {0xC0, 2}, {0xC4, 3}, {0xCC, 4},                                                        // CPY
  {0xC6, 5}, {0xD6, 6}, {0xCE, 6}, {0xDE, 7},                                             // DEC
  {0xCA, 2}, {0x88, 2},                                                                   // DEX DEY
  {0x49, 2}, {0x45, 3}, {0x55, 4}, {0x4D, 4}, {0x5D, 4}, {0x59, 4}, {0x41, 6}, {0x51, 5}, // EOR
  {0xE6, 5}, {0xF6, 6}, {0xEE, 6}, {0xFE, 7},                                             // INC
  {0xE8, 2}, {0xC8, 2},                                                                   // INX INY
  {0x4C, 3}, {0x6C, 5}, {0x20, 6},                                                        // JMP JSR
  {0xA9, 2}, {0xA5, 3}, {0xB5, 4}, {0xAD, 4}, {0xBD, 4}, {0xB9, 4}, {0xA1, 6}, {0xB1, 5}, // LDA
  {0xA2, 2}, {0xA6, 3}, {0xB6, 4}, {0xAE, 4}, {0xBE, 4},                                  // LDX
  {0xA0, 2}, {0xA4, 3}, {0xB4, 4}, {0xAC, 4}, {0xBC, 4},                                  // LDY
  {0x4A, 2}, {0x46, 5}, {0x56, 6}, {0x4E, 6}, {0x5E, 7},                                  // LSR
  {0xEA, 2},                                                                              // NOP
  {0x09, 2}, {0x05, 3}, {0x15, 4}, {0x0D, 4}, {0x1D, 4}, {0x19, 4}, {0x01, 6}, {0x11, 5}, // ORA
  {0x48, 3}, {0x08, 3}, {0x68, 4}, {0x28, 4},                                             // PHA PHP PLA PLP
  {0x2A, 2}, {0x26, 5}, {0x36, 6}, {0x2E, 6}, {0x3E, 7},                                  // ROL
  {0x6A, 2}, {0x66, 5}, {0x76, 6}, {0x6E, 6}, {0x7E, 7},                                  // ROR
  {0x40, 6}, {0x60, 6},                                                                   // RTI RTS
  {0xE9, 2}, {0xE5, 3}, {0xF5, 4}, {0xED, 4}, {0xFD, 4}, {0xF9, 4}, {0xE1, 6}, {0xF1, 5}, // SBC
  {0x38, 2}, {0xF8, 2}, {0x78, 2},                                                        // SEC SED SEI
  {0x85, 3}, {0x95, 4}, {0x8D, 4}, {0x9D, 5}, {0x99, 5}, {0x81, 6}, {0x91, 6},            // STA
  {0x86, 3}, {0x96, 4}, {0x8E, 4},                                                        // STX
  {0x84, 3}, {0x94, 4}, {0x8C, 4},                                                        // STY
  {0xAA, 2}, {0xA8, 2}, {0xBA, 2}, {0x8A, 2}, {0x9A, 2}, {0x98, 2},                       // TAX TAY TSX TXA TXS TYA
};

struct BranchCost {
  uint8_t opcode;
  uint8_t flag;
  bool flag_set; // state that keeps the branch from being taken
};

const BranchCost BRANCHES[] = {
  {0x90, FLAG_CARRY, true},     // BCC
  {0xB0, FLAG_CARRY, false},    // BCS
  {0xF0, FLAG_ZERO, false},     // BEQ
  {0xD0, FLAG_ZERO, true},      // BNE
  {0x30, FLAG_NEGATIVE, false}, // BMI
  {0x10, FLAG_NEGATIVE, true},  // BPL
  {0x70, FLAG_OVERFLOW, false}, // BVS
  {0x50, FLAG_OVERFLOW, true},  // BVC
};

}  // namespace

TEST_F(CPUTest, EveryOfficialOpcodeCostsItsBaseCycles) {
  for (const OpcodeCost& entry : OFFICIAL_COSTS) {
    SCOPED_TRACE(testing::Message() << "opcode 0x" << std::hex << (int)entry.opcode);
    RomBuilder rom;
    rom.code(0x8000, {entry.opcode, 0x00, 0x02});
    boot(rom);

    EXPECT_EQ(cpu.step(), entry.cycles);
    EXPECT_FALSE(cpu.halted());
  }
}

TEST_F(CPUTest, EveryBranchNotTakenCostsTwo) {
  for (const BranchCost& entry : BRANCHES) {
    SCOPED_TRACE(testing::Message() << "opcode 0x" << std::hex << (int)entry.opcode);
    RomBuilder rom;
    rom.code(0x8000, {entry.opcode, 0x10});
    boot(rom);
    cpu.set_flag(entry.flag, entry.flag_set);

    EXPECT_EQ(cpu.step(), 2u);
    EXPECT_EQ(cpu.get_PC(), 0x8002);
  }
}

TEST_F(CPUTest, OnlyOfficialOpcodesDecode) {
  bool official[256] = {false};
  for (const OpcodeCost& entry : OFFICIAL_COSTS) {
    official[entry.opcode] = true;
  }
  for (const BranchCost& entry : BRANCHES) {
    official[entry.opcode] = true;
  }

  int count = 0;
  for (int opcode = 0; opcode < 256; opcode++) {
    if (official[opcode]) {
      count++;
      continue;
    }
    SCOPED_TRACE(testing::Message() << "opcode 0x" << std::hex << opcode);
    RomBuilder rom;
    rom.code(0x8000, {(uint8_t)opcode, 0x00, 0x02});
    boot(rom);

    EXPECT_EQ(cpu.step(), 0u);
    EXPECT_TRUE(cpu.halted());
  }
  EXPECT_EQ(count, 151);
}

TEST_F(CPUTest, AbsoluteYReadAcrossPageCostsOneMore) {
  RomBuilder rom;
  rom.code(0x8000, {
    0xA0, 0x01,       // LDY #$01
    0xB9, 0x00, 0x02, // LDA $0200,Y
    0xB9, 0xFF, 0x02, // LDA $02FF,Y
  });
  boot(rom);
  bus->write(0x0300, 0x5C);

  cpu.step();
  EXPECT_EQ(cpu.step(), 4u);
  EXPECT_EQ(cpu.step(), 5u);
  EXPECT_EQ(cpu.get_A(), 0x5C);
}

TEST_F(CPUTest, ReadModifyWriteIndexedHasNoPagePenalty) {
  RomBuilder rom;
  rom.code(0x8000, {
    0xA2, 0x01,       // LDX #$01
    0xFE, 0xFF, 0x02, // INC $02FF,X
    0x1E, 0xFF, 0x02, // ASL $02FF,X
  });
  boot(rom);
  bus->write(0x0300, 0x40);

  cpu.step();
  EXPECT_EQ(cpu.step(), 7u);
  EXPECT_EQ(bus->read(0x0300), 0x41);
  EXPECT_EQ(cpu.step(), 7u);
  EXPECT_EQ(bus->read(0x0300), 0x82);
}
