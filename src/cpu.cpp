#include "cpu.h"

#include "bus.h"

CPU::CPU() : bus(nullptr), trace(nullptr) {
  A = 0x0;
  X = 0x0;
  Y = 0x0;
  SP = 0xFD;
  P = FLAG_INTERRUPT | FLAG_UNUSED;
  PC = 0;

  cycles = 0;
  address = 0;
  page_crossed = false;
  accumulator_mode = false;
  extra_cycles = 0;
  nmi_pending = false;
  irq_line = false;
  bad_instruction = false;
  bad_address = 0;
  currentOpcode = 0;

  init_opcode_table();
}

void CPU::connectBus(Bus* bus_ref) {
  bus = bus_ref;
}

/*
 * setting flag bits on or off based on
 * the flag macro constants
 *
 * set_flag(FLAG_CARRY, true)
 */
void CPU::set_flag(uint8_t flag, bool condition) {
    if (condition)
        P |= flag;
    else
        P &= ~flag;
}

bool CPU::get_flag(uint8_t flag) const {
  return (P & flag) != 0;
}

// All memory traffic goes through the bus
uint8_t CPU::read(uint16_t addr) {
  return bus->read(addr);
}

void CPU::write(uint16_t addr, uint8_t value) {
  bus->write(addr, value);
}

uint16_t CPU::read16(uint16_t addr) {
  return read(addr) | (read((uint16_t)(addr + 1)) << 8);
}

// Push a value onto the stack
void CPU::push(uint8_t value) {
  write(0x100 + SP, value);
  SP--; // wraps 0x00 -> 0xFF, still in page 1
}

/*
 * Remove the current value pointed to
 * from the stack and return the removed
 * value
 */
uint8_t CPU::pop() {
  SP++;
  return read(0x100 + SP);
}

void CPU::reset() {
  A = 0;
  X = 0;
  Y = 0;
  SP = 0xFD;
  P = FLAG_INTERRUPT | FLAG_UNUSED;
  PC = read16(RESET_VECTOR);

  nmi_pending = false;
  irq_line = false;
  bad_instruction = false;
  bad_address = 0;
  cycles = 7; // the reset sequence itself
}

void CPU::nmi() {
  nmi_pending = true;
}

void CPU::set_irq(bool asserted) {
  irq_line = asserted;
}

// Push PC and status, set I, jump through the vector
void CPU::interrupt(uint16_t vector, bool brk) {
  push((PC >> 8) & 0xFF); // push high byte of PC
  push(PC & 0xFF);        // push low byte of PC
  if (brk) {
    push(P | FLAG_BREAK | FLAG_UNUSED);
  } else {
    push((P & ~FLAG_BREAK) | FLAG_UNUSED);
  }
  set_flag(FLAG_INTERRUPT, true);
  PC = read16(vector);
}

uint8_t CPU::fetch() {
  currentOpcode = read(PC);
  PC++; //read opcode, then increment PC
  return currentOpcode;
}

uint32_t CPU::step() {
  if (bad_instruction) {
    return 0;
  }

  uint64_t start = cycles;

  // interrupts are only looked at between instructions
  if (nmi_pending) {
    nmi_pending = false;
    interrupt(NMI_VECTOR, false);
    cycles += 7;
    return (uint32_t)(cycles - start);
  }
  if (irq_line && !get_flag(FLAG_INTERRUPT)) {
    interrupt(IRQ_VECTOR, false);
    cycles += 7;
    return (uint32_t)(cycles - start);
  }

  uint16_t opcode_pc = PC;
  const Instruction& instruction = opcode_table[fetch()];

  if (trace) {
    trace_instruction(opcode_pc, instruction);
  }

  page_crossed = false;
  accumulator_mode = false;
  extra_cycles = 0;

  (this->*instruction.addrmode)();
  (this->*instruction.operate)();

  if (bad_instruction) {
    return 0;
  }

  cycles += instruction.cycles + extra_cycles;
  if (instruction.page_penalty && page_crossed) {
    cycles += 1;
  }

  // $4014 was written: the CPU sits out the 256 byte copy
  if (bus->take_dma_request()) {
    cycles += DMA_STALL_CYCLES + (cycles & 1);
  }

  return (uint32_t)(cycles - start);
}

void CPU::illegal_instruction() {
    bad_address = PC - 1;
    fprintf(stderr, "Illegal opcode 0x%02X at PC=0x%04X\n", currentOpcode, bad_address); // Tracking opcode and location
    PC = bad_address;
    bad_instruction = true;
}

void CPU::trace_instruction(uint16_t pc, const Instruction& instruction) {
  int length = 1;
  if (instruction.addrmode == &CPU::mode_absolute || instruction.addrmode == &CPU::mode_absolute_x ||
      instruction.addrmode == &CPU::mode_absolute_y || instruction.addrmode == &CPU::mode_indirect) {
    length = 3;
  } else if (instruction.addrmode != &CPU::mode_implied && instruction.addrmode != &CPU::mode_accumulator) {
    length = 2;
  }

  fprintf(trace, "%04X  %02X", pc, currentOpcode);
  for (int i = 1; i < 3; i++) {
    if (i < length) {
      fprintf(trace, " %02X", read((uint16_t)(pc + i)));
    } else {
      fprintf(trace, "   ");
    }
  }
  fprintf(trace, "  %s  A:%02X X:%02X Y:%02X P:%02X SP:%02X CYC:%llu\n",
          instruction.name, A, X, Y, P, SP, (unsigned long long)cycles);
}

void CPU::set_opcode(uint8_t opcode, const char* name, void (CPU::*operate)(),
                     void (CPU::*addrmode)(), uint8_t base_cycles, bool page_penalty) {
  Instruction& entry = opcode_table[opcode];
  entry.name = name;
  entry.operate = operate;
  entry.addrmode = addrmode;
  entry.cycles = base_cycles;
  entry.page_penalty = page_penalty;
}

/*
 * Official opcodes only. Everything else decodes to illegal_instruction,
 * which halts the CPU and reports the address.
 */
void CPU::init_opcode_table() {
  for (int i = 0; i < 256; ++i) {
    set_opcode(i, "???", &CPU::illegal_instruction, &CPU::mode_implied, 0);
  }

  // ADC - Add with Carry
  set_opcode(0x69, "ADC", &CPU::op_adc, &CPU::mode_immediate, 2);
  set_opcode(0x65, "ADC", &CPU::op_adc, &CPU::mode_zeropage, 3);
  set_opcode(0x75, "ADC", &CPU::op_adc, &CPU::mode_zeropage_x, 4);
  set_opcode(0x6D, "ADC", &CPU::op_adc, &CPU::mode_absolute, 4);
  set_opcode(0x7D, "ADC", &CPU::op_adc, &CPU::mode_absolute_x, 4, true);
  set_opcode(0x79, "ADC", &CPU::op_adc, &CPU::mode_absolute_y, 4, true);
  set_opcode(0x61, "ADC", &CPU::op_adc, &CPU::mode_indexed_indirect, 6);
  set_opcode(0x71, "ADC", &CPU::op_adc, &CPU::mode_indirect_indexed, 5, true);

  // AND - Bitwise AND
  set_opcode(0x29, "AND", &CPU::op_and, &CPU::mode_immediate, 2);
  set_opcode(0x25, "AND", &CPU::op_and, &CPU::mode_zeropage, 3);
  set_opcode(0x35, "AND", &CPU::op_and, &CPU::mode_zeropage_x, 4);
  set_opcode(0x2D, "AND", &CPU::op_and, &CPU::mode_absolute, 4);
  set_opcode(0x3D, "AND", &CPU::op_and, &CPU::mode_absolute_x, 4, true);
  set_opcode(0x39, "AND", &CPU::op_and, &CPU::mode_absolute_y, 4, true);
  set_opcode(0x21, "AND", &CPU::op_and, &CPU::mode_indexed_indirect, 6);
  set_opcode(0x31, "AND", &CPU::op_and, &CPU::mode_indirect_indexed, 5, true);

  // ASL - Arithmetic Shift Left
  set_opcode(0x0A, "ASL", &CPU::op_asl, &CPU::mode_accumulator, 2);
  set_opcode(0x06, "ASL", &CPU::op_asl, &CPU::mode_zeropage, 5);
  set_opcode(0x16, "ASL", &CPU::op_asl, &CPU::mode_zeropage_x, 6);
  set_opcode(0x0E, "ASL", &CPU::op_asl, &CPU::mode_absolute, 6);
  set_opcode(0x1E, "ASL", &CPU::op_asl, &CPU::mode_absolute_x, 7);

  // Branches
  set_opcode(0x90, "BCC", &CPU::op_bcc, &CPU::mode_relative, 2);
  set_opcode(0xB0, "BCS", &CPU::op_bcs, &CPU::mode_relative, 2);
  set_opcode(0xF0, "BEQ", &CPU::op_beq, &CPU::mode_relative, 2);
  set_opcode(0x30, "BMI", &CPU::op_bmi, &CPU::mode_relative, 2);
  set_opcode(0xD0, "BNE", &CPU::op_bne, &CPU::mode_relative, 2);
  set_opcode(0x10, "BPL", &CPU::op_bpl, &CPU::mode_relative, 2);
  set_opcode(0x50, "BVC", &CPU::op_bvc, &CPU::mode_relative, 2);
  set_opcode(0x70, "BVS", &CPU::op_bvs, &CPU::mode_relative, 2);

  // BIT - Bit Test
  set_opcode(0x24, "BIT", &CPU::op_bit, &CPU::mode_zeropage, 3);
  set_opcode(0x2C, "BIT", &CPU::op_bit, &CPU::mode_absolute, 4);

  // BRK - Break
  set_opcode(0x00, "BRK", &CPU::op_brk, &CPU::mode_implied, 7);

  // Flag clears and sets
  set_opcode(0x18, "CLC", &CPU::op_clc, &CPU::mode_implied, 2);
  set_opcode(0xD8, "CLD", &CPU::op_cld, &CPU::mode_implied, 2);
  set_opcode(0x58, "CLI", &CPU::op_cli, &CPU::mode_implied, 2);
  set_opcode(0xB8, "CLV", &CPU::op_clv, &CPU::mode_implied, 2);
  set_opcode(0x38, "SEC", &CPU::op_sec, &CPU::mode_implied, 2);
  set_opcode(0xF8, "SED", &CPU::op_sed, &CPU::mode_implied, 2);
  set_opcode(0x78, "SEI", &CPU::op_sei, &CPU::mode_implied, 2);

  // CMP - Compare A
  set_opcode(0xC9, "CMP", &CPU::op_cmp, &CPU::mode_immediate, 2);
  set_opcode(0xC5, "CMP", &CPU::op_cmp, &CPU::mode_zeropage, 3);
  set_opcode(0xD5, "CMP", &CPU::op_cmp, &CPU::mode_zeropage_x, 4);
  set_opcode(0xCD, "CMP", &CPU::op_cmp, &CPU::mode_absolute, 4);
  set_opcode(0xDD, "CMP", &CPU::op_cmp, &CPU::mode_absolute_x, 4, true);
  set_opcode(0xD9, "CMP", &CPU::op_cmp, &CPU::mode_absolute_y, 4, true);
  set_opcode(0xC1, "CMP", &CPU::op_cmp, &CPU::mode_indexed_indirect, 6);
  set_opcode(0xD1, "CMP", &CPU::op_cmp, &CPU::mode_indirect_indexed, 5, true);

  // CPX - Compare X
  set_opcode(0xE0, "CPX", &CPU::op_cpx, &CPU::mode_immediate, 2);
  set_opcode(0xE4, "CPX", &CPU::op_cpx, &CPU::mode_zeropage, 3);
  set_opcode(0xEC, "CPX", &CPU::op_cpx, &CPU::mode_absolute, 4);

  // CPY - Compare Y
  set_opcode(0xC0, "CPY", &CPU::op_cpy, &CPU::mode_immediate, 2);
  set_opcode(0xC4, "CPY", &CPU::op_cpy, &CPU::mode_zeropage, 3);
  set_opcode(0xCC, "CPY", &CPU::op_cpy, &CPU::mode_absolute, 4);

  // DEC - Decrement Memory
  set_opcode(0xC6, "DEC", &CPU::op_dec, &CPU::mode_zeropage, 5);
  set_opcode(0xD6, "DEC", &CPU::op_dec, &CPU::mode_zeropage_x, 6);
  set_opcode(0xCE, "DEC", &CPU::op_dec, &CPU::mode_absolute, 6);
  set_opcode(0xDE, "DEC", &CPU::op_dec, &CPU::mode_absolute_x, 7);

  // DEX, DEY - Decrement X, Y
  set_opcode(0xCA, "DEX", &CPU::op_dex, &CPU::mode_implied, 2);
  set_opcode(0x88, "DEY", &CPU::op_dey, &CPU::mode_implied, 2);

  // EOR - Exclusive OR
  set_opcode(0x49, "EOR", &CPU::op_eor, &CPU::mode_immediate, 2);
  set_opcode(0x45, "EOR", &CPU::op_eor, &CPU::mode_zeropage, 3);
  set_opcode(0x55, "EOR", &CPU::op_eor, &CPU::mode_zeropage_x, 4);
  set_opcode(0x4D, "EOR", &CPU::op_eor, &CPU::mode_absolute, 4);
  set_opcode(0x5D, "EOR", &CPU::op_eor, &CPU::mode_absolute_x, 4, true);
  set_opcode(0x59, "EOR", &CPU::op_eor, &CPU::mode_absolute_y, 4, true);
  set_opcode(0x41, "EOR", &CPU::op_eor, &CPU::mode_indexed_indirect, 6);
  set_opcode(0x51, "EOR", &CPU::op_eor, &CPU::mode_indirect_indexed, 5, true);

  // INC - Increment Memory
  set_opcode(0xE6, "INC", &CPU::op_inc, &CPU::mode_zeropage, 5);
  set_opcode(0xF6, "INC", &CPU::op_inc, &CPU::mode_zeropage_x, 6);
  set_opcode(0xEE, "INC", &CPU::op_inc, &CPU::mode_absolute, 6);
  set_opcode(0xFE, "INC", &CPU::op_inc, &CPU::mode_absolute_x, 7);

  // INX, INY - Increment X, Y
  set_opcode(0xE8, "INX", &CPU::op_inx, &CPU::mode_implied, 2);
  set_opcode(0xC8, "INY", &CPU::op_iny, &CPU::mode_implied, 2);

  // JMP - Jump
  set_opcode(0x4C, "JMP", &CPU::op_jmp, &CPU::mode_absolute, 3);
  set_opcode(0x6C, "JMP", &CPU::op_jmp, &CPU::mode_indirect, 5);

  // JSR - Jump to Subroutine
  set_opcode(0x20, "JSR", &CPU::op_jsr, &CPU::mode_absolute, 6);

  // LDA - Load A
  set_opcode(0xA9, "LDA", &CPU::op_lda, &CPU::mode_immediate, 2);
  set_opcode(0xA5, "LDA", &CPU::op_lda, &CPU::mode_zeropage, 3);
  set_opcode(0xB5, "LDA", &CPU::op_lda, &CPU::mode_zeropage_x, 4);
  set_opcode(0xAD, "LDA", &CPU::op_lda, &CPU::mode_absolute, 4);
  set_opcode(0xBD, "LDA", &CPU::op_lda, &CPU::mode_absolute_x, 4, true);
  set_opcode(0xB9, "LDA", &CPU::op_lda, &CPU::mode_absolute_y, 4, true);
  set_opcode(0xA1, "LDA", &CPU::op_lda, &CPU::mode_indexed_indirect, 6);
  set_opcode(0xB1, "LDA", &CPU::op_lda, &CPU::mode_indirect_indexed, 5, true);

  // LDX - Load X
  set_opcode(0xA2, "LDX", &CPU::op_ldx, &CPU::mode_immediate, 2);
  set_opcode(0xA6, "LDX", &CPU::op_ldx, &CPU::mode_zeropage, 3);
  set_opcode(0xB6, "LDX", &CPU::op_ldx, &CPU::mode_zeropage_y, 4);
  set_opcode(0xAE, "LDX", &CPU::op_ldx, &CPU::mode_absolute, 4);
  set_opcode(0xBE, "LDX", &CPU::op_ldx, &CPU::mode_absolute_y, 4, true);

  // LDY - Load Y
  set_opcode(0xA0, "LDY", &CPU::op_ldy, &CPU::mode_immediate, 2);
  set_opcode(0xA4, "LDY", &CPU::op_ldy, &CPU::mode_zeropage, 3);
  set_opcode(0xB4, "LDY", &CPU::op_ldy, &CPU::mode_zeropage_x, 4);
  set_opcode(0xAC, "LDY", &CPU::op_ldy, &CPU::mode_absolute, 4);
  set_opcode(0xBC, "LDY", &CPU::op_ldy, &CPU::mode_absolute_x, 4, true);

  // LSR - Logical Shift Right
  set_opcode(0x4A, "LSR", &CPU::op_lsr, &CPU::mode_accumulator, 2);
  set_opcode(0x46, "LSR", &CPU::op_lsr, &CPU::mode_zeropage, 5);
  set_opcode(0x56, "LSR", &CPU::op_lsr, &CPU::mode_zeropage_x, 6);
  set_opcode(0x4E, "LSR", &CPU::op_lsr, &CPU::mode_absolute, 6);
  set_opcode(0x5E, "LSR", &CPU::op_lsr, &CPU::mode_absolute_x, 7);

  // NOP - No Operation
  set_opcode(0xEA, "NOP", &CPU::op_nop, &CPU::mode_implied, 2);

  // ORA - Inclusive OR
  set_opcode(0x09, "ORA", &CPU::op_ora, &CPU::mode_immediate, 2);
  set_opcode(0x05, "ORA", &CPU::op_ora, &CPU::mode_zeropage, 3);
  set_opcode(0x15, "ORA", &CPU::op_ora, &CPU::mode_zeropage_x, 4);
  set_opcode(0x0D, "ORA", &CPU::op_ora, &CPU::mode_absolute, 4);
  set_opcode(0x1D, "ORA", &CPU::op_ora, &CPU::mode_absolute_x, 4, true);
  set_opcode(0x19, "ORA", &CPU::op_ora, &CPU::mode_absolute_y, 4, true);
  set_opcode(0x01, "ORA", &CPU::op_ora, &CPU::mode_indexed_indirect, 6);
  set_opcode(0x11, "ORA", &CPU::op_ora, &CPU::mode_indirect_indexed, 5, true);

  // Stack
  set_opcode(0x48, "PHA", &CPU::op_pha, &CPU::mode_implied, 3);
  set_opcode(0x08, "PHP", &CPU::op_php, &CPU::mode_implied, 3);
  set_opcode(0x68, "PLA", &CPU::op_pla, &CPU::mode_implied, 4);
  set_opcode(0x28, "PLP", &CPU::op_plp, &CPU::mode_implied, 4);

  // ROL - Rotate Left
  set_opcode(0x2A, "ROL", &CPU::op_rol, &CPU::mode_accumulator, 2);
  set_opcode(0x26, "ROL", &CPU::op_rol, &CPU::mode_zeropage, 5);
  set_opcode(0x36, "ROL", &CPU::op_rol, &CPU::mode_zeropage_x, 6);
  set_opcode(0x2E, "ROL", &CPU::op_rol, &CPU::mode_absolute, 6);
  set_opcode(0x3E, "ROL", &CPU::op_rol, &CPU::mode_absolute_x, 7);

  // ROR - Rotate Right
  set_opcode(0x6A, "ROR", &CPU::op_ror, &CPU::mode_accumulator, 2);
  set_opcode(0x66, "ROR", &CPU::op_ror, &CPU::mode_zeropage, 5);
  set_opcode(0x76, "ROR", &CPU::op_ror, &CPU::mode_zeropage_x, 6);
  set_opcode(0x6E, "ROR", &CPU::op_ror, &CPU::mode_absolute, 6);
  set_opcode(0x7E, "ROR", &CPU::op_ror, &CPU::mode_absolute_x, 7);

  // RTI, RTS - Return from Interrupt / Subroutine
  set_opcode(0x40, "RTI", &CPU::op_rti, &CPU::mode_implied, 6);
  set_opcode(0x60, "RTS", &CPU::op_rts, &CPU::mode_implied, 6);

  // SBC - Subtract with Carry
  set_opcode(0xE9, "SBC", &CPU::op_sbc, &CPU::mode_immediate, 2);
  set_opcode(0xE5, "SBC", &CPU::op_sbc, &CPU::mode_zeropage, 3);
  set_opcode(0xF5, "SBC", &CPU::op_sbc, &CPU::mode_zeropage_x, 4);
  set_opcode(0xED, "SBC", &CPU::op_sbc, &CPU::mode_absolute, 4);
  set_opcode(0xFD, "SBC", &CPU::op_sbc, &CPU::mode_absolute_x, 4, true);
  set_opcode(0xF9, "SBC", &CPU::op_sbc, &CPU::mode_absolute_y, 4, true);
  set_opcode(0xE1, "SBC", &CPU::op_sbc, &CPU::mode_indexed_indirect, 6);
  set_opcode(0xF1, "SBC", &CPU::op_sbc, &CPU::mode_indirect_indexed, 5, true);

  // STA - Store A
  set_opcode(0x85, "STA", &CPU::op_sta, &CPU::mode_zeropage, 3);
  set_opcode(0x95, "STA", &CPU::op_sta, &CPU::mode_zeropage_x, 4);
  set_opcode(0x8D, "STA", &CPU::op_sta, &CPU::mode_absolute, 4);
  set_opcode(0x9D, "STA", &CPU::op_sta, &CPU::mode_absolute_x, 5);
  set_opcode(0x99, "STA", &CPU::op_sta, &CPU::mode_absolute_y, 5);
  set_opcode(0x81, "STA", &CPU::op_sta, &CPU::mode_indexed_indirect, 6);
  set_opcode(0x91, "STA", &CPU::op_sta, &CPU::mode_indirect_indexed, 6);

  // STX - Store X
  set_opcode(0x86, "STX", &CPU::op_stx, &CPU::mode_zeropage, 3);
  set_opcode(0x96, "STX", &CPU::op_stx, &CPU::mode_zeropage_y, 4);
  set_opcode(0x8E, "STX", &CPU::op_stx, &CPU::mode_absolute, 4);

  // STY - Store Y
  set_opcode(0x84, "STY", &CPU::op_sty, &CPU::mode_zeropage, 3);
  set_opcode(0x94, "STY", &CPU::op_sty, &CPU::mode_zeropage_x, 4);
  set_opcode(0x8C, "STY", &CPU::op_sty, &CPU::mode_absolute, 4);

  // Transfer Instructions
  set_opcode(0xAA, "TAX", &CPU::op_tax, &CPU::mode_implied, 2);
  set_opcode(0xA8, "TAY", &CPU::op_tay, &CPU::mode_implied, 2);
  set_opcode(0xBA, "TSX", &CPU::op_tsx, &CPU::mode_implied, 2);
  set_opcode(0x8A, "TXA", &CPU::op_txa, &CPU::mode_implied, 2);
  set_opcode(0x9A, "TXS", &CPU::op_txs, &CPU::mode_implied, 2);
  set_opcode(0x98, "TYA", &CPU::op_tya, &CPU::mode_implied, 2);
}


// ---------------------------------------------------------------
// Addressing modes
// ---------------------------------------------------------------

void CPU::mode_implied() {}

void CPU::mode_accumulator() {
  accumulator_mode = true;
}

void CPU::mode_immediate() {
  address = PC;
  PC++;
}

void CPU::mode_zeropage() {
  address = read(PC);
  PC++;
}

void CPU::mode_zeropage_x() {
  uint8_t base_address = read(PC);
  PC++;
  address = (base_address + X) & 0xFF; // zero page so mask it
}

void CPU::mode_zeropage_y() {
  uint8_t base_address = read(PC);
  PC++;
  address = (base_address + Y) & 0xFF;
}

void CPU::mode_absolute() {
  address = read16(PC);
  PC += 2;
}

void CPU::mode_absolute_x() {
  uint16_t base = read16(PC);
  PC += 2;
  address = base + X;
  page_crossed = (base & 0xFF00) != (address & 0xFF00);
}

void CPU::mode_absolute_y() {
  uint16_t base = read16(PC);
  PC += 2;
  address = base + Y;
  page_crossed = (base & 0xFF00) != (address & 0xFF00);
}

void CPU::mode_indirect() {
  uint16_t pointer = read16(PC);
  PC += 2;
  // the high byte never carries into the next page: JMP ($10FF) reads $10FF and $1000
  uint8_t low = read(pointer);
  uint8_t high = read((pointer & 0xFF00) | ((pointer + 1) & 0x00FF));
  address = (high << 8) | low;
}

void CPU::mode_indexed_indirect() {
  uint8_t initial_val = read(PC);
  PC++;

  uint8_t low = read((initial_val + X) & 0xFF);
  uint8_t high = read((initial_val + X + 1) & 0xFF);
  address = (high << 8) | low;
}

void CPU::mode_indirect_indexed() {
  uint8_t initial_val = read(PC);
  PC++;

  uint8_t low = read(initial_val);
  uint8_t high = read((initial_val + 1) & 0xFF);
  uint16_t init_addr = (high << 8) | low;
  address = init_addr + Y;
  page_crossed = (init_addr & 0xFF00) != (address & 0xFF00);
}

void CPU::mode_relative() {
  int8_t offset = (int8_t)read(PC);
  PC++;
  address = PC + offset;
}


// ---------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------

uint8_t CPU::operand() {
  return accumulator_mode ? A : read(address);
}

void CPU::store(uint8_t value) {
  if (accumulator_mode) {
    A = value;
  } else {
    write(address, value);
  }
}

void CPU::set_zn(uint8_t value) {
  set_flag(FLAG_ZERO, value == 0);
  set_flag(FLAG_NEGATIVE, value & 0x80);
}

void CPU::branch(bool condition) {
  if (!condition) {
    return;
  }
  extra_cycles++;
  if ((address & 0xFF00) != (PC & 0xFF00)) {
    extra_cycles++;
  }
  PC = address;
}

void CPU::compare(uint8_t reg) {
  uint8_t value = operand();
  set_flag(FLAG_CARRY, reg >= value);
  set_zn((uint8_t)(reg - value));
}


// ---------------------------------------------------------------
// Operations
// ---------------------------------------------------------------

/*
 *  ADC -  Add with Carry
 *  C - Carry     result > $FF
 *  Z - Zero      result == 0
 *  V - Overflow  (result ^ A) & (result ^ memory) & $80
 *  N - Negative  result bit 7
 *
 *  The 2A03 has no decimal mode, D is stored but ignored.
 */
void CPU::op_adc() {
  uint8_t value = operand();
  uint16_t result = A + value + (get_flag(FLAG_CARRY) ? 1 : 0);

  set_flag(FLAG_CARRY, result > 0xFF);
  set_flag(FLAG_OVERFLOW, (result ^ A) & (result ^ value) & 0x80);

  A = result & 0xFF;
  set_zn(A);
}

// SBC is ADC of the inverted operand
void CPU::op_sbc() {
  uint8_t value = operand() ^ 0xFF;
  uint16_t result = A + value + (get_flag(FLAG_CARRY) ? 1 : 0);

  set_flag(FLAG_CARRY, result > 0xFF);
  set_flag(FLAG_OVERFLOW, (result ^ A) & (result ^ value) & 0x80);

  A = result & 0xFF;
  set_zn(A);
}

void CPU::op_and() {
  A &= operand();
  set_zn(A);
}

void CPU::op_eor() {
  A ^= operand();
  set_zn(A);
}

void CPU::op_ora() {
  A |= operand();
  set_zn(A);
}

void CPU::op_asl() {
  uint8_t value = operand();
  set_flag(FLAG_CARRY, value & 0x80);
  value <<= 1;
  store(value);
  set_zn(value);
}

void CPU::op_lsr() {
  uint8_t value = operand();
  set_flag(FLAG_CARRY, value & 0x01);
  value >>= 1;
  store(value);
  set_zn(value);
}

void CPU::op_rol() {
  uint8_t value = operand();
  uint8_t carry_in = get_flag(FLAG_CARRY) ? 0x01 : 0x00;
  set_flag(FLAG_CARRY, value & 0x80);
  value = (value << 1) | carry_in;
  store(value);
  set_zn(value);
}

void CPU::op_ror() {
  uint8_t value = operand();
  uint8_t carry_in = get_flag(FLAG_CARRY) ? 0x80 : 0x00;
  set_flag(FLAG_CARRY, value & 0x01);
  value = (value >> 1) | carry_in;
  store(value);
  set_zn(value);
}

void CPU::op_bcc() { branch(!get_flag(FLAG_CARRY)); }
void CPU::op_bcs() { branch(get_flag(FLAG_CARRY)); }
void CPU::op_beq() { branch(get_flag(FLAG_ZERO)); }
void CPU::op_bmi() { branch(get_flag(FLAG_NEGATIVE)); }
void CPU::op_bne() { branch(!get_flag(FLAG_ZERO)); }
void CPU::op_bpl() { branch(!get_flag(FLAG_NEGATIVE)); }
void CPU::op_bvc() { branch(!get_flag(FLAG_OVERFLOW)); }
void CPU::op_bvs() { branch(get_flag(FLAG_OVERFLOW)); }

/*
 * BIT - Z from A & memory, N and V copied straight from bits 7 and 6
 */
void CPU::op_bit() {
  uint8_t value = operand();
  set_flag(FLAG_ZERO, (A & value) == 0);
  set_flag(FLAG_OVERFLOW, value & 0x40);
  set_flag(FLAG_NEGATIVE, value & 0x80);
}

// BRK skips a padding byte, so the return address is opcode + 2
void CPU::op_brk() {
  PC++;
  interrupt(IRQ_VECTOR, true);
}

void CPU::op_clc() { set_flag(FLAG_CARRY, false); }
void CPU::op_cld() { set_flag(FLAG_DECIMAL, false); }
void CPU::op_cli() { set_flag(FLAG_INTERRUPT, false); }
void CPU::op_clv() { set_flag(FLAG_OVERFLOW, false); }
void CPU::op_sec() { set_flag(FLAG_CARRY, true); }
void CPU::op_sed() { set_flag(FLAG_DECIMAL, true); }
void CPU::op_sei() { set_flag(FLAG_INTERRUPT, true); }

void CPU::op_cmp() { compare(A); }
void CPU::op_cpx() { compare(X); }
void CPU::op_cpy() { compare(Y); }

void CPU::op_dec() {
  uint8_t value = read(address) - 1;
  write(address, value);
  set_zn(value);
}

void CPU::op_inc() {
  uint8_t value = read(address) + 1;
  write(address, value);
  set_zn(value);
}

void CPU::op_dex() { X--; set_zn(X); }
void CPU::op_dey() { Y--; set_zn(Y); }
void CPU::op_inx() { X++; set_zn(X); }
void CPU::op_iny() { Y++; set_zn(Y); }

void CPU::op_jmp() {
  PC = address;
}

// JSR pushes the address of its own last byte, RTS adds the 1 back
void CPU::op_jsr() {
  uint16_t return_address = PC - 1;
  push((return_address >> 8) & 0xFF);
  push(return_address & 0xFF);
  PC = address;
}

void CPU::op_rts() {
  uint8_t low = pop();
  uint8_t high = pop();
  PC = ((high << 8) | low) + 1;
}

void CPU::op_rti() {
  P = (pop() & ~FLAG_BREAK) | FLAG_UNUSED;
  uint8_t low = pop();
  uint8_t high = pop();
  PC = (high << 8) | low;
}

void CPU::op_lda() { A = operand(); set_zn(A); }
void CPU::op_ldx() { X = operand(); set_zn(X); }
void CPU::op_ldy() { Y = operand(); set_zn(Y); }

void CPU::op_nop() {}

void CPU::op_pha() { push(A); }

// B and bit 5 are always set on the pushed copy
void CPU::op_php() { push(P | FLAG_BREAK | FLAG_UNUSED); }

void CPU::op_pla() {
  A = pop();
  set_zn(A);
}

void CPU::op_plp() {
  P = (pop() & ~FLAG_BREAK) | FLAG_UNUSED;
}

void CPU::op_sta() { write(address, A); }
void CPU::op_stx() { write(address, X); }
void CPU::op_sty() { write(address, Y); }

void CPU::op_tax() { X = A; set_zn(X); }
void CPU::op_tay() { Y = A; set_zn(Y); }
void CPU::op_tsx() { X = SP; set_zn(X); }
void CPU::op_txa() { A = X; set_zn(A); }
void CPU::op_txs() { SP = X; }
void CPU::op_tya() { A = Y; set_zn(A); }
