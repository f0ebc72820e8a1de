#pragma once
#include <cstdio>
#include <stdint.h>

#define FLAG_CARRY     0x01
#define FLAG_ZERO      0x02
#define FLAG_INTERRUPT 0x04
#define FLAG_DECIMAL   0x08
#define FLAG_BREAK     0x10
#define FLAG_UNUSED    0x20
#define FLAG_OVERFLOW  0x40
#define FLAG_NEGATIVE  0x80

#define NMI_VECTOR   0xFFFA
#define RESET_VECTOR 0xFFFC
#define IRQ_VECTOR   0xFFFE

#define DMA_STALL_CYCLES 513


class Bus; // forward declaration
class CPU {
  public:
    CPU();
    void connectBus(Bus*);

    // Run the reset sequence: registers to power-on values, PC from $FFFC
    void reset();

    // Execute one instruction, or enter a pending interrupt, and return
    // the cycles it took. Returns 0 once the CPU has halted.
    uint32_t step();

    void nmi();           // latch an NMI edge, taken before the next fetch
    void set_irq(bool);   // level triggered, ignored while I is set

    // Illegal opcodes stop the CPU instead of guessing
    bool halted() const { return bad_instruction; }
    uint16_t get_bad_address() const { return bad_address; }

    // Trace one line per instruction to this file (nullptr turns it off)
    void set_trace(FILE* file) { trace = file; }

    uint8_t get_A() const { return A; }
    uint8_t get_X() const { return X; }
    uint8_t get_Y() const { return Y; }
    uint8_t get_SP() const { return SP; }
    uint8_t get_P() const { return P; }
    uint16_t get_PC() const { return PC; }
    uint64_t get_cycles() const { return cycles; }
    uint8_t getCurrentOpcode() const { return currentOpcode; }
    void set_PC(uint16_t address) { PC = address; }

    void set_flag(uint8_t, bool);
    bool get_flag(uint8_t) const;
    uint8_t read(uint16_t);
    void write(uint16_t, uint8_t);
    void push(uint8_t);
    uint8_t pop();

  private:
    struct Instruction {
      const char* name;
      void (CPU::*operate)();
      void (CPU::*addrmode)();
      uint8_t cycles;      // base cost
      bool page_penalty;   // +1 when indexing crosses a page (reads only)
    };

    //look up table to store all functions pointers
    Instruction opcode_table[256];

    void init_opcode_table();
    void set_opcode(uint8_t opcode, const char* name, void (CPU::*operate)(),
                    void (CPU::*addrmode)(), uint8_t cycles, bool page_penalty = false);

    uint8_t fetch();
    uint16_t read16(uint16_t);
    uint8_t operand();
    void store(uint8_t);
    void set_zn(uint8_t);
    void branch(bool);
    void compare(uint8_t);
    void interrupt(uint16_t vector, bool brk);
    void trace_instruction(uint16_t pc, const Instruction&);

    // Addressing modes. Each one leaves the effective address in `address`
    // and moves PC past the operand bytes.
    void mode_implied();
    void mode_accumulator();
    void mode_immediate();
    void mode_zeropage();
    void mode_zeropage_x();
    void mode_zeropage_y();
    void mode_absolute();
    void mode_absolute_x();
    void mode_absolute_y();
    void mode_indirect();
    void mode_indexed_indirect();
    void mode_indirect_indexed();
    void mode_relative();

    void illegal_instruction();
    void op_adc(); void op_and(); void op_asl(); void op_bcc(); void op_bcs();
    void op_beq(); void op_bit(); void op_bmi(); void op_bne(); void op_bpl();
    void op_brk(); void op_bvc(); void op_bvs(); void op_clc(); void op_cld();
    void op_cli(); void op_clv(); void op_cmp(); void op_cpx(); void op_cpy();
    void op_dec(); void op_dex(); void op_dey(); void op_eor(); void op_inc();
    void op_inx(); void op_iny(); void op_jmp(); void op_jsr(); void op_lda();
    void op_ldx(); void op_ldy(); void op_lsr(); void op_nop(); void op_ora();
    void op_pha(); void op_php(); void op_pla(); void op_plp(); void op_rol();
    void op_ror(); void op_rti(); void op_rts(); void op_sbc(); void op_sec();
    void op_sed(); void op_sei(); void op_sta(); void op_stx(); void op_sty();
    void op_tax(); void op_tay(); void op_tsx(); void op_txa(); void op_txs();
    void op_tya();

    Bus* bus;

    // Accumulator. supports using status register for carrying and overflow detection
    uint8_t A;

    // Program counter. It always points to the next byte to fetch.
    uint16_t PC;

    // X and Y indexes. Loop counters
    uint8_t X;
    uint8_t Y;

    /*
      Stack pointer. The stack lives in page 1 (0x0100-0x01FF) and
      grows down. SP is an 8-bit offset from 0x0100 pointing at the
      first free slot: push writes 0x0100 + SP then SP--, pop does
      SP++ then reads. SP wraps within the page, 0x00 - 1 = 0xFF.
    */
    uint8_t SP;

    /*
      Status register. Each bit is a flag
      7654 3210
      NV1B DIZC
      B and 1 only exist on the copy pushed to the stack.
     */
    uint8_t P;

    uint64_t cycles;

    // decode state for the instruction in flight
    uint16_t address;        // effective address from the addressing mode
    bool page_crossed;
    bool accumulator_mode;
    uint8_t extra_cycles;    // taken branch penalties

    bool nmi_pending;
    bool irq_line;

    bool bad_instruction;
    uint16_t bad_address;

    uint8_t currentOpcode;  // store last fetched opcode

    FILE* trace;
};

/*
========================
 Opcode addressing modes
========================

Immediate (#$nn): the operand is the byte after the opcode.

Zero Page ($nn): one byte address into page 0.

Zero Page X/Y ($nn,X): (nn + X) & 0xFF, never leaves page 0.

Absolute ($hhll): two bytes, little endian.

Absolute X/Y ($hhll,X): hhll + X. If the high byte changes the read
takes one more cycle. Stores and read-modify-write always pay it, so
it's already in their base cost.

Indirect (($hhll)): JMP only. Reads the target from hhll, but the high
byte comes from the same page (hardware bug at $xxFF).

Indexed indirect (($nn,X)): pointer at (nn + X) & 0xFF in page 0.

Indirect indexed (($nn),Y): pointer at nn in page 0, then + Y, with
the page cross penalty.

Relative: signed 8-bit offset from the address after the branch.
Taken branch +1 cycle, +1 more if it lands on another page.

Accumulator / Implied: no operand bytes.
*/
