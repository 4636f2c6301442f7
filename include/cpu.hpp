#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>

// Forward declaration
class Bus;

/**
 * Raised when the CPU fetches an opcode it cannot decode. Execution cannot
 * continue meaningfully past this point, so it propagates to the host.
 */
class CpuFault : public std::runtime_error {
public:
    enum class Kind {
        IllegalOpcode
    };

    CpuFault(Kind kind, uint8_t opcode, uint16_t pc);

    Kind kind() const { return fault_kind; }
    uint8_t opcode() const { return fault_opcode; }
    uint16_t pc() const { return fault_pc; }

private:
    Kind fault_kind;
    uint8_t fault_opcode;
    uint16_t fault_pc;
};

/**
 * 6502 CPU Emulation (2A03 core, no decimal mode)
 *
 * TECHNICAL SPECIFICATIONS:
 * - Clock Speed: 1.789773 MHz (NTSC)
 * - Registers: A (accumulator), X, Y (index), SP (stack), PC (program counter), P (status)
 * - Stack: 256 bytes at $0100-$01FF, grows downward, SP wraps
 *
 * INSTRUCTION TIMING:
 * - step() executes one whole instruction and returns the cycles it took
 * - Page boundary crosses add 1 cycle for read instructions
 * - Branch instructions add 1 cycle when taken, 1 more across a page
 *
 * INTERRUPT HANDLING:
 * - NMI: Non-maskable, requested by PPU VBlank
 * - IRQ: Maskable via I flag, requested by mappers
 * - BRK: Software interrupt through the IRQ vector
 *
 * The CPU holds no reference to the bus; every call that touches memory takes
 * the bus explicitly.
 */
class CPU {
public:
    CPU();

    // Power-on / reset sequence: PC from $FFFC, SP=$FD, P=I|U. Returns 8 cycles.
    int reset(Bus& bus);

    // Execute one instruction. Throws CpuFault on an undecodable opcode.
    int step(Bus& bus);

    // Interrupt sequences. Return cycles consumed (irq returns 0 when masked).
    int irq(Bus& bus);
    int nmi(Bus& bus);

    // ===== TIMING AND STATE INSPECTION =====

    // Total cycles executed since construction
    uint64_t get_cycles() const { return total_cycles; }

    // Opcode of the last executed instruction
    uint8_t get_current_opcode() const { return opcode; }

    // Write one line per instruction to out (nullptr disables)
    void set_trace(std::ostream* out) { trace = out; }

    bool get_carry() const { return get_flag(C); }
    bool get_zero() const { return get_flag(Z); }
    bool get_interrupt_disable() const { return get_flag(I); }
    bool get_decimal() const { return get_flag(D); }
    bool get_overflow() const { return get_flag(V); }
    bool get_negative() const { return get_flag(N); }

    // Registers (public for debugging/testing)
    uint8_t A;      // Accumulator
    uint8_t X;      // X register
    uint8_t Y;      // Y register
    uint8_t SP;     // Stack pointer
    uint16_t PC;    // Program counter
    uint8_t P;      // Status register

    // Status flags
    enum Flags {
        C = (1 << 0),  // Carry
        Z = (1 << 1),  // Zero
        I = (1 << 2),  // Interrupt disable
        D = (1 << 3),  // Decimal mode (not used on NES)
        B = (1 << 4),  // Break (only exists on the stack copy)
        U = (1 << 5),  // Unused (always 1)
        V = (1 << 6),  // Overflow
        N = (1 << 7),  // Negative
    };

    // Addressing modes
    enum class AddrMode : uint8_t {
        IMP, IMM, ZP0, ZPX, ZPY, REL, ABS, ABX, ABY, IND, IZX, IZY
    };

    // Operations. XXX marks opcodes that cannot be decoded.
    enum class Op : uint8_t {
        ADC, AND, ASL, BCC, BCS, BEQ, BIT, BMI, BNE, BPL, BRK, BVC, BVS, CLC,
        CLD, CLI, CLV, CMP, CPX, CPY, DEC, DEX, DEY, EOR, INC, INX, INY, JMP,
        JSR, LDA, LDX, LDY, LSR, NOP, ORA, PHA, PHP, PLA, PLP, ROL, ROR, RTI,
        RTS, SBC, SEC, SED, SEI, STA, STX, STY, TAX, TAY, TSX, TXA, TXS, TYA,
        // Stable undocumented opcodes
        SLO, RLA, SRE, RRA, SAX, LAX, DCP, ISC, ANC, ALR, ARR, AXS,
        XXX
    };

    // Instruction table entry
    struct Instruction {
        const char* name;
        Op op;
        AddrMode mode;
        uint8_t cycles;
    };

    static const Instruction instruction_table[256];

    // Instruction length in bytes for an addressing mode
    static uint8_t operand_length(AddrMode mode);

private:
    // Cycle tracking
    uint64_t total_cycles;
    uint8_t extra_cycles;   // Branch penalties of the current instruction

    // Instruction execution state
    uint16_t addr_abs;    // Effective address for current instruction
    uint16_t addr_rel;    // Relative offset for branches
    uint8_t opcode;       // Current opcode
    uint8_t fetched;      // Fetched operand

    std::ostream* trace;

    // Memory access
    uint8_t read(Bus& bus, uint16_t addr);
    void write(Bus& bus, uint16_t addr, uint8_t data);

    // Stack operations
    void push(Bus& bus, uint8_t data);
    uint8_t pop(Bus& bus);
    void push16(Bus& bus, uint16_t data);
    uint16_t pop16(Bus& bus);

    // Flag operations
    void set_flag(Flags flag, bool value);
    bool get_flag(Flags flag) const;
    void set_zn(uint8_t value);

    // Compute addr_abs / addr_rel; returns 1 if a page boundary was crossed
    uint8_t address(Bus& bus, AddrMode mode);

    // Perform the operation; returns 1 if it pays the page-cross penalty
    uint8_t execute(Bus& bus, Op op, AddrMode mode);

    // Fetch operand for current instruction
    uint8_t fetch(Bus& bus, AddrMode mode);

    // Shared helpers
    void branch(bool condition);
    void add_with_carry(uint8_t value);
    void compare(uint8_t reg, uint8_t value);
    int interrupt(Bus& bus, uint16_t vector);

    void trace_instruction(Bus& bus, uint16_t pc, const Instruction& instr);
};
