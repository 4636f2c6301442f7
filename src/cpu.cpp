#include "cpu.hpp"
#include "bus.hpp"
#include <iomanip>
#include <sstream>

static std::string fault_message(uint8_t opcode, uint16_t pc) {
    std::ostringstream msg;
    msg << "Illegal opcode $" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(2) << (int)opcode << " at $" << std::setw(4) << pc;
    return msg.str();
}

CpuFault::CpuFault(Kind kind, uint8_t opcode, uint16_t pc)
    : std::runtime_error(fault_message(opcode, pc)), fault_kind(kind), fault_opcode(opcode), fault_pc(pc) {
}

CPU::CPU()
    : A(0x00), X(0x00), Y(0x00), SP(0xFD), PC(0x0000), P(U | I),
      total_cycles(0), extra_cycles(0), addr_abs(0x0000), addr_rel(0x0000),
      opcode(0x00), fetched(0x00), trace(nullptr) {
}

int CPU::reset(Bus& bus) {
    // ===== CPU RESET SEQUENCE =====
    // Triggered by: Power-on, Reset button
    // Takes 8 cycles to complete
    //
    // - Loads PC from reset vector at $FFFC-$FFFD
    // - Stack pointer set to $FD
    // - Status = I | U, everything else cleared
    PC = bus.read_word(0xFFFC);

    A = 0x00;
    X = 0x00;
    Y = 0x00;
    SP = 0xFD;
    P = U | I;

    addr_abs = 0x0000;
    addr_rel = 0x0000;
    fetched = 0x00;

    total_cycles += 8;
    return 8;
}

int CPU::step(Bus& bus) {
    // ===== INSTRUCTION FETCH =====
    uint16_t opcode_pc = PC;
    opcode = read(bus, PC);
    PC++;

    const Instruction& instr = instruction_table[opcode];
    if (instr.op == Op::XXX) {
        PC = opcode_pc;
        throw CpuFault(CpuFault::Kind::IllegalOpcode, opcode, opcode_pc);
    }

    if (trace) {
        trace_instruction(bus, opcode_pc, instr);
    }

    extra_cycles = 0;

    // ===== ADDRESSING MODE =====
    // Returns 1 if a page boundary was crossed
    uint8_t page_crossed = address(bus, instr.mode);

    // ===== EXECUTION =====
    // Returns 1 if the operation pays for a page cross. Only read
    // instructions (LDA, ADC, ...) do, stores and read-modify-write do not.
    uint8_t page_penalty = execute(bus, instr.op, instr.mode);

    // Hardware has bit 5 tied high
    P |= U;

    int cycles = instr.cycles + extra_cycles + (page_crossed & page_penalty);
    total_cycles += cycles;
    return cycles;
}

int CPU::interrupt(Bus& bus, uint16_t vector) {
    push16(bus, PC);

    // B cleared on the stack copy distinguishes hardware interrupts from BRK
    push(bus, (P & ~B) | U);
    set_flag(I, true);

    PC = bus.read_word(vector);

    total_cycles += 7;
    return 7;
}

int CPU::irq(Bus& bus) {
    // ===== IRQ (Interrupt Request) - Maskable Interrupt =====
    // Triggered by: Mapper IRQs
    if (get_flag(I)) {
        return 0;
    }
    return interrupt(bus, 0xFFFE);
}

int CPU::nmi(Bus& bus) {
    // ===== NMI (Non-Maskable Interrupt) =====
    // Triggered by: PPU VBlank (if enabled in PPU control register)
    return interrupt(bus, 0xFFFA);
}

uint8_t CPU::read(Bus& bus, uint16_t addr) {
    return bus.cpu_read(addr);
}

void CPU::write(Bus& bus, uint16_t addr, uint8_t data) {
    bus.cpu_write(addr, data);
}

void CPU::push(Bus& bus, uint8_t data) {
    write(bus, 0x0100 + SP, data);
    SP--;
}

uint8_t CPU::pop(Bus& bus) {
    SP++;
    return read(bus, 0x0100 + SP);
}

void CPU::push16(Bus& bus, uint16_t data) {
    push(bus, (data >> 8) & 0xFF);
    push(bus, data & 0xFF);
}

uint16_t CPU::pop16(Bus& bus) {
    uint16_t lo = pop(bus);
    uint16_t hi = pop(bus);
    return (hi << 8) | lo;
}

void CPU::set_flag(Flags flag, bool value) {
    if (value)
        P |= flag;
    else
        P &= ~flag;
}

bool CPU::get_flag(Flags flag) const {
    return (P & flag) != 0;
}

void CPU::set_zn(uint8_t value) {
    set_flag(Z, value == 0x00);
    set_flag(N, value & 0x80);
}

uint8_t CPU::fetch(Bus& bus, AddrMode mode) {
    // Implied mode operates on the accumulator
    if (mode == AddrMode::IMP)
        fetched = A;
    else
        fetched = read(bus, addr_abs);
    return fetched;
}

uint8_t CPU::operand_length(AddrMode mode) {
    switch (mode) {
        case AddrMode::IMP:
            return 1;
        case AddrMode::ABS:
        case AddrMode::ABX:
        case AddrMode::ABY:
        case AddrMode::IND:
            return 3;
        default:
            return 2;
    }
}

// ============================================================================
// ADDRESSING MODES - 12 modes total
// ============================================================================

uint8_t CPU::address(Bus& bus, AddrMode mode) {
    switch (mode) {
        case AddrMode::IMP:
            // No operand, or the accumulator
            return 0;

        case AddrMode::IMM:
            // Operand is the next byte after the opcode
            addr_abs = PC++;
            return 0;

        case AddrMode::ZP0:
            addr_abs = read(bus, PC) & 0x00FF;
            PC++;
            return 0;

        case AddrMode::ZPX:
            // Index wraps within the zero page
            addr_abs = (read(bus, PC) + X) & 0x00FF;
            PC++;
            return 0;

        case AddrMode::ZPY:
            addr_abs = (read(bus, PC) + Y) & 0x00FF;
            PC++;
            return 0;

        case AddrMode::REL:
            addr_rel = read(bus, PC);
            PC++;
            if (addr_rel & 0x80)
                addr_rel |= 0xFF00;  // Sign extend
            return 0;

        case AddrMode::ABS: {
            uint16_t lo = read(bus, PC++);
            uint16_t hi = read(bus, PC++);
            addr_abs = (hi << 8) | lo;
            return 0;
        }

        case AddrMode::ABX: {
            uint16_t lo = read(bus, PC++);
            uint16_t hi = read(bus, PC++);
            addr_abs = static_cast<uint16_t>(((hi << 8) | lo) + X);
            return ((addr_abs & 0xFF00) != (hi << 8)) ? 1 : 0;
        }

        case AddrMode::ABY: {
            uint16_t lo = read(bus, PC++);
            uint16_t hi = read(bus, PC++);
            addr_abs = static_cast<uint16_t>(((hi << 8) | lo) + Y);
            return ((addr_abs & 0xFF00) != (hi << 8)) ? 1 : 0;
        }

        case AddrMode::IND: {
            // Used only by JMP
            uint16_t ptr_lo = read(bus, PC++);
            uint16_t ptr_hi = read(bus, PC++);
            uint16_t ptr = (ptr_hi << 8) | ptr_lo;

            // Hardware bug: if low byte is $FF, high byte wraps within same page
            if (ptr_lo == 0x00FF) {
                addr_abs = (read(bus, ptr & 0xFF00) << 8) | read(bus, ptr);
            } else {
                addr_abs = (read(bus, ptr + 1) << 8) | read(bus, ptr);
            }
            return 0;
        }

        case AddrMode::IZX: {
            // (zero page, X)
            uint16_t t = read(bus, PC++);
            uint16_t lo = read(bus, (t + X) & 0x00FF);
            uint16_t hi = read(bus, (t + X + 1) & 0x00FF);
            addr_abs = (hi << 8) | lo;
            return 0;
        }

        case AddrMode::IZY: {
            // (zero page), Y
            uint16_t t = read(bus, PC++);
            uint16_t lo = read(bus, t & 0x00FF);
            uint16_t hi = read(bus, (t + 1) & 0x00FF);
            addr_abs = static_cast<uint16_t>(((hi << 8) | lo) + Y);
            return ((addr_abs & 0xFF00) != (hi << 8)) ? 1 : 0;
        }
    }
    return 0;
}

// ============================================================================
// OPERATIONS
// ============================================================================

void CPU::branch(bool condition) {
    if (condition) {
        extra_cycles++;
        addr_abs = PC + addr_rel;

        if ((addr_abs & 0xFF00) != (PC & 0xFF00))
            extra_cycles++;

        PC = addr_abs;
    }
}

void CPU::add_with_carry(uint8_t value) {
    uint16_t temp = (uint16_t)A + (uint16_t)value + (uint16_t)get_flag(C);
    set_flag(C, temp > 255);
    set_flag(V, (~((uint16_t)A ^ (uint16_t)value) & ((uint16_t)A ^ temp)) & 0x0080);
    A = temp & 0xFF;
    set_zn(A);
}

void CPU::compare(uint8_t reg, uint8_t value) {
    uint16_t temp = (uint16_t)reg - (uint16_t)value;
    set_flag(C, reg >= value);
    set_flag(Z, (temp & 0x00FF) == 0x0000);
    set_flag(N, temp & 0x0080);
}

uint8_t CPU::execute(Bus& bus, Op op, AddrMode mode) {
    switch (op) {
        // ===== LOAD / STORE =====
        case Op::LDA: A = fetch(bus, mode); set_zn(A); return 1;
        case Op::LDX: X = fetch(bus, mode); set_zn(X); return 1;
        case Op::LDY: Y = fetch(bus, mode); set_zn(Y); return 1;
        case Op::STA: write(bus, addr_abs, A); return 0;
        case Op::STX: write(bus, addr_abs, X); return 0;
        case Op::STY: write(bus, addr_abs, Y); return 0;

        // ===== TRANSFERS =====
        case Op::TAX: X = A; set_zn(X); return 0;
        case Op::TAY: Y = A; set_zn(Y); return 0;
        case Op::TSX: X = SP; set_zn(X); return 0;
        case Op::TXA: A = X; set_zn(A); return 0;
        case Op::TXS: SP = X; return 0;
        case Op::TYA: A = Y; set_zn(A); return 0;

        // ===== STACK =====
        case Op::PHA: push(bus, A); return 0;
        case Op::PHP:
            // B and U are set on the pushed copy only
            push(bus, P | B | U);
            return 0;
        case Op::PLA: A = pop(bus); set_zn(A); return 0;
        case Op::PLP: P = (pop(bus) & ~B) | U; return 0;

        // ===== ARITHMETIC / LOGIC =====
        case Op::ADC: add_with_carry(fetch(bus, mode)); return 1;
        case Op::SBC: add_with_carry(fetch(bus, mode) ^ 0xFF); return 1;
        case Op::AND: A &= fetch(bus, mode); set_zn(A); return 1;
        case Op::ORA: A |= fetch(bus, mode); set_zn(A); return 1;
        case Op::EOR: A ^= fetch(bus, mode); set_zn(A); return 1;
        case Op::CMP: compare(A, fetch(bus, mode)); return 1;
        case Op::CPX: compare(X, fetch(bus, mode)); return 0;
        case Op::CPY: compare(Y, fetch(bus, mode)); return 0;

        case Op::BIT:
            fetch(bus, mode);
            set_flag(Z, (A & fetched) == 0x00);
            set_flag(N, fetched & (1 << 7));
            set_flag(V, fetched & (1 << 6));
            return 0;

        // ===== INCREMENT / DECREMENT =====
        case Op::INC: {
            uint8_t temp = fetch(bus, mode) + 1;
            write(bus, addr_abs, temp);
            set_zn(temp);
            return 0;
        }
        case Op::DEC: {
            uint8_t temp = fetch(bus, mode) - 1;
            write(bus, addr_abs, temp);
            set_zn(temp);
            return 0;
        }
        case Op::INX: X++; set_zn(X); return 0;
        case Op::INY: Y++; set_zn(Y); return 0;
        case Op::DEX: X--; set_zn(X); return 0;
        case Op::DEY: Y--; set_zn(Y); return 0;

        // ===== SHIFTS / ROTATES =====
        // Implied mode targets the accumulator
        case Op::ASL:
        case Op::LSR:
        case Op::ROL:
        case Op::ROR: {
            fetch(bus, mode);
            uint8_t temp;
            if (op == Op::ASL) {
                temp = fetched << 1;
                set_flag(C, fetched & 0x80);
            } else if (op == Op::LSR) {
                temp = fetched >> 1;
                set_flag(C, fetched & 0x01);
            } else if (op == Op::ROL) {
                temp = (fetched << 1) | (get_flag(C) ? 0x01 : 0x00);
                set_flag(C, fetched & 0x80);
            } else {
                temp = (fetched >> 1) | (get_flag(C) ? 0x80 : 0x00);
                set_flag(C, fetched & 0x01);
            }
            set_zn(temp);
            if (mode == AddrMode::IMP)
                A = temp;
            else
                write(bus, addr_abs, temp);
            return 0;
        }

        // ===== JUMPS / CALLS =====
        case Op::JMP: PC = addr_abs; return 0;
        case Op::JSR:
            // Return address pushed is the last byte of the JSR
            push16(bus, PC - 1);
            PC = addr_abs;
            return 0;
        case Op::RTS: PC = pop16(bus) + 1; return 0;
        case Op::RTI:
            P = (pop(bus) & ~B) | U;
            PC = pop16(bus);
            return 0;
        case Op::BRK:
            // Skips the padding byte after the opcode
            PC++;
            push16(bus, PC);
            push(bus, P | B | U);
            set_flag(I, true);
            PC = bus.read_word(0xFFFE);
            return 0;

        // ===== BRANCHES =====
        case Op::BCC: branch(!get_flag(C)); return 0;
        case Op::BCS: branch(get_flag(C)); return 0;
        case Op::BEQ: branch(get_flag(Z)); return 0;
        case Op::BNE: branch(!get_flag(Z)); return 0;
        case Op::BMI: branch(get_flag(N)); return 0;
        case Op::BPL: branch(!get_flag(N)); return 0;
        case Op::BVC: branch(!get_flag(V)); return 0;
        case Op::BVS: branch(get_flag(V)); return 0;

        // ===== FLAGS =====
        case Op::CLC: set_flag(C, false); return 0;
        case Op::CLD: set_flag(D, false); return 0;
        case Op::CLI: set_flag(I, false); return 0;
        case Op::CLV: set_flag(V, false); return 0;
        case Op::SEC: set_flag(C, true); return 0;
        case Op::SED: set_flag(D, true); return 0;
        case Op::SEI: set_flag(I, true); return 0;

        case Op::NOP:
            // Undocumented NOPs still perform their operand read
            if (mode != AddrMode::IMP)
                fetch(bus, mode);
            return 1;

        // ===== UNDOCUMENTED COMBINED OPERATIONS =====
        case Op::SLO: {
            // ASL memory, then ORA
            fetch(bus, mode);
            set_flag(C, fetched & 0x80);
            uint8_t temp = fetched << 1;
            write(bus, addr_abs, temp);
            A |= temp;
            set_zn(A);
            return 0;
        }
        case Op::RLA: {
            // ROL memory, then AND
            fetch(bus, mode);
            uint8_t temp = (fetched << 1) | (get_flag(C) ? 0x01 : 0x00);
            set_flag(C, fetched & 0x80);
            write(bus, addr_abs, temp);
            A &= temp;
            set_zn(A);
            return 0;
        }
        case Op::SRE: {
            // LSR memory, then EOR
            fetch(bus, mode);
            set_flag(C, fetched & 0x01);
            uint8_t temp = fetched >> 1;
            write(bus, addr_abs, temp);
            A ^= temp;
            set_zn(A);
            return 0;
        }
        case Op::RRA: {
            // ROR memory, then ADC
            fetch(bus, mode);
            uint8_t temp = (fetched >> 1) | (get_flag(C) ? 0x80 : 0x00);
            set_flag(C, fetched & 0x01);
            write(bus, addr_abs, temp);
            add_with_carry(temp);
            return 0;
        }
        case Op::SAX: write(bus, addr_abs, A & X); return 0;
        case Op::LAX:
            A = X = fetch(bus, mode);
            set_zn(A);
            return 1;
        case Op::DCP: {
            // DEC memory, then CMP
            uint8_t temp = fetch(bus, mode) - 1;
            write(bus, addr_abs, temp);
            compare(A, temp);
            return 0;
        }
        case Op::ISC: {
            // INC memory, then SBC
            uint8_t temp = fetch(bus, mode) + 1;
            write(bus, addr_abs, temp);
            add_with_carry(temp ^ 0xFF);
            return 0;
        }
        case Op::ANC:
            A &= fetch(bus, mode);
            set_zn(A);
            set_flag(C, A & 0x80);
            return 0;
        case Op::ALR:
            A &= fetch(bus, mode);
            set_flag(C, A & 0x01);
            A >>= 1;
            set_zn(A);
            return 0;
        case Op::ARR:
            A &= fetch(bus, mode);
            A = (A >> 1) | (get_flag(C) ? 0x80 : 0x00);
            set_zn(A);
            set_flag(C, A & 0x40);
            set_flag(V, ((A >> 6) ^ (A >> 5)) & 0x01);
            return 0;
        case Op::AXS: {
            // (A & X) - immediate -> X, flags like CMP
            uint8_t temp = A & X;
            fetch(bus, mode);
            X = temp - fetched;
            set_flag(C, temp >= fetched);
            set_zn(X);
            return 0;
        }

        case Op::XXX:
            break;
    }
    throw CpuFault(CpuFault::Kind::IllegalOpcode, opcode, static_cast<uint16_t>(PC - 1));
}

void CPU::trace_instruction(Bus& bus, uint16_t pc, const Instruction& instr) {
    // C000  A9 42     LDA  A:00 X:00 Y:00 P:24 SP:FD CYC:7
    uint8_t length = operand_length(instr.mode);

    std::ostringstream bytes;
    bytes << std::hex << std::uppercase << std::setfill('0');
    for (uint8_t i = 0; i < length; i++) {
        bytes << std::setw(2) << (int)read(bus, static_cast<uint16_t>(pc + i)) << " ";
    }

    std::ostream& out = *trace;
    out << std::hex << std::uppercase << std::setfill('0')
        << std::setw(4) << pc << "  "
        << std::left << std::setfill(' ') << std::setw(10) << bytes.str() << std::right
        << instr.name << std::setfill('0')
        << "  A:" << std::setw(2) << (int)A
        << " X:" << std::setw(2) << (int)X
        << " Y:" << std::setw(2) << (int)Y
        << " P:" << std::setw(2) << (int)P
        << " SP:" << std::setw(2) << (int)SP
        << std::dec << " CYC:" << total_cycles << "\n";
}

// ============================================================================
// INSTRUCTION TABLE
// ============================================================================
// "???" entries are JAM/KIL and the unstable undocumented opcodes

const CPU::Instruction CPU::instruction_table[256] = {
    /* 0_ */ {"BRK", Op::BRK, AddrMode::IMP, 7}, {"ORA", Op::ORA, AddrMode::IZX, 6}, {"???", Op::XXX, AddrMode::IMP, 2}, {"SLO", Op::SLO, AddrMode::IZX, 8}, {"NOP", Op::NOP, AddrMode::ZP0, 3}, {"ORA", Op::ORA, AddrMode::ZP0, 3}, {"ASL", Op::ASL, AddrMode::ZP0, 5}, {"SLO", Op::SLO, AddrMode::ZP0, 5}, {"PHP", Op::PHP, AddrMode::IMP, 3}, {"ORA", Op::ORA, AddrMode::IMM, 2}, {"ASL", Op::ASL, AddrMode::IMP, 2}, {"ANC", Op::ANC, AddrMode::IMM, 2}, {"NOP", Op::NOP, AddrMode::ABS, 4}, {"ORA", Op::ORA, AddrMode::ABS, 4}, {"ASL", Op::ASL, AddrMode::ABS, 6}, {"SLO", Op::SLO, AddrMode::ABS, 6},
    /* 1_ */ {"BPL", Op::BPL, AddrMode::REL, 2}, {"ORA", Op::ORA, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"SLO", Op::SLO, AddrMode::IZY, 8}, {"NOP", Op::NOP, AddrMode::ZPX, 4}, {"ORA", Op::ORA, AddrMode::ZPX, 4}, {"ASL", Op::ASL, AddrMode::ZPX, 6}, {"SLO", Op::SLO, AddrMode::ZPX, 6}, {"CLC", Op::CLC, AddrMode::IMP, 2}, {"ORA", Op::ORA, AddrMode::ABY, 4}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"SLO", Op::SLO, AddrMode::ABY, 7}, {"NOP", Op::NOP, AddrMode::ABX, 4}, {"ORA", Op::ORA, AddrMode::ABX, 4}, {"ASL", Op::ASL, AddrMode::ABX, 7}, {"SLO", Op::SLO, AddrMode::ABX, 7},
    /* 2_ */ {"JSR", Op::JSR, AddrMode::ABS, 6}, {"AND", Op::AND, AddrMode::IZX, 6}, {"???", Op::XXX, AddrMode::IMP, 2}, {"RLA", Op::RLA, AddrMode::IZX, 8}, {"BIT", Op::BIT, AddrMode::ZP0, 3}, {"AND", Op::AND, AddrMode::ZP0, 3}, {"ROL", Op::ROL, AddrMode::ZP0, 5}, {"RLA", Op::RLA, AddrMode::ZP0, 5}, {"PLP", Op::PLP, AddrMode::IMP, 4}, {"AND", Op::AND, AddrMode::IMM, 2}, {"ROL", Op::ROL, AddrMode::IMP, 2}, {"ANC", Op::ANC, AddrMode::IMM, 2}, {"BIT", Op::BIT, AddrMode::ABS, 4}, {"AND", Op::AND, AddrMode::ABS, 4}, {"ROL", Op::ROL, AddrMode::ABS, 6}, {"RLA", Op::RLA, AddrMode::ABS, 6},
    /* 3_ */ {"BMI", Op::BMI, AddrMode::REL, 2}, {"AND", Op::AND, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"RLA", Op::RLA, AddrMode::IZY, 8}, {"NOP", Op::NOP, AddrMode::ZPX, 4}, {"AND", Op::AND, AddrMode::ZPX, 4}, {"ROL", Op::ROL, AddrMode::ZPX, 6}, {"RLA", Op::RLA, AddrMode::ZPX, 6}, {"SEC", Op::SEC, AddrMode::IMP, 2}, {"AND", Op::AND, AddrMode::ABY, 4}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"RLA", Op::RLA, AddrMode::ABY, 7}, {"NOP", Op::NOP, AddrMode::ABX, 4}, {"AND", Op::AND, AddrMode::ABX, 4}, {"ROL", Op::ROL, AddrMode::ABX, 7}, {"RLA", Op::RLA, AddrMode::ABX, 7},
    /* 4_ */ {"RTI", Op::RTI, AddrMode::IMP, 6}, {"EOR", Op::EOR, AddrMode::IZX, 6}, {"???", Op::XXX, AddrMode::IMP, 2}, {"SRE", Op::SRE, AddrMode::IZX, 8}, {"NOP", Op::NOP, AddrMode::ZP0, 3}, {"EOR", Op::EOR, AddrMode::ZP0, 3}, {"LSR", Op::LSR, AddrMode::ZP0, 5}, {"SRE", Op::SRE, AddrMode::ZP0, 5}, {"PHA", Op::PHA, AddrMode::IMP, 3}, {"EOR", Op::EOR, AddrMode::IMM, 2}, {"LSR", Op::LSR, AddrMode::IMP, 2}, {"ALR", Op::ALR, AddrMode::IMM, 2}, {"JMP", Op::JMP, AddrMode::ABS, 3}, {"EOR", Op::EOR, AddrMode::ABS, 4}, {"LSR", Op::LSR, AddrMode::ABS, 6}, {"SRE", Op::SRE, AddrMode::ABS, 6},
    /* 5_ */ {"BVC", Op::BVC, AddrMode::REL, 2}, {"EOR", Op::EOR, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"SRE", Op::SRE, AddrMode::IZY, 8}, {"NOP", Op::NOP, AddrMode::ZPX, 4}, {"EOR", Op::EOR, AddrMode::ZPX, 4}, {"LSR", Op::LSR, AddrMode::ZPX, 6}, {"SRE", Op::SRE, AddrMode::ZPX, 6}, {"CLI", Op::CLI, AddrMode::IMP, 2}, {"EOR", Op::EOR, AddrMode::ABY, 4}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"SRE", Op::SRE, AddrMode::ABY, 7}, {"NOP", Op::NOP, AddrMode::ABX, 4}, {"EOR", Op::EOR, AddrMode::ABX, 4}, {"LSR", Op::LSR, AddrMode::ABX, 7}, {"SRE", Op::SRE, AddrMode::ABX, 7},
    /* 6_ */ {"RTS", Op::RTS, AddrMode::IMP, 6}, {"ADC", Op::ADC, AddrMode::IZX, 6}, {"???", Op::XXX, AddrMode::IMP, 2}, {"RRA", Op::RRA, AddrMode::IZX, 8}, {"NOP", Op::NOP, AddrMode::ZP0, 3}, {"ADC", Op::ADC, AddrMode::ZP0, 3}, {"ROR", Op::ROR, AddrMode::ZP0, 5}, {"RRA", Op::RRA, AddrMode::ZP0, 5}, {"PLA", Op::PLA, AddrMode::IMP, 4}, {"ADC", Op::ADC, AddrMode::IMM, 2}, {"ROR", Op::ROR, AddrMode::IMP, 2}, {"ARR", Op::ARR, AddrMode::IMM, 2}, {"JMP", Op::JMP, AddrMode::IND, 5}, {"ADC", Op::ADC, AddrMode::ABS, 4}, {"ROR", Op::ROR, AddrMode::ABS, 6}, {"RRA", Op::RRA, AddrMode::ABS, 6},
    /* 7_ */ {"BVS", Op::BVS, AddrMode::REL, 2}, {"ADC", Op::ADC, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"RRA", Op::RRA, AddrMode::IZY, 8}, {"NOP", Op::NOP, AddrMode::ZPX, 4}, {"ADC", Op::ADC, AddrMode::ZPX, 4}, {"ROR", Op::ROR, AddrMode::ZPX, 6}, {"RRA", Op::RRA, AddrMode::ZPX, 6}, {"SEI", Op::SEI, AddrMode::IMP, 2}, {"ADC", Op::ADC, AddrMode::ABY, 4}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"RRA", Op::RRA, AddrMode::ABY, 7}, {"NOP", Op::NOP, AddrMode::ABX, 4}, {"ADC", Op::ADC, AddrMode::ABX, 4}, {"ROR", Op::ROR, AddrMode::ABX, 7}, {"RRA", Op::RRA, AddrMode::ABX, 7},
    /* 8_ */ {"NOP", Op::NOP, AddrMode::IMM, 2}, {"STA", Op::STA, AddrMode::IZX, 6}, {"NOP", Op::NOP, AddrMode::IMM, 2}, {"SAX", Op::SAX, AddrMode::IZX, 6}, {"STY", Op::STY, AddrMode::ZP0, 3}, {"STA", Op::STA, AddrMode::ZP0, 3}, {"STX", Op::STX, AddrMode::ZP0, 3}, {"SAX", Op::SAX, AddrMode::ZP0, 3}, {"DEY", Op::DEY, AddrMode::IMP, 2}, {"NOP", Op::NOP, AddrMode::IMM, 2}, {"TXA", Op::TXA, AddrMode::IMP, 2}, {"???", Op::XXX, AddrMode::IMP, 2}, {"STY", Op::STY, AddrMode::ABS, 4}, {"STA", Op::STA, AddrMode::ABS, 4}, {"STX", Op::STX, AddrMode::ABS, 4}, {"SAX", Op::SAX, AddrMode::ABS, 4},
    /* 9_ */ {"BCC", Op::BCC, AddrMode::REL, 2}, {"STA", Op::STA, AddrMode::IZY, 6}, {"???", Op::XXX, AddrMode::IMP, 2}, {"???", Op::XXX, AddrMode::IMP, 2}, {"STY", Op::STY, AddrMode::ZPX, 4}, {"STA", Op::STA, AddrMode::ZPX, 4}, {"STX", Op::STX, AddrMode::ZPY, 4}, {"SAX", Op::SAX, AddrMode::ZPY, 4}, {"TYA", Op::TYA, AddrMode::IMP, 2}, {"STA", Op::STA, AddrMode::ABY, 5}, {"TXS", Op::TXS, AddrMode::IMP, 2}, {"???", Op::XXX, AddrMode::IMP, 2}, {"???", Op::XXX, AddrMode::IMP, 2}, {"STA", Op::STA, AddrMode::ABX, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"???", Op::XXX, AddrMode::IMP, 2},
    /* A_ */ {"LDY", Op::LDY, AddrMode::IMM, 2}, {"LDA", Op::LDA, AddrMode::IZX, 6}, {"LDX", Op::LDX, AddrMode::IMM, 2}, {"LAX", Op::LAX, AddrMode::IZX, 6}, {"LDY", Op::LDY, AddrMode::ZP0, 3}, {"LDA", Op::LDA, AddrMode::ZP0, 3}, {"LDX", Op::LDX, AddrMode::ZP0, 3}, {"LAX", Op::LAX, AddrMode::ZP0, 3}, {"TAY", Op::TAY, AddrMode::IMP, 2}, {"LDA", Op::LDA, AddrMode::IMM, 2}, {"TAX", Op::TAX, AddrMode::IMP, 2}, {"LAX", Op::LAX, AddrMode::IMM, 2}, {"LDY", Op::LDY, AddrMode::ABS, 4}, {"LDA", Op::LDA, AddrMode::ABS, 4}, {"LDX", Op::LDX, AddrMode::ABS, 4}, {"LAX", Op::LAX, AddrMode::ABS, 4},
    /* B_ */ {"BCS", Op::BCS, AddrMode::REL, 2}, {"LDA", Op::LDA, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"LAX", Op::LAX, AddrMode::IZY, 5}, {"LDY", Op::LDY, AddrMode::ZPX, 4}, {"LDA", Op::LDA, AddrMode::ZPX, 4}, {"LDX", Op::LDX, AddrMode::ZPY, 4}, {"LAX", Op::LAX, AddrMode::ZPY, 4}, {"CLV", Op::CLV, AddrMode::IMP, 2}, {"LDA", Op::LDA, AddrMode::ABY, 4}, {"TSX", Op::TSX, AddrMode::IMP, 2}, {"???", Op::XXX, AddrMode::IMP, 2}, {"LDY", Op::LDY, AddrMode::ABX, 4}, {"LDA", Op::LDA, AddrMode::ABX, 4}, {"LDX", Op::LDX, AddrMode::ABY, 4}, {"LAX", Op::LAX, AddrMode::ABY, 4},
    /* C_ */ {"CPY", Op::CPY, AddrMode::IMM, 2}, {"CMP", Op::CMP, AddrMode::IZX, 6}, {"NOP", Op::NOP, AddrMode::IMM, 2}, {"DCP", Op::DCP, AddrMode::IZX, 8}, {"CPY", Op::CPY, AddrMode::ZP0, 3}, {"CMP", Op::CMP, AddrMode::ZP0, 3}, {"DEC", Op::DEC, AddrMode::ZP0, 5}, {"DCP", Op::DCP, AddrMode::ZP0, 5}, {"INY", Op::INY, AddrMode::IMP, 2}, {"CMP", Op::CMP, AddrMode::IMM, 2}, {"DEX", Op::DEX, AddrMode::IMP, 2}, {"AXS", Op::AXS, AddrMode::IMM, 2}, {"CPY", Op::CPY, AddrMode::ABS, 4}, {"CMP", Op::CMP, AddrMode::ABS, 4}, {"DEC", Op::DEC, AddrMode::ABS, 6}, {"DCP", Op::DCP, AddrMode::ABS, 6},
    /* D_ */ {"BNE", Op::BNE, AddrMode::REL, 2}, {"CMP", Op::CMP, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"DCP", Op::DCP, AddrMode::IZY, 8}, {"NOP", Op::NOP, AddrMode::ZPX, 4}, {"CMP", Op::CMP, AddrMode::ZPX, 4}, {"DEC", Op::DEC, AddrMode::ZPX, 6}, {"DCP", Op::DCP, AddrMode::ZPX, 6}, {"CLD", Op::CLD, AddrMode::IMP, 2}, {"CMP", Op::CMP, AddrMode::ABY, 4}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"DCP", Op::DCP, AddrMode::ABY, 7}, {"NOP", Op::NOP, AddrMode::ABX, 4}, {"CMP", Op::CMP, AddrMode::ABX, 4}, {"DEC", Op::DEC, AddrMode::ABX, 7}, {"DCP", Op::DCP, AddrMode::ABX, 7},
    /* E_ */ {"CPX", Op::CPX, AddrMode::IMM, 2}, {"SBC", Op::SBC, AddrMode::IZX, 6}, {"NOP", Op::NOP, AddrMode::IMM, 2}, {"ISC", Op::ISC, AddrMode::IZX, 8}, {"CPX", Op::CPX, AddrMode::ZP0, 3}, {"SBC", Op::SBC, AddrMode::ZP0, 3}, {"INC", Op::INC, AddrMode::ZP0, 5}, {"ISC", Op::ISC, AddrMode::ZP0, 5}, {"INX", Op::INX, AddrMode::IMP, 2}, {"SBC", Op::SBC, AddrMode::IMM, 2}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"SBC", Op::SBC, AddrMode::IMM, 2}, {"CPX", Op::CPX, AddrMode::ABS, 4}, {"SBC", Op::SBC, AddrMode::ABS, 4}, {"INC", Op::INC, AddrMode::ABS, 6}, {"ISC", Op::ISC, AddrMode::ABS, 6},
    /* F_ */ {"BEQ", Op::BEQ, AddrMode::REL, 2}, {"SBC", Op::SBC, AddrMode::IZY, 5}, {"???", Op::XXX, AddrMode::IMP, 2}, {"ISC", Op::ISC, AddrMode::IZY, 8}, {"NOP", Op::NOP, AddrMode::ZPX, 4}, {"SBC", Op::SBC, AddrMode::ZPX, 4}, {"INC", Op::INC, AddrMode::ZPX, 6}, {"ISC", Op::ISC, AddrMode::ZPX, 6}, {"SED", Op::SED, AddrMode::IMP, 2}, {"SBC", Op::SBC, AddrMode::ABY, 4}, {"NOP", Op::NOP, AddrMode::IMP, 2}, {"ISC", Op::ISC, AddrMode::ABY, 7}, {"NOP", Op::NOP, AddrMode::ABX, 4}, {"SBC", Op::SBC, AddrMode::ABX, 4}, {"INC", Op::INC, AddrMode::ABX, 7}, {"ISC", Op::ISC, AddrMode::ABX, 7},
};
