#include "cpu.h"
#include "config.h"
#include "core.h"

#include "debugging/logger.h"

#include <sstream>
#include <iomanip>

// 256-entry instruction table
Instruction instructionTable[256];

// Macros to set an entry; SET_INP adds a cycle when the page is crossed
#define SET_INS(op, mnem, mode, cyc) \
    instructionTable[op] = { #mnem, AddrMode::mode, cyc, false, &CPU::mnem, &CPU::addr_##mode };
#define SET_INP(op, mnem, mode, cyc) \
    instructionTable[op] = { #mnem, AddrMode::mode, cyc, true, &CPU::mnem, &CPU::addr_##mode };

// Table initializer runs before main()
struct TableInitializer { TableInitializer() { CPU::initInstructionTable(); } } tableInitializer;

CPU::CPU(Bus& bus, InterruptLine& nmiLine)
    : bus(bus), nmiLine(nmiLine), PC(0), A(0), X(0), Y(0), SP(POWER_UP_SP),
    status(POWER_UP_STATUS), cyclesRemaining(0), stallCycles(0), opcode(0), opcodeAddress(0),
    totalCycles(0), resetDone(false), traceEnabled(false)
{
}

// Reset CPU and set PC from reset vector
void CPU::reset() {
    A = X = Y = 0;
    SP = POWER_UP_SP;
    status = POWER_UP_STATUS;
    cyclesRemaining = 0;
    stallCycles = 0;
    opcode = 0;
    opcodeAddress = 0;
    operand = {};
    nmiLine.clear();
    PC = readWord(RESET_VECTOR);

    // The start sequence takes 7 cycles before the first fetch
    totalCycles = RESET_CYCLES;
    resetDone = true;

    logInfo("[CPU] Reset.");
}

void CPU::nmi() {
    // push PC high, PC low, FLAGS with B=0 & U=1
    push((PC >> 8) & 0xFF);
    push(PC & 0xFF);
    push((status & ~FLAG_BREAK) | FLAG_UNUSED);
    setFlag(FLAG_INTERRUPT, true);

    PC = readWord(NMI_VECTOR);
    cyclesRemaining = INTERRUPT_CYCLES;

    if (debugLoggingEnabled()) {
        LOG_DEBUG(getQuillLogger(), "[CPU] NMI serviced, PC={:04X} CYC:{}", PC, totalCycles);
    }
}

void CPU::clock() {
    if (!resetDone) {
        throw ContractViolation("CPU::clock() called before CPU::reset()");
    }

    // Handle DMA stall cycles first
    if (stallCycles > 0) {
        --stallCycles;
        ++totalCycles;
        return;
    }

    // If we're starting a new instruction
    if (cyclesRemaining == 0) {
        if (nmiLine.consume()) {
            nmi();
        }
        else {
            opcodeAddress = PC;
            opcode = readByte(PC++);
            const Instruction& ins = instructionTable[opcode];

            if (traceEnabled) {
                trace(opcodeAddress);
            }

            cyclesRemaining = ins.cycles;
            operand = (this->*ins.addrmode)();
            if (operand.pageCrossed && ins.pageCrossPenalty) {
                ++cyclesRemaining;
            }

            // Execute instruction logic (may add branch cycles)
            cyclesRemaining += (this->*ins.operate)();
        }
    }

    // Consume a CPU cycle
    --cyclesRemaining;
    ++totalCycles;
}

bool CPU::instructionComplete() const {
    return cyclesRemaining == 0 && stallCycles == 0;
}

void CPU::addStallCycles(int cycles) {
    stallCycles += cycles;
}

void CPU::setTraceEnabled(bool enabled) {
    traceEnabled = enabled;
}

uint64_t CPU::getTotalCycles() const {
    return totalCycles;
}

void CPU::trace(uint16_t pc) const {
    if (!debugLoggingEnabled()) return;
    LOG_DEBUG(getQuillLogger(), "{:04X}  {:02X}  {:<4} A:{:02X} X:{:02X} Y:{:02X} P:{:02X} SP:{:02X} CYC:{}",
        pc, opcode, instructionTable[opcode].name, A, X, Y, status, SP, totalCycles);
}

// Initialize table with defaults and specific entries
void CPU::initInstructionTable() {
    // Anything not listed below locks up a real 6502
    for (int i = 0; i < 256; i++) {
        instructionTable[i] = { "JAM", AddrMode::IMP, 2, false, &CPU::JAM, &CPU::addr_IMP };
    }
    // ADC, SBC, AND, ORA, EOR, CMP, CPX, CPY
    SET_INS(0x69, ADC, IMM, 2); SET_INS(0x65, ADC, ZP, 3); SET_INS(0x75, ADC, ZPX, 4);
    SET_INS(0x6D, ADC, ABS, 4); SET_INP(0x7D, ADC, ABX, 4); SET_INP(0x79, ADC, ABY, 4);
    SET_INS(0x61, ADC, IZX, 6); SET_INP(0x71, ADC, IZY, 5);
    SET_INS(0xE9, SBC, IMM, 2); SET_INS(0xE5, SBC, ZP, 3); SET_INS(0xF5, SBC, ZPX, 4);
    SET_INS(0xED, SBC, ABS, 4); SET_INP(0xFD, SBC, ABX, 4); SET_INP(0xF9, SBC, ABY, 4);
    SET_INS(0xE1, SBC, IZX, 6); SET_INP(0xF1, SBC, IZY, 5);
    SET_INS(0x29, AND, IMM, 2); SET_INS(0x25, AND, ZP, 3); SET_INS(0x35, AND, ZPX, 4);
    SET_INS(0x2D, AND, ABS, 4); SET_INP(0x3D, AND, ABX, 4); SET_INP(0x39, AND, ABY, 4);
    SET_INS(0x21, AND, IZX, 6); SET_INP(0x31, AND, IZY, 5);
    SET_INS(0x09, ORA, IMM, 2); SET_INS(0x05, ORA, ZP, 3); SET_INS(0x15, ORA, ZPX, 4);
    SET_INS(0x0D, ORA, ABS, 4); SET_INP(0x1D, ORA, ABX, 4); SET_INP(0x19, ORA, ABY, 4);
    SET_INS(0x01, ORA, IZX, 6); SET_INP(0x11, ORA, IZY, 5);
    SET_INS(0x49, EOR, IMM, 2); SET_INS(0x45, EOR, ZP, 3); SET_INS(0x55, EOR, ZPX, 4);
    SET_INS(0x4D, EOR, ABS, 4); SET_INP(0x5D, EOR, ABX, 4); SET_INP(0x59, EOR, ABY, 4);
    SET_INS(0x41, EOR, IZX, 6); SET_INP(0x51, EOR, IZY, 5);
    SET_INS(0xC9, CMP, IMM, 2); SET_INS(0xC5, CMP, ZP, 3); SET_INS(0xD5, CMP, ZPX, 4);
    SET_INS(0xCD, CMP, ABS, 4); SET_INP(0xDD, CMP, ABX, 4); SET_INP(0xD9, CMP, ABY, 4);
    SET_INS(0xC1, CMP, IZX, 6); SET_INP(0xD1, CMP, IZY, 5);
    SET_INS(0xE0, CPX, IMM, 2); SET_INS(0xE4, CPX, ZP, 3); SET_INS(0xEC, CPX, ABS, 4);
    SET_INS(0xC0, CPY, IMM, 2); SET_INS(0xC4, CPY, ZP, 3); SET_INS(0xCC, CPY, ABS, 4);

    // Shifts
    SET_INS(0x0A, ASL, ACC, 2); SET_INS(0x06, ASL, ZP, 5); SET_INS(0x16, ASL, ZPX, 6); SET_INS(0x0E, ASL, ABS, 6); SET_INS(0x1E, ASL, ABX, 7);
    SET_INS(0x4A, LSR, ACC, 2); SET_INS(0x46, LSR, ZP, 5); SET_INS(0x56, LSR, ZPX, 6); SET_INS(0x4E, LSR, ABS, 6); SET_INS(0x5E, LSR, ABX, 7);
    SET_INS(0x2A, ROL, ACC, 2); SET_INS(0x26, ROL, ZP, 5); SET_INS(0x36, ROL, ZPX, 6); SET_INS(0x2E, ROL, ABS, 6); SET_INS(0x3E, ROL, ABX, 7);
    SET_INS(0x6A, ROR, ACC, 2); SET_INS(0x66, ROR, ZP, 5); SET_INS(0x76, ROR, ZPX, 6); SET_INS(0x6E, ROR, ABS, 6); SET_INS(0x7E, ROR, ABX, 7);

    // Register inc/dec
    SET_INS(0xE8, INX, IMP, 2); SET_INS(0xCA, DEX, IMP, 2); SET_INS(0xC8, INY, IMP, 2); SET_INS(0x88, DEY, IMP, 2);

    SET_INS(0xC6, DEC, ZP, 5); SET_INS(0xD6, DEC, ZPX, 6); SET_INS(0xCE, DEC, ABS, 6); SET_INS(0xDE, DEC, ABX, 7);
    SET_INS(0xE6, INC, ZP, 5); SET_INS(0xF6, INC, ZPX, 6); SET_INS(0xEE, INC, ABS, 6); SET_INS(0xFE, INC, ABX, 7);

    // Branches
    SET_INS(0xD0, BNE, REL, 2); SET_INS(0xF0, BEQ, REL, 2);
    SET_INS(0x30, BMI, REL, 2); SET_INS(0x10, BPL, REL, 2);
    SET_INS(0xB0, BCS, REL, 2); SET_INS(0x90, BCC, REL, 2);
    SET_INS(0x70, BVS, REL, 2); SET_INS(0x50, BVC, REL, 2);

    SET_INS(0x24, BIT, ZP, 3); SET_INS(0x2C, BIT, ABS, 4);
    SET_INS(0x48, PHA, IMP, 3); SET_INS(0x08, PHP, IMP, 3);
    SET_INS(0x68, PLA, IMP, 4); SET_INS(0x28, PLP, IMP, 4);
    SET_INS(0x4C, JMP, ABS, 3); SET_INS(0x6C, JMP, IND, 5);

    SET_INS(0x20, JSR, ABS, 6); SET_INS(0x60, RTS, IMP, 6); SET_INS(0x40, RTI, IMP, 6);
    SET_INS(0x00, BRK, IMP, 7);
    SET_INS(0xAA, TAX, IMP, 2); SET_INS(0x8A, TXA, IMP, 2); SET_INS(0xA8, TAY, IMP, 2);
    SET_INS(0x98, TYA, IMP, 2); SET_INS(0xBA, TSX, IMP, 2); SET_INS(0x9A, TXS, IMP, 2);
    SET_INS(0x18, CLC, IMP, 2); SET_INS(0x38, SEC, IMP, 2); SET_INS(0x58, CLI, IMP, 2);
    SET_INS(0x78, SEI, IMP, 2); SET_INS(0xB8, CLV, IMP, 2); SET_INS(0xD8, CLD, IMP, 2);
    SET_INS(0xF8, SED, IMP, 2);

    SET_INS(0xA9, LDA, IMM, 2); SET_INS(0xA5, LDA, ZP, 3); SET_INS(0xB5, LDA, ZPX, 4);
    SET_INS(0xAD, LDA, ABS, 4); SET_INP(0xBD, LDA, ABX, 4); SET_INP(0xB9, LDA, ABY, 4);
    SET_INS(0xA1, LDA, IZX, 6); SET_INP(0xB1, LDA, IZY, 5);

    SET_INS(0xA2, LDX, IMM, 2); SET_INS(0xA6, LDX, ZP, 3); SET_INS(0xB6, LDX, ZPY, 4);
    SET_INS(0xAE, LDX, ABS, 4); SET_INP(0xBE, LDX, ABY, 4);

    SET_INS(0xA0, LDY, IMM, 2); SET_INS(0xA4, LDY, ZP, 3); SET_INS(0xB4, LDY, ZPX, 4);
    SET_INS(0xAC, LDY, ABS, 4); SET_INP(0xBC, LDY, ABX, 4);

    // Indexed stores always spend the extra cycle
    SET_INS(0x85, STA, ZP, 3); SET_INS(0x95, STA, ZPX, 4); SET_INS(0x8D, STA, ABS, 4);
    SET_INS(0x9D, STA, ABX, 5); SET_INS(0x99, STA, ABY, 5); SET_INS(0x81, STA, IZX, 6);
    SET_INS(0x91, STA, IZY, 6);

    SET_INS(0x86, STX, ZP, 3); SET_INS(0x96, STX, ZPY, 4); SET_INS(0x8E, STX, ABS, 4);
    SET_INS(0x84, STY, ZP, 3); SET_INS(0x94, STY, ZPX, 4); SET_INS(0x8C, STY, ABS, 4);

    SET_INS(0xEA, NOP, IMP, 2);

    ////////
    // Unofficial opcodes
    SET_INS(0x0B, ANC, IMM, 2); SET_INS(0x2B, ANC, IMM, 2);
    SET_INS(0x4B, ASR, IMM, 2);
    SET_INS(0x6B, ARR, IMM, 2);
    SET_INS(0xCB, AXS, IMM, 2);
    SET_INS(0xEB, SBC, IMM, 2);

    SET_INS(0xC7, DCP, ZP, 5); SET_INS(0xD7, DCP, ZPX, 6); SET_INS(0xCF, DCP, ABS, 6);
    SET_INS(0xDF, DCP, ABX, 7); SET_INS(0xDB, DCP, ABY, 7); SET_INS(0xC3, DCP, IZX, 8);
    SET_INS(0xD3, DCP, IZY, 8);

    SET_INS(0xE7, ISC, ZP, 5); SET_INS(0xF7, ISC, ZPX, 6); SET_INS(0xEF, ISC, ABS, 6);
    SET_INS(0xFF, ISC, ABX, 7); SET_INS(0xFB, ISC, ABY, 7); SET_INS(0xE3, ISC, IZX, 8);
    SET_INS(0xF3, ISC, IZY, 8);

    SET_INS(0x07, SLO, ZP, 5); SET_INS(0x17, SLO, ZPX, 6); SET_INS(0x0F, SLO, ABS, 6);
    SET_INS(0x1F, SLO, ABX, 7); SET_INS(0x1B, SLO, ABY, 7); SET_INS(0x03, SLO, IZX, 8);
    SET_INS(0x13, SLO, IZY, 8);

    SET_INS(0x27, RLA, ZP, 5); SET_INS(0x37, RLA, ZPX, 6); SET_INS(0x2F, RLA, ABS, 6);
    SET_INS(0x3F, RLA, ABX, 7); SET_INS(0x3B, RLA, ABY, 7); SET_INS(0x23, RLA, IZX, 8);
    SET_INS(0x33, RLA, IZY, 8);

    SET_INS(0x47, SRE, ZP, 5); SET_INS(0x57, SRE, ZPX, 6); SET_INS(0x4F, SRE, ABS, 6);
    SET_INS(0x5F, SRE, ABX, 7); SET_INS(0x5B, SRE, ABY, 7); SET_INS(0x43, SRE, IZX, 8);
    SET_INS(0x53, SRE, IZY, 8);

    SET_INS(0x67, RRA, ZP, 5); SET_INS(0x77, RRA, ZPX, 6); SET_INS(0x6F, RRA, ABS, 6);
    SET_INS(0x7F, RRA, ABX, 7); SET_INS(0x7B, RRA, ABY, 7); SET_INS(0x63, RRA, IZX, 8);
    SET_INS(0x73, RRA, IZY, 8);

    SET_INS(0xA7, LAX, ZP, 3); SET_INS(0xB7, LAX, ZPY, 4); SET_INS(0xAF, LAX, ABS, 4);
    SET_INP(0xBF, LAX, ABY, 4); SET_INS(0xA3, LAX, IZX, 6); SET_INP(0xB3, LAX, IZY, 5);

    SET_INS(0x87, SAX, ZP, 3); SET_INS(0x97, SAX, ZPY, 4); SET_INS(0x8F, SAX, ABS, 4);
    SET_INS(0x83, SAX, IZX, 6);

    // Double-NOP (DOP / SKB)
    SET_INS(0x80, DOP, IMM, 2); SET_INS(0x82, DOP, IMM, 2); SET_INS(0x89, DOP, IMM, 2);
    SET_INS(0xC2, DOP, IMM, 2); SET_INS(0xE2, DOP, IMM, 2);
    SET_INS(0x04, DOP, ZP, 3); SET_INS(0x44, DOP, ZP, 3); SET_INS(0x64, DOP, ZP, 3);
    SET_INS(0x14, DOP, ZPX, 4); SET_INS(0x34, DOP, ZPX, 4); SET_INS(0x54, DOP, ZPX, 4);
    SET_INS(0x74, DOP, ZPX, 4); SET_INS(0xD4, DOP, ZPX, 4); SET_INS(0xF4, DOP, ZPX, 4);

    // Triple-NOP (TOP / SKW)
    SET_INS(0x0C, TOP, ABS, 4);
    SET_INP(0x1C, TOP, ABX, 4); SET_INP(0x3C, TOP, ABX, 4); SET_INP(0x5C, TOP, ABX, 4);
    SET_INP(0x7C, TOP, ABX, 4); SET_INP(0xDC, TOP, ABX, 4); SET_INP(0xFC, TOP, ABX, 4);

    // single-byte NOPs
    SET_INS(0x1A, NOP, IMP, 2); SET_INS(0x3A, NOP, IMP, 2); SET_INS(0x5A, NOP, IMP, 2);
    SET_INS(0x7A, NOP, IMP, 2); SET_INS(0xDA, NOP, IMP, 2); SET_INS(0xFA, NOP, IMP, 2);

    // Results depend on analog effects of the chip
    SET_INS(0x8B, UNS, IMM, 2); SET_INS(0xAB, UNS, IMM, 2);
    SET_INS(0x93, UNS, IZY, 6); SET_INS(0x9F, UNS, ABY, 5);
    SET_INS(0x9B, UNS, ABY, 5); SET_INS(0x9C, UNS, ABX, 5);
    SET_INS(0x9E, UNS, ABY, 5); SET_INS(0xBB, UNS, ABY, 4);
}

#undef SET_INS
#undef SET_INP

// Addressing modes
AddressingResult CPU::addr_IMP() {
    return { 0, true, false };
}

AddressingResult CPU::addr_ACC() {
    return { 0, true, false };
}

AddressingResult CPU::addr_IMM() {
    return { PC++, false, false };
}

AddressingResult CPU::addr_ZP() {
    return { readByte(PC++), false, false };
}

AddressingResult CPU::addr_ZPX() {
    return { uint16_t((readByte(PC++) + X) & 0xFF), false, false };
}

AddressingResult CPU::addr_ZPY() {
    return { uint16_t((readByte(PC++) + Y) & 0xFF), false, false };
}

AddressingResult CPU::addr_REL() {
    int8_t o = (int8_t)readByte(PC++);
    uint16_t target = PC + o;
    return { target, false, (PC & 0xFF00) != (target & 0xFF00) };
}

AddressingResult CPU::addr_ABS() {
    uint16_t a = readWord(PC);
    PC += 2;
    return { a, false, false };
}

AddressingResult CPU::addr_ABX() {
    uint16_t base = readWord(PC);
    PC += 2;
    uint16_t a = base + X;
    return { a, false, (base & 0xFF00) != (a & 0xFF00) };
}

AddressingResult CPU::addr_ABY() {
    uint16_t base = readWord(PC);
    PC += 2;
    uint16_t a = base + Y;
    return { a, false, (base & 0xFF00) != (a & 0xFF00) };
}

AddressingResult CPU::addr_IND() {
    uint16_t ptr = readWord(PC);
    PC += 2;
    // The high byte is fetched without carrying into the pointer's page
    uint16_t lo = readByte(ptr);
    uint16_t hi = readByte((ptr & 0xFF00) | ((ptr + 1) & 0x00FF));
    return { uint16_t((hi << 8) | lo), false, false };
}

AddressingResult CPU::addr_IZX() {
    uint8_t zp = (readByte(PC++) + X) & 0xFF;
    uint16_t lo = readByte(zp);
    uint16_t hi = readByte((zp + 1) & 0xFF);
    return { uint16_t((hi << 8) | lo), false, false };
}

AddressingResult CPU::addr_IZY() {
    uint8_t zp = readByte(PC++);
    uint16_t lo = readByte(zp);
    uint16_t hi = readByte((zp + 1) & 0xFF);
    uint16_t base = (hi << 8) | lo;
    uint16_t a = base + Y;
    return { a, false, (base & 0xFF00) != (a & 0xFF00) };
}

// Bus operations
uint8_t CPU::readByte(uint16_t a) {
    return bus.read(a);
}

void CPU::writeByte(uint16_t a, uint8_t d) {
    bus.write(a, d);
}

uint16_t CPU::readWord(uint16_t a) {
    uint16_t lo = readByte(a);
    uint16_t hi = readByte(a + 1);
    return (hi << 8) | lo;
}

void CPU::push(uint8_t data) {
    writeByte(STACK_BASE + SP--, data);
}

uint8_t CPU::pull() {
    return readByte(STACK_BASE + ++SP);
}

uint8_t CPU::fetch() {
    return operand.registerOperand ? A : readByte(operand.address);
}

void CPU::store(uint8_t value) {
    if (operand.registerOperand) A = value;
    else writeByte(operand.address, value);
}

void CPU::setFlag(uint8_t mask, bool v) { if (v) status |= mask; else status &= ~mask; }
bool CPU::getFlag(uint8_t mask) const { return (status & mask) != 0; }

void CPU::setZN(uint8_t value) {
    setFlag(FLAG_ZERO, value == 0);
    setFlag(FLAG_NEGATIVE, (value & 0x80) != 0);
}

/////////////////////////
// Shared kernels
/////////////////////////

// Binary only: the decimal flag has no effect on the 2A03
void CPU::addWithCarry(uint8_t value) {
    uint16_t sum = A + value + (getFlag(FLAG_CARRY) ? 1 : 0);
    uint8_t result = sum & 0xFF;
    setFlag(FLAG_CARRY, sum > 0xFF);
    setFlag(FLAG_OVERFLOW, ((A ^ value) & 0x80) == 0 && ((A ^ result) & 0x80) != 0);
    A = result;
    setZN(A);
}

void CPU::compare(uint8_t reg, uint8_t value) {
    setFlag(FLAG_CARRY, reg >= value);
    setZN(uint8_t(reg - value));
}

// Taken branches cost one cycle, two when landing on another page
uint8_t CPU::branch(bool condition) {
    if (!condition) return 0;
    PC = operand.address;
    return operand.pageCrossed ? 2 : 1;
}

uint8_t CPU::shiftLeft(uint8_t value) {
    uint8_t result = value << 1;
    setFlag(FLAG_CARRY, (value & 0x80) != 0);
    setZN(result);
    return result;
}

uint8_t CPU::shiftRight(uint8_t value) {
    uint8_t result = value >> 1;
    setFlag(FLAG_CARRY, (value & 0x01) != 0);
    setZN(result);
    return result;
}

uint8_t CPU::rotateLeft(uint8_t value) {
    uint8_t result = (value << 1) | (getFlag(FLAG_CARRY) ? 1 : 0);
    setFlag(FLAG_CARRY, (value & 0x80) != 0);
    setZN(result);
    return result;
}

uint8_t CPU::rotateRight(uint8_t value) {
    uint8_t result = (value >> 1) | (getFlag(FLAG_CARRY) ? 0x80 : 0);
    setFlag(FLAG_CARRY, (value & 0x01) != 0);
    setZN(result);
    return result;
}

/////////////////////////
// Opcode implementations
/////////////////////////
uint8_t CPU::ADC() {
    addWithCarry(fetch());
    return 0;
}

// A - M - (1 - C) == A + ~M + C
uint8_t CPU::SBC() {
    addWithCarry(fetch() ^ 0xFF);
    return 0;
}

uint8_t CPU::AND() { A &= fetch(); setZN(A); return 0; }
uint8_t CPU::ORA() { A |= fetch(); setZN(A); return 0; }
uint8_t CPU::EOR() { A ^= fetch(); setZN(A); return 0; }

uint8_t CPU::CMP() { compare(A, fetch()); return 0; }
uint8_t CPU::CPX() { compare(X, fetch()); return 0; }
uint8_t CPU::CPY() { compare(Y, fetch()); return 0; }

uint8_t CPU::ASL() { store(shiftLeft(fetch())); return 0; }
uint8_t CPU::LSR() { store(shiftRight(fetch())); return 0; }
uint8_t CPU::ROL() { store(rotateLeft(fetch())); return 0; }
uint8_t CPU::ROR() { store(rotateRight(fetch())); return 0; }

uint8_t CPU::INX() { X++; setZN(X); return 0; }
uint8_t CPU::DEX() { X--; setZN(X); return 0; }
uint8_t CPU::INY() { Y++; setZN(Y); return 0; }
uint8_t CPU::DEY() { Y--; setZN(Y); return 0; }

uint8_t CPU::DEC() { uint8_t val = fetch() - 1; writeByte(operand.address, val); setZN(val); return 0; }
uint8_t CPU::INC() { uint8_t val = fetch() + 1; writeByte(operand.address, val); setZN(val); return 0; }

uint8_t CPU::BNE() { return branch(!getFlag(FLAG_ZERO)); }
uint8_t CPU::BEQ() { return branch(getFlag(FLAG_ZERO)); }
uint8_t CPU::BMI() { return branch(getFlag(FLAG_NEGATIVE)); }
uint8_t CPU::BPL() { return branch(!getFlag(FLAG_NEGATIVE)); }
uint8_t CPU::BCS() { return branch(getFlag(FLAG_CARRY)); }
uint8_t CPU::BCC() { return branch(!getFlag(FLAG_CARRY)); }
uint8_t CPU::BVS() { return branch(getFlag(FLAG_OVERFLOW)); }
uint8_t CPU::BVC() { return branch(!getFlag(FLAG_OVERFLOW)); }

uint8_t CPU::BIT() {
    uint8_t value = fetch();
    setFlag(FLAG_ZERO, (A & value) == 0);
    setFlag(FLAG_NEGATIVE, (value & 0x80) != 0);
    setFlag(FLAG_OVERFLOW, (value & 0x40) != 0);
    return 0;
}

uint8_t CPU::PHA() {
    push(A);
    return 0;
}

uint8_t CPU::PHP() {
    push(status | FLAG_BREAK | FLAG_UNUSED);
    return 0;
}

uint8_t CPU::PLA() {
    A = pull();
    setZN(A);
    return 0;
}

// B has no latch in the chip; U is wired high
uint8_t CPU::PLP() {
    status = (pull() & ~FLAG_BREAK) | FLAG_UNUSED;
    return 0;
}

uint8_t CPU::JMP() {
    PC = operand.address;
    return 0;
}

uint8_t CPU::JSR() {
    uint16_t ret = PC - 1;
    push((ret >> 8) & 0xFF);
    push(ret & 0xFF);
    PC = operand.address;
    return 0;
}

uint8_t CPU::RTS() {
    uint16_t lo = pull();
    uint16_t hi = pull();
    PC = ((hi << 8) | lo) + 1;
    return 0;
}

uint8_t CPU::RTI() {
    status = (pull() & ~FLAG_BREAK) | FLAG_UNUSED;
    uint16_t lo = pull();
    uint16_t hi = pull();
    PC = (hi << 8) | lo;
    return 0;
}

uint8_t CPU::TAX() { X = A; setZN(X); return 0; }
uint8_t CPU::TXA() { A = X; setZN(A); return 0; }
uint8_t CPU::TAY() { Y = A; setZN(Y); return 0; }
uint8_t CPU::TYA() { A = Y; setZN(A); return 0; }
uint8_t CPU::TSX() { X = SP; setZN(X); return 0; }
uint8_t CPU::TXS() { SP = X; return 0; }

uint8_t CPU::CLC() { setFlag(FLAG_CARRY, false); return 0; }
uint8_t CPU::SEC() { setFlag(FLAG_CARRY, true); return 0; }
uint8_t CPU::CLI() { setFlag(FLAG_INTERRUPT, false); return 0; }
uint8_t CPU::SEI() { setFlag(FLAG_INTERRUPT, true); return 0; }
uint8_t CPU::CLV() { setFlag(FLAG_OVERFLOW, false); return 0; }
uint8_t CPU::CLD() { setFlag(FLAG_DECIMAL, false); return 0; }
uint8_t CPU::SED() { setFlag(FLAG_DECIMAL, true); return 0; }

uint8_t CPU::LDA() { A = fetch(); setZN(A); return 0; }
uint8_t CPU::LDX() { X = fetch(); setZN(X); return 0; }
uint8_t CPU::LDY() { Y = fetch(); setZN(Y); return 0; }

uint8_t CPU::STA() { writeByte(operand.address, A); return 0; }
uint8_t CPU::STX() { writeByte(operand.address, X); return 0; }
uint8_t CPU::STY() { writeByte(operand.address, Y); return 0; }

uint8_t CPU::NOP() { return 0; }

// The byte after BRK is a padding byte skipped on return
uint8_t CPU::BRK() {
    PC++;
    push((PC >> 8) & 0xFF);
    push(PC & 0xFF);
    setFlag(FLAG_BREAK, true);
    push(status | FLAG_UNUSED);
    setFlag(FLAG_INTERRUPT, true);
    PC = readWord(IRQ_VECTOR);
    return 0;
}

////////////////////////////////
// Unofficial opcodes
////////////////////////////////

uint8_t CPU::ANC() {
    A &= fetch();
    setZN(A);
    setFlag(FLAG_CARRY, (A & 0x80) != 0);
    return 0;
}

uint8_t CPU::ASR() {
    A = shiftRight(A & fetch());
    return 0;
}

// C comes from bit 6, V from bit 6 ^ bit 5 of the rotated result
uint8_t CPU::ARR() {
    uint8_t value = A & fetch();
    A = (value >> 1) | (getFlag(FLAG_CARRY) ? 0x80 : 0);
    setZN(A);
    setFlag(FLAG_CARRY, (A & 0x40) != 0);
    setFlag(FLAG_OVERFLOW, (((A >> 6) ^ (A >> 5)) & 1) != 0);
    return 0;
}

uint8_t CPU::AXS() {
    uint8_t value = fetch();
    uint8_t ax = A & X;
    setFlag(FLAG_CARRY, ax >= value);
    X = ax - value;
    setZN(X);
    return 0;
}

uint8_t CPU::DCP() {
    uint8_t val = fetch() - 1;
    writeByte(operand.address, val);
    compare(A, val);
    return 0;
}

uint8_t CPU::ISC() {
    uint8_t val = fetch() + 1;
    writeByte(operand.address, val);
    addWithCarry(val ^ 0xFF);
    return 0;
}

uint8_t CPU::SLO() {
    uint8_t val = shiftLeft(fetch());
    writeByte(operand.address, val);
    A |= val;
    setZN(A);
    return 0;
}

uint8_t CPU::RLA() {
    uint8_t val = rotateLeft(fetch());
    writeByte(operand.address, val);
    A &= val;
    setZN(A);
    return 0;
}

uint8_t CPU::SRE() {
    uint8_t val = shiftRight(fetch());
    writeByte(operand.address, val);
    A ^= val;
    setZN(A);
    return 0;
}

uint8_t CPU::RRA() {
    uint8_t val = rotateRight(fetch());
    writeByte(operand.address, val);
    addWithCarry(val);
    return 0;
}

uint8_t CPU::LAX() {
    A = X = fetch();
    setZN(A);
    return 0;
}

uint8_t CPU::SAX() {
    writeByte(operand.address, A & X);
    return 0;
}

uint8_t CPU::DOP() { return 0; }
uint8_t CPU::TOP() { return 0; }

uint8_t CPU::UNS() {
    std::ostringstream msg;
    msg << "Unstable opcode 0x" << std::hex << std::uppercase << std::setw(2)
        << std::setfill('0') << int(opcode) << " (" << instructionTable[opcode].name
        << ") at PC=0x" << std::setw(4) << opcodeAddress << " is not emulated";
    logError(msg.str());
    throw UnsupportedFeature(msg.str());
}

uint8_t CPU::JAM() {
    std::ostringstream msg;
    msg << "JAM opcode 0x" << std::hex << std::uppercase << std::setw(2)
        << std::setfill('0') << int(opcode) << " at PC=0x" << std::setw(4)
        << opcodeAddress;
    logError(msg.str());
    throw UnsupportedFeature(msg.str());
}
