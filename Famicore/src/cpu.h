#pragma once

#include <cstdint>
#include "bus.h"
#include "interrupt_line.h"

// 6502 status flags
static constexpr uint8_t FLAG_CARRY = 1 << 0;
static constexpr uint8_t FLAG_ZERO = 1 << 1;
static constexpr uint8_t FLAG_INTERRUPT = 1 << 2;
static constexpr uint8_t FLAG_DECIMAL = 1 << 3;
static constexpr uint8_t FLAG_BREAK = 1 << 4;
static constexpr uint8_t FLAG_UNUSED = 1 << 5;
static constexpr uint8_t FLAG_OVERFLOW = 1 << 6;
static constexpr uint8_t FLAG_NEGATIVE = 1 << 7;

// All 6502 addressing modes
enum class AddrMode {
    IMP, ACC, IMM, ZP, ZPX, ZPY,
    REL, ABS, ABX, ABY, IND, IZX, IZY
};

// Where an instruction's operand lives once its addressing mode ran.
struct AddressingResult {
    uint16_t address = 0;
    bool registerOperand = false;  // implied / accumulator: operand is A
    bool pageCrossed = false;
};

// Forward declare CPU
class CPU;

// Instruction descriptor
struct Instruction {
    const char* name;             // mnemonic, e.g. "LDA"
    AddrMode    mode;             // addressing mode
    uint8_t     cycles;           // base cycle count
    bool        pageCrossPenalty; // +1 cycle when the effective address crosses a page
    uint8_t(CPU::* operate)();    // core logic (returns extra cycles)
    AddressingResult(CPU::* addrmode)();
};

// 256-entry table, built once before main()
extern Instruction instructionTable[256];

class CPU {
public:
    CPU(Bus& bus, InterruptLine& nmiLine);

    static void initInstructionTable();

    void reset();

    // Advance one CPU cycle. The call that starts an instruction performs all
    // of its effects and loads the countdown; later calls only count down.
    void clock();

    // True when the next clock() begins a new instruction (or interrupt).
    bool instructionComplete() const;

    // DMA transfers halt the CPU for a number of cycles.
    void addStallCycles(int cycles);

    void setTraceEnabled(bool enabled);

    uint64_t getTotalCycles() const;

    // Registers (read-only)
    uint16_t getPC() const { return PC; }
    uint8_t  getA() const { return A; }
    uint8_t  getX() const { return X; }
    uint8_t  getY() const { return Y; }
    uint8_t  getSP() const { return SP; }
    uint8_t  getStatus() const { return status; }
    uint8_t  getOpcode() const { return opcode; }
    int      getCyclesRemaining() const { return cyclesRemaining; }
    bool     getFlag(uint8_t mask) const;

private:
    Bus& bus;
    InterruptLine& nmiLine;

    uint16_t PC;
    uint8_t  A, X, Y, SP, status;
    int      cyclesRemaining;
    int      stallCycles;
    uint8_t  opcode;
    uint16_t opcodeAddress;  // where the current instruction was fetched
    AddressingResult operand;

    uint64_t totalCycles;
    bool     resetDone;
    bool     traceEnabled;

    void nmi();
    void trace(uint16_t pc) const;

    uint8_t readByte(uint16_t addr);
    void    writeByte(uint16_t addr, uint8_t data);
    uint16_t readWord(uint16_t addr);

    void    push(uint8_t data);
    uint8_t pull();

    // Operand access through the resolved AddressingResult
    uint8_t fetch();
    void    store(uint8_t value);

    // Addressing-mode helpers
    AddressingResult addr_IMP(); AddressingResult addr_ACC(); AddressingResult addr_IMM();
    AddressingResult addr_ZP(); AddressingResult addr_ZPX(); AddressingResult addr_ZPY();
    AddressingResult addr_REL(); AddressingResult addr_ABS(); AddressingResult addr_ABX();
    AddressingResult addr_ABY(); AddressingResult addr_IND(); AddressingResult addr_IZX();
    AddressingResult addr_IZY();

    // Opcode implementations
    uint8_t ADC();  uint8_t SBC();  uint8_t AND();  uint8_t ORA();
    uint8_t EOR();  uint8_t CMP();  uint8_t CPX();  uint8_t CPY();

    uint8_t ASL(); uint8_t LSR(); uint8_t ROL(); uint8_t ROR();
    uint8_t INX(); uint8_t DEX(); uint8_t INY(); uint8_t DEY();

    uint8_t DEC(); uint8_t INC(); uint8_t BNE(); uint8_t BEQ();
    uint8_t BMI(); uint8_t BPL(); uint8_t BCS(); uint8_t BCC();

    uint8_t BIT(); uint8_t BVS(); uint8_t BVC(); uint8_t PHA();
    uint8_t PHP(); uint8_t PLA(); uint8_t PLP(); uint8_t JMP();

    uint8_t JSR(); uint8_t RTS(); uint8_t RTI(); uint8_t TAX();
    uint8_t TXA(); uint8_t TAY(); uint8_t TYA(); uint8_t TSX();
    uint8_t TXS(); uint8_t CLC(); uint8_t SEC(); uint8_t CLI();
    uint8_t SEI(); uint8_t CLV(); uint8_t CLD(); uint8_t SED();

    uint8_t LDA(); uint8_t LDX(); uint8_t LDY(); uint8_t STA();
    uint8_t STX(); uint8_t STY(); uint8_t NOP();

    uint8_t BRK();

    // Stable unofficial NMOS opcodes
    uint8_t ANC();  // AND, carry = bit 7
    uint8_t ASR();  // AND then LSR (ALR)
    uint8_t ARR();  // AND then ROR, odd C/V rules
    uint8_t AXS();  // X = (A & X) - operand (SBX)
    uint8_t DCP();  // DEC then CMP
    uint8_t ISC();  // INC then SBC
    uint8_t SLO();  // ASL then ORA
    uint8_t RLA();  // ROL then AND
    uint8_t SRE();  // LSR then EOR
    uint8_t RRA();  // ROR then ADC
    uint8_t LAX();  // LDA + LDX
    uint8_t SAX();  // store A & X
    uint8_t DOP();  // two-byte NOP
    uint8_t TOP();  // three-byte NOP

    uint8_t UNS();  // unstable opcode, not modeled
    uint8_t JAM();  // halts a real CPU

    // Shared arithmetic/shift kernels
    void    addWithCarry(uint8_t value);
    void    compare(uint8_t reg, uint8_t value);
    uint8_t branch(bool condition);
    uint8_t shiftLeft(uint8_t value);
    uint8_t shiftRight(uint8_t value);
    uint8_t rotateLeft(uint8_t value);
    uint8_t rotateRight(uint8_t value);

    // Flag helpers
    void setFlag(uint8_t mask, bool v);
    void setZN(uint8_t value);
};
