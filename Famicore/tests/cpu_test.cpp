#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config.h"
#include "core.h"
#include "cpu.h"
#include "interrupt_line.h"
#include "test_buses.h"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

class CPUTest : public ::testing::Test {
protected:
    FlatBus bus;
    InterruptLine nmi;
    CPU cpu{ bus, nmi };

    void boot(std::initializer_list<uint8_t> program, uint16_t origin = 0x8000) {
        bus.load(origin, program);
        bus.setVector(RESET_VECTOR, origin);
        bus.setVector(NMI_VECTOR, 0x9000);
        bus.setVector(IRQ_VECTOR, 0xA000);
        cpu.reset();
    }

    // Clocks through one instruction (or interrupt) and returns the cycles it took.
    int runInstruction() {
        int cycles = 0;
        do {
            cpu.clock();
            ++cycles;
        } while (!cpu.instructionComplete());
        return cycles;
    }

    void runInstructions(int count) {
        for (int i = 0; i < count; ++i) runInstruction();
    }
};

TEST_F(CPUTest, ResetLoadsVectorAndPowerUpState) {
    bus.setVector(RESET_VECTOR, 0x1234);
    cpu.reset();

    EXPECT_EQ(cpu.getPC(), 0x1234);
    EXPECT_EQ(cpu.getSP(), 0xFD);
    EXPECT_EQ(cpu.getStatus(), 0x24);
    EXPECT_EQ(cpu.getA(), 0);
    EXPECT_EQ(cpu.getX(), 0);
    EXPECT_EQ(cpu.getY(), 0);
    EXPECT_TRUE(cpu.getFlag(FLAG_INTERRUPT));
    EXPECT_TRUE(cpu.getFlag(FLAG_UNUSED));
    EXPECT_EQ(cpu.getTotalCycles(), 7u);
    EXPECT_TRUE(cpu.instructionComplete());
}

TEST_F(CPUTest, ClockBeforeResetThrows) {
    CPU fresh(bus, nmi);
    EXPECT_THROW(fresh.clock(), ContractViolation);
}

TEST_F(CPUTest, FirstClockAppliesEffectThenCountsDown) {
    boot({ 0xA9, 0x42, 0xEA });  // LDA #$42; NOP

    cpu.clock();
    EXPECT_EQ(cpu.getA(), 0x42);
    EXPECT_EQ(cpu.getPC(), 0x8002);
    EXPECT_EQ(cpu.getCyclesRemaining(), 1);
    EXPECT_FALSE(cpu.instructionComplete());

    cpu.clock();
    EXPECT_TRUE(cpu.instructionComplete());
    EXPECT_EQ(cpu.getPC(), 0x8002);
    EXPECT_EQ(cpu.getTotalCycles(), 9u);
}

TEST_F(CPUTest, AddWithCarrySignedOverflow) {
    boot({ 0xA9, 0x7F, 0x69, 0x01 });  // LDA #$7F; ADC #$01
    runInstructions(2);

    EXPECT_EQ(cpu.getA(), 0x80);
    EXPECT_TRUE(cpu.getFlag(FLAG_OVERFLOW));
    EXPECT_FALSE(cpu.getFlag(FLAG_CARRY));
    EXPECT_TRUE(cpu.getFlag(FLAG_NEGATIVE));
    EXPECT_FALSE(cpu.getFlag(FLAG_ZERO));
}

TEST_F(CPUTest, SubtractWithCarrySignedOverflow) {
    boot({ 0xA9, 0xFE, 0x38, 0xE9, 0x7F });  // LDA #$FE; SEC; SBC #$7F
    runInstructions(3);

    EXPECT_EQ(cpu.getA(), 0x7F);
    EXPECT_TRUE(cpu.getFlag(FLAG_OVERFLOW));
    EXPECT_TRUE(cpu.getFlag(FLAG_CARRY));
    EXPECT_FALSE(cpu.getFlag(FLAG_NEGATIVE));
}

TEST_F(CPUTest, AddWithCarryProducesCarryAndZero) {
    boot({ 0xA9, 0xFF, 0x69, 0x01 });
    runInstructions(2);

    EXPECT_EQ(cpu.getA(), 0x00);
    EXPECT_TRUE(cpu.getFlag(FLAG_CARRY));
    EXPECT_TRUE(cpu.getFlag(FLAG_ZERO));
    EXPECT_FALSE(cpu.getFlag(FLAG_OVERFLOW));
}

TEST_F(CPUTest, DecimalFlagDoesNotAffectAddition) {
    boot({ 0xF8, 0xA9, 0x09, 0x18, 0x69, 0x01 });  // SED; LDA #$09; CLC; ADC #$01
    runInstructions(4);

    EXPECT_EQ(cpu.getA(), 0x0A);
    EXPECT_TRUE(cpu.getFlag(FLAG_DECIMAL));
}

TEST_F(CPUTest, PushPullAccumulatorRoundTrip) {
    boot({ 0xA9, 0x42, 0x48, 0xA9, 0x00, 0x68 });  // LDA #$42; PHA; LDA #$00; PLA
    runInstructions(2);
    EXPECT_EQ(cpu.getSP(), 0xFC);
    EXPECT_EQ(bus.mem[0x01FD], 0x42);

    runInstructions(2);
    EXPECT_EQ(cpu.getA(), 0x42);
    EXPECT_EQ(cpu.getSP(), 0xFD);
    EXPECT_FALSE(cpu.getFlag(FLAG_ZERO));
}

TEST_F(CPUTest, PushStatusSetsBreakAndUnused) {
    boot({ 0x08, 0xA9, 0x00, 0x28 });  // PHP; LDA #$00; PLP
    runInstruction();
    EXPECT_EQ(bus.mem[0x01FD], 0x34);

    runInstructions(2);
    EXPECT_EQ(cpu.getStatus(), 0x24);
}

TEST_F(CPUTest, PullStatusIgnoresBreakKeepsUnused) {
    boot({ 0xA9, 0xCF, 0x48, 0x28 });  // LDA #$CF; PHA; PLP
    runInstructions(3);

    EXPECT_EQ(cpu.getStatus(), 0xEF);
    EXPECT_FALSE(cpu.getFlag(FLAG_BREAK));
    EXPECT_TRUE(cpu.getFlag(FLAG_UNUSED));
}

TEST_F(CPUTest, JumpIndirectWrapsWithinPage) {
    boot({ 0x6C, 0xFF, 0x02 });  // JMP ($02FF)
    bus.mem[0x02FF] = 0x34;
    bus.mem[0x0200] = 0x12;
    bus.mem[0x0300] = 0x99;

    EXPECT_EQ(runInstruction(), 5);
    EXPECT_EQ(cpu.getPC(), 0x1234);
}

TEST_F(CPUTest, SubroutineCallAndReturn) {
    boot({ 0x20, 0x00, 0x90 });  // JSR $9000
    bus.load(0x9000, { 0x60 });  // RTS

    EXPECT_EQ(runInstruction(), 6);
    EXPECT_EQ(cpu.getPC(), 0x9000);
    EXPECT_EQ(cpu.getSP(), 0xFB);
    EXPECT_EQ(bus.mem[0x01FD], 0x80);
    EXPECT_EQ(bus.mem[0x01FC], 0x02);

    EXPECT_EQ(runInstruction(), 6);
    EXPECT_EQ(cpu.getPC(), 0x8003);
    EXPECT_EQ(cpu.getSP(), 0xFD);
}

TEST_F(CPUTest, BreakPushesReturnAddressAndStatus) {
    boot({ 0x00, 0xFF });  // BRK + padding byte

    EXPECT_EQ(runInstruction(), 7);
    EXPECT_EQ(cpu.getPC(), 0xA000);
    EXPECT_EQ(bus.mem[0x01FD], 0x80);
    EXPECT_EQ(bus.mem[0x01FC], 0x02);
    EXPECT_EQ(bus.mem[0x01FB], 0x34);
    EXPECT_EQ(cpu.getSP(), 0xFA);
    EXPECT_TRUE(cpu.getFlag(FLAG_INTERRUPT));
}

TEST_F(CPUTest, BreakAtAddressZeroPushesTwo) {
    bus.setVector(IRQ_VECTOR, 0xA000);
    boot({ 0x00, 0x00 }, 0x0000);

    runInstruction();
    EXPECT_EQ(bus.mem[0x01FD], 0x00);
    EXPECT_EQ(bus.mem[0x01FC], 0x02);
}

TEST_F(CPUTest, ReturnFromInterruptPullsStatusThenPC) {
    boot({ 0x00, 0xFF, 0xEA });
    bus.load(0xA000, { 0x40 });  // RTI

    runInstruction();
    EXPECT_EQ(runInstruction(), 6);
    EXPECT_EQ(cpu.getPC(), 0x8002);
    EXPECT_EQ(cpu.getStatus(), 0x24);
    EXPECT_EQ(cpu.getSP(), 0xFD);
}

TEST_F(CPUTest, NmiServicedOnNextClock) {
    boot({ 0xEA, 0xEA });
    nmi.raise();

    cpu.clock();
    EXPECT_EQ(cpu.getPC(), 0x9000);
    EXPECT_FALSE(nmi.isPending());
    EXPECT_EQ(cpu.getCyclesRemaining(), 6);

    EXPECT_EQ(bus.mem[0x01FD], 0x80);
    EXPECT_EQ(bus.mem[0x01FC], 0x00);
    EXPECT_EQ(bus.mem[0x01FB], 0x24);  // B clear, U set
    EXPECT_EQ(cpu.getSP(), 0xFA);
    EXPECT_TRUE(cpu.getFlag(FLAG_INTERRUPT));
}

TEST_F(CPUTest, NmiTakesSevenCycles) {
    boot({ 0xEA });
    nmi.raise();
    EXPECT_EQ(runInstruction(), 7);
}

TEST_F(CPUTest, NmiWaitsForInstructionBoundary) {
    boot({ 0xAD, 0x00, 0x02, 0xEA });  // LDA $0200
    cpu.clock();
    nmi.raise();

    cpu.clock();
    cpu.clock();
    cpu.clock();
    EXPECT_TRUE(cpu.instructionComplete());
    EXPECT_EQ(cpu.getPC(), 0x8003);
    EXPECT_TRUE(nmi.isPending());

    cpu.clock();
    EXPECT_EQ(cpu.getPC(), 0x9000);
    EXPECT_EQ(bus.mem[0x01FC], 0x03);
}

TEST_F(CPUTest, RepeatedNmiRaiseCoalesces) {
    boot({ 0xEA });
    bus.load(0x9000, { 0xEA });
    nmi.raise();
    nmi.raise();

    runInstruction();
    EXPECT_EQ(runInstruction(), 2);
    EXPECT_EQ(cpu.getPC(), 0x9001);
}

TEST_F(CPUTest, ZeroPageIndexWrapsAround) {
    boot({ 0xA2, 0x01, 0xB5, 0xFF });  // LDX #$01; LDA $FF,X
    bus.mem[0x0000] = 0x77;
    bus.mem[0x0100] = 0x11;
    runInstructions(2);

    EXPECT_EQ(cpu.getA(), 0x77);
}

TEST_F(CPUTest, IndexedIndirectPointerWrapsInZeroPage) {
    boot({ 0xA1, 0xFF });  // LDA ($FF,X)
    bus.mem[0x00FF] = 0x34;
    bus.mem[0x0000] = 0x12;
    bus.mem[0x0100] = 0x99;
    bus.mem[0x1234] = 0x5A;

    EXPECT_EQ(runInstruction(), 6);
    EXPECT_EQ(cpu.getA(), 0x5A);
}

TEST_F(CPUTest, IndirectIndexedAddsY) {
    boot({ 0xA0, 0x10, 0xB1, 0x20 });  // LDY #$10; LDA ($20),Y
    bus.mem[0x0020] = 0x00;
    bus.mem[0x0021] = 0x30;
    bus.mem[0x3010] = 0xAB;

    runInstruction();
    EXPECT_EQ(runInstruction(), 5);
    EXPECT_EQ(cpu.getA(), 0xAB);
    EXPECT_TRUE(cpu.getFlag(FLAG_NEGATIVE));
}

TEST_F(CPUTest, StallCyclesHoldTheCPU) {
    boot({ 0xEA });
    cpu.addStallCycles(OAM_DMA_STALL_CYCLES);

    for (int i = 0; i < OAM_DMA_STALL_CYCLES; ++i) {
        EXPECT_FALSE(cpu.instructionComplete());
        cpu.clock();
    }
    EXPECT_EQ(cpu.getPC(), 0x8000);
    EXPECT_TRUE(cpu.instructionComplete());
    EXPECT_EQ(cpu.getTotalCycles(), 7u + OAM_DMA_STALL_CYCLES);

    runInstruction();
    EXPECT_EQ(cpu.getPC(), 0x8001);
}

TEST_F(CPUTest, JamOpcodeThrows) {
    boot({ 0x02 });
    EXPECT_THROW(cpu.clock(), UnsupportedFeature);
}

TEST_F(CPUTest, UnstableOpcodesThrow) {
    for (uint8_t op : { 0x8B, 0xAB, 0x93, 0x9F, 0x9B, 0x9C, 0x9E, 0xBB }) {
        FlatBus local;
        InterruptLine line;
        CPU unit(local, line);
        local.load(0x8000, { op, 0x00, 0x00 });
        local.setVector(RESET_VECTOR, 0x8000);
        unit.reset();
        EXPECT_THROW(unit.clock(), UnsupportedFeature) << "opcode " << int(op);
    }
}

TEST_F(CPUTest, UnstableOpcodeReportsItsOwnAddress) {
    boot({ 0xEA, 0xBB, 0x34, 0x12 });  // NOP; LAS $1234,Y
    runInstruction();

    try {
        cpu.clock();
        FAIL() << "LAS did not throw";
    }
    catch (const UnsupportedFeature& e) {
        EXPECT_THAT(e.what(), HasSubstr("PC=0x8001"));
    }
}

TEST_F(CPUTest, JamReportsItsOwnAddress) {
    boot({ 0xEA, 0x02 });
    runInstruction();

    try {
        cpu.clock();
        FAIL() << "JAM did not throw";
    }
    catch (const UnsupportedFeature& e) {
        EXPECT_THAT(e.what(), HasSubstr("PC=0x8001"));
    }
}

TEST_F(CPUTest, ResetDropsNmiRaisedBeforehand) {
    bus.load(0x8000, { 0xEA });
    bus.setVector(RESET_VECTOR, 0x8000);
    bus.setVector(NMI_VECTOR, 0x9000);
    nmi.raise();

    cpu.reset();
    EXPECT_FALSE(nmi.isPending());

    cpu.clock();
    EXPECT_EQ(cpu.getPC(), 0x8001);
}

TEST_F(CPUTest, TraceDoesNotDisturbExecution) {
    boot({ 0xA9, 0x05 });
    cpu.setTraceEnabled(true);
    runInstruction();
    EXPECT_EQ(cpu.getA(), 0x05);
}

// ---------------------------------------------------------------------------
// Exact bus traffic
// ---------------------------------------------------------------------------

TEST(CPUBusTest, ResetReadsVectorLittleEndian) {
    StrictMock<MockBus> bus;
    InterruptLine nmi;
    CPU cpu(bus, nmi);

    InSequence seq;
    EXPECT_CALL(bus, read(0xFFFC)).WillOnce(Return(0x34));
    EXPECT_CALL(bus, read(0xFFFD)).WillOnce(Return(0x12));

    cpu.reset();
    EXPECT_EQ(cpu.getPC(), 0x1234);
}

TEST(CPUBusTest, StoreDoesNotReadItsTarget) {
    NiceMock<MockBus> bus;
    bus.delegateToFlat();
    bus.flat.load(0x8000, { 0x8D, 0x02, 0x20 });  // STA $2002
    bus.flat.setVector(RESET_VECTOR, 0x8000);

    InterruptLine nmi;
    CPU cpu(bus, nmi);
    cpu.reset();

    EXPECT_CALL(bus, read(_)).Times(AnyNumber());
    EXPECT_CALL(bus, read(0x2002)).Times(0);
    EXPECT_CALL(bus, write(0x2002, 0x00)).Times(1);
    cpu.clock();
}

TEST(CPUBusTest, ReadModifyWriteTouchesTargetOnce) {
    NiceMock<MockBus> bus;
    bus.delegateToFlat();
    bus.flat.load(0x8000, { 0xE6, 0x10 });  // INC $10
    bus.flat.setVector(RESET_VECTOR, 0x8000);
    bus.flat.mem[0x0010] = 0x7F;

    InterruptLine nmi;
    CPU cpu(bus, nmi);
    cpu.reset();

    EXPECT_CALL(bus, read(_)).Times(AnyNumber());
    EXPECT_CALL(bus, read(0x0010)).Times(1);
    EXPECT_CALL(bus, write(0x0010, 0x80)).Times(1);
    cpu.clock();
    EXPECT_TRUE(cpu.getFlag(FLAG_NEGATIVE));
}

TEST(CPUBusTest, NmiPushOrder) {
    NiceMock<MockBus> bus;
    bus.delegateToFlat();
    bus.flat.load(0x8123, { 0xEA });
    bus.flat.setVector(RESET_VECTOR, 0x8123);
    bus.flat.setVector(NMI_VECTOR, 0x9000);

    InterruptLine nmi;
    CPU cpu(bus, nmi);
    cpu.reset();
    nmi.raise();

    EXPECT_CALL(bus, read(_)).Times(AnyNumber());
    {
        InSequence seq;
        EXPECT_CALL(bus, write(0x01FD, 0x81));
        EXPECT_CALL(bus, write(0x01FC, 0x23));
        EXPECT_CALL(bus, write(0x01FB, 0x24));
        EXPECT_CALL(bus, read(0xFFFA));
        EXPECT_CALL(bus, read(0xFFFB));
    }
    cpu.clock();
    EXPECT_EQ(cpu.getPC(), 0x9000);
}
