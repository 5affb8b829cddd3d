#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "config.h"
#include "core.h"
#include "cpu.h"
#include "frame_buffer.h"
#include "interrupt_line.h"
#include "memory_bus.h"
#include "ppu.h"
#include "video_memory.h"

class MemoryBusTest : public ::testing::Test {
protected:
    VideoMemory vram;
    InterruptLine nmi;
    FrameBuffer frame;
    PPU ppu{ vram, nmi, frame };
    MemoryBus bus{ ppu };

    void SetUp() override {
        ppu.reset();
    }
};

TEST_F(MemoryBusTest, WorkRamMirrorsEvery2K) {
    bus.write(0x0001, 0x42);
    EXPECT_EQ(bus.read(0x0801), 0x42);
    EXPECT_EQ(bus.read(0x1001), 0x42);
    EXPECT_EQ(bus.read(0x1801), 0x42);

    bus.write(0x1FFF, 0x99);
    EXPECT_EQ(bus.read(0x07FF), 0x99);
}

TEST_F(MemoryBusTest, PpuRegistersMirrorEvery8Bytes) {
    bus.write(0x3456, 0x21);  // $2006
    bus.write(0x200E, 0x08);  // $2006
    EXPECT_EQ(ppu.getVramAddress().raw(), 0x2108);

    bus.write(0x3FFF, 0x77);  // $2007
    EXPECT_EQ(vram.peek(0x2108), 0x77);
}

TEST_F(MemoryBusTest, StatusReadGoesThroughToPpu) {
    bus.write(0x2006, 0x21);
    EXPECT_TRUE(ppu.getWriteLatch());
    bus.read(0x2002);
    EXPECT_FALSE(ppu.getWriteLatch());
}

TEST_F(MemoryBusTest, LoadProgramIntoCartridgeSpace) {
    std::vector<uint8_t> image{ 0xA9, 0x01, 0x00 };
    bus.loadProgram(image, 0x8000);
    EXPECT_EQ(bus.read(0x8000), 0xA9);
    EXPECT_EQ(bus.read(0x8001), 0x01);
    EXPECT_EQ(bus.read(0x8002), 0x00);
}

TEST_F(MemoryBusTest, LoadProgramFillingToTopOfMemory) {
    std::vector<uint8_t> image(0x10000 - 0xC000, 0xEA);
    bus.loadProgram(image, 0xC000);
    EXPECT_EQ(bus.read(0xFFFF), 0xEA);
}

TEST_F(MemoryBusTest, LoadProgramOutsideCartridgeThrows) {
    std::vector<uint8_t> image(16, 0xEA);
    EXPECT_THROW(bus.loadProgram(image, 0xFFF8), ContractViolation);
    EXPECT_THROW(bus.loadProgram(image, 0x0200), ContractViolation);
    EXPECT_THROW(bus.loadProgram(image, 0x4000), ContractViolation);
}

TEST_F(MemoryBusTest, LoadProgramFileMissingThrows) {
    EXPECT_THROW(bus.loadProgramFile("/nonexistent/famicore/program.bin", 0x8000), std::runtime_error);
}

TEST_F(MemoryBusTest, CartridgeSpaceIsWritable) {
    bus.write(0x6000, 0x5A);
    EXPECT_EQ(bus.read(0x6000), 0x5A);
    bus.write(CARTRIDGE_START, 0x11);
    EXPECT_EQ(bus.read(CARTRIDGE_START), 0x11);
}

TEST_F(MemoryBusTest, UnmappedIoReadsOpenBus) {
    bus.write(0x0010, 0xAB);
    bus.read(0x0010);
    EXPECT_EQ(bus.read(0x4016), 0xAB);
    EXPECT_EQ(bus.openBus(), 0xAB);

    bus.write(0x4000, 0x3C);
    EXPECT_EQ(bus.read(0x4015), 0x3C);
}

TEST_F(MemoryBusTest, PeekHasNoSideEffects) {
    vram.write(0x2000, 0x42);
    bus.write(0x2006, 0x20);
    bus.write(0x2006, 0x00);
    bus.write(0x0300, 0x66);

    EXPECT_EQ(bus.peek(0x0B00), 0x66);
    bus.peek(0x2007);
    bus.peek(0x2002);
    EXPECT_EQ(ppu.getVramAddress().raw(), 0x2000);
    EXPECT_EQ(ppu.getReadBuffer(), 0x00);
}

TEST_F(MemoryBusTest, PeekAndReadAgreeOnMirroredPpuRegisters) {
    vram.write(0x3F00, 0x1A);
    bus.write(0x2006, 0x3F);
    bus.write(0x2006, 0x00);

    EXPECT_EQ(bus.peek(0x3FF7), 0x1A);
    EXPECT_EQ(bus.read(0x3FF7), 0x1A);
}

TEST_F(MemoryBusTest, OamDmaWithoutCpuThrows) {
    EXPECT_THROW(bus.write(0x4014, 0x02), ContractViolation);
}

class OamDmaTest : public MemoryBusTest {
protected:
    CPU cpu{ bus, nmi };

    void SetUp() override {
        MemoryBusTest::SetUp();
        bus.connectCPU(&cpu);
    }
};

TEST_F(OamDmaTest, CopiesPageIntoOam) {
    for (int i = 0; i < 256; ++i) bus.write(0x0200 + i, uint8_t(i ^ 0x5A));

    bus.write(0x4014, 0x02);

    auto oam = ppu.getOAM();
    for (int i = 0; i < 256; ++i) {
        EXPECT_EQ(oam[i], uint8_t(i ^ 0x5A)) << "OAM byte " << i;
    }
}

TEST_F(OamDmaTest, StartsAtOamAddress) {
    for (int i = 0; i < 256; ++i) bus.write(0x0300 + i, uint8_t(i));
    bus.write(0x2003, 0x10);

    bus.write(0x4014, 0x03);

    auto oam = ppu.getOAM();
    EXPECT_EQ(oam[0x10], 0x00);
    EXPECT_EQ(oam[0x0F], 0xFF);
    EXPECT_EQ(ppu.getOAMAddress(), 0x10);
}

TEST_F(OamDmaTest, StallsTheCpu) {
    // LDA #$02; STA $4014; NOP
    std::vector<uint8_t> program{ 0xA9, 0x02, 0x8D, 0x14, 0x40, 0xEA };
    bus.loadProgram(program, 0x8000);
    bus.write(0xFFFC, 0x00);
    bus.write(0xFFFD, 0x80);
    cpu.reset();

    auto run = [this] {
        int cycles = 0;
        do {
            cpu.clock();
            ++cycles;
        } while (!cpu.instructionComplete());
        return cycles;
    };

    EXPECT_EQ(run(), 2);
    EXPECT_EQ(run(), 4 + OAM_DMA_STALL_CYCLES);
    EXPECT_EQ(cpu.getPC(), 0x8005);
    EXPECT_EQ(run(), 2);
}
