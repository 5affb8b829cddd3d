#pragma once

#include "cpu.h"
#include "ppu.h"
#include "core.h"
#include "frame_buffer.h"
#include "interrupt_line.h"
#include "memory_bus.h"
#include "video_memory.h"

// Owns both units and their buses, and clocks them at the 1:3 CPU/PPU ratio.
class Emulator {
public:
    explicit Emulator(MirrorMode mirror = MirrorMode::HORIZONTAL);

    void reset();

    // One CPU cycle and three PPU dots.
    void step();

    // Steps until the CPU sits on an instruction boundary again.
    void stepInstruction();

    // Steps until the PPU wraps back to the pre-render line.
    void runFrame();

    CPU& getCPU() { return cpu; }
    PPU& getPPU() { return ppu; }
    MemoryBus& getMemory() { return memory; }
    VideoMemory& getVideoMemory() { return videoMemory; }
    InterruptLine& getNmiLine() { return nmiLine; }
    const CPU& getCPU() const { return cpu; }
    const PPU& getPPU() const { return ppu; }
    const MemoryBus& getMemory() const { return memory; }
    const VideoMemory& getVideoMemory() const { return videoMemory; }

    bool frameComplete() const;
    void resetFrameFlag();

    const FrameBuffer& getFrameBuffer() const { return frameBuffer; }
private:
    FrameBuffer frameBuffer;
    VideoMemory videoMemory;
    InterruptLine nmiLine;
    PPU ppu;
    MemoryBus memory;
    CPU cpu;
    bool frameDone;
};
