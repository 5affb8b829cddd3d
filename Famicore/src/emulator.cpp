#include "emulator.h"
#include "config.h"

Emulator::Emulator(MirrorMode mirror)
    : videoMemory(mirror), ppu(videoMemory, nmiLine, frameBuffer),
    memory(ppu), cpu(memory, nmiLine), frameDone(false)
{
    memory.connectCPU(&cpu);
}

void Emulator::reset() {
    nmiLine.clear();
    ppu.reset();
    cpu.reset();
    frameDone = false;
}

void Emulator::step() {
    cpu.clock();

    for (int i = 0; i < PPU_CLOCK_RATIO; ++i) {
        ppu.clock();

        if (ppu.getScanline() == PRE_RENDER_SCANLINE && ppu.getCycle() == 0) {
            frameDone = true;
        }
    }
}

void Emulator::stepInstruction() {
    do {
        step();
    } while (!cpu.instructionComplete());
}

void Emulator::runFrame() {
    while (!frameDone) {
        step();
    }
}

bool Emulator::frameComplete() const {
    return frameDone;
}

void Emulator::resetFrameFlag() {
    frameDone = false;
}
