#pragma once

#include <cstdint>
#include <array>
#include <span>
#include <string>
#include <vector>
#include "bus.h"
#include "core.h"

class CPU;
class PPU;

static constexpr uint16_t CARTRIDGE_START = 0x4020;

// CPU address space: work RAM, PPU registers, OAM DMA and a flat cartridge area.
class MemoryBus : public Bus {
public:
    explicit MemoryBus(PPU& ppu);

    // Needed for the DMA stall.
    void connectCPU(CPU* cpu);

    // Copies a raw program image into cartridge space ($4020-$FFFF).
    void loadProgram(std::span<const uint8_t> image, uint16_t loadAddress);
    size_t loadProgramFile(const std::string& path, uint16_t loadAddress);

    uint8_t read(uint16_t addr) override;
    void    write(uint16_t addr, uint8_t val) override;
    uint8_t peek(uint16_t addr) const override;  // for debugger, no side-effects

    uint8_t openBus() const { return busValue; }

private:
    std::array<uint8_t, 0x0800> ram;
    std::vector<uint8_t> cartridge;

    // Last value driven on the data bus.
    uint8_t busValue;

    PPU& ppu;
    CPU* cpu;

    void runOamDma(uint8_t page);
};
