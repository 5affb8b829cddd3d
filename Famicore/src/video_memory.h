#pragma once

#include <cstdint>
#include <array>
#include <span>
#include "bus.h"
#include "core.h"

// The PPU's 14-bit address space: pattern RAM, nametable RAM and palette RAM.
class VideoMemory : public Bus {
public:
    explicit VideoMemory(MirrorMode mode = MirrorMode::HORIZONTAL);

    uint8_t read(uint16_t addr) override;
    void write(uint16_t addr, uint8_t val) override;

    // Same as read() since nothing here reacts to reads.
    uint8_t peek(uint16_t addr) const override;

    void setMirrorMode(MirrorMode mode);
    MirrorMode getMirrorMode() const { return mirrorMode; }

    // Copies CHR data to the start of pattern RAM.
    void loadPatternData(std::span<const uint8_t> chr);

    void clear();

private:
    std::array<uint8_t, 0x2000> patternRam;
    std::array<uint8_t, 0x1000> nametables;
    std::array<uint8_t, 0x20> palette;
    MirrorMode mirrorMode;

    uint16_t nametableIndex(uint16_t addr) const;
};

// Maps $2000-$3EFF onto one of the four logical nametables for a mirroring mode.
uint16_t mirrorAddress(uint16_t addr, MirrorMode mode);

// Palette RAM index for $3F00-$3FFF; $3F10/$14/$18/$1C alias the backdrop entries.
uint8_t paletteIndex(uint16_t addr);
