#pragma once

#include <cstdint>
#include "core.h"

// Loopy VRAM address, 15 bits:  yyy NN YYYYY XXXXX
//                               |   |  |     +-- coarse X
//                               |   |  +-------- coarse Y
//                               |   +----------- nametable select
//                               +--------------- fine Y
class VramAddress {
public:
    VramAddress() = default;
    explicit VramAddress(uint16_t raw) : value(raw & 0x7FFF) {}

    uint16_t raw() const { return value; }
    void setRaw(uint16_t raw) { value = raw & 0x7FFF; }

    uint8_t coarseX() const { return value & 0x1F; }
    uint8_t coarseY() const { return (value >> 5) & 0x1F; }
    uint8_t nametableX() const { return (value >> 10) & 0x01; }
    uint8_t nametableY() const { return (value >> 11) & 0x01; }
    uint8_t nametable() const { return (value >> 10) & 0x03; }
    uint8_t fineY() const { return (value >> 12) & 0x07; }

    void setCoarseX(uint8_t x) { value = (value & ~0x001F) | (x & 0x1F); }
    void setCoarseY(uint8_t y) { value = (value & ~0x03E0) | ((y & 0x1F) << 5); }
    void setNametable(uint8_t n) { value = (value & ~0x0C00) | ((n & 0x03) << 10); }
    void setFineY(uint8_t y) { value = (value & ~0x7000) | ((y & 0x07) << 12); }

    // Address into the $2000-$2FFF nametable window for the current tile.
    uint16_t tileAddress() const { return 0x2000 | (value & 0x0FFF); }
    uint16_t attributeAddress() const;

    void incrementX();
    void incrementY();

    // Dot 257 and pre-render dots 280-304.
    void copyHorizontal(const VramAddress& from);
    void copyVertical(const VramAddress& from);

    // Data port auto-increment; wraps at 15 bits.
    void advance(uint8_t step) { value = (value + step) & 0x7FFF; }

    bool operator==(const VramAddress& other) const { return value == other.value; }

private:
    uint16_t value = 0;
};

// $2000
struct PPUControl {
    uint8_t reg = 0;

    uint8_t nametable() const { return reg & 0x03; }
    uint8_t incrementStep() const { return (reg & 0x04) ? 32 : 1; }
    uint16_t spritePatternBase() const { return (reg & 0x08) ? 0x1000 : 0x0000; }
    uint16_t backgroundPatternBase() const { return (reg & 0x10) ? 0x1000 : 0x0000; }
    int spriteHeight() const { return (reg & 0x20) ? 16 : 8; }
    bool masterSlave() const { return (reg & 0x40) != 0; }
    bool nmiEnabled() const { return (reg & 0x80) != 0; }
};

// $2001
struct PPUMask {
    uint8_t reg = 0;

    bool greyscale() const { return (reg & 0x01) != 0; }
    bool showBackgroundLeft() const { return (reg & 0x02) != 0; }
    bool showSpritesLeft() const { return (reg & 0x04) != 0; }
    bool showBackground() const { return (reg & 0x08) != 0; }
    bool showSprites() const { return (reg & 0x10) != 0; }
    uint8_t emphasis() const { return (reg >> 5) & 0x07; }

    bool renderingEnabled() const { return showBackground() || showSprites(); }
};

// $2002 upper three bits
struct PPUFlags {
    bool vblank = false;
    bool sprite0Hit = false;
    bool spriteOverflow = false;

    PPUFlags();
    void clear();

    // The low five bits come from whatever was last driven on the PPU data lines.
    uint8_t toByte(uint8_t latch = 0) const;

    void set(PPUStatusFlag flag);
    void clear(PPUStatusFlag flag);
    bool test(PPUStatusFlag flag) const;
};
