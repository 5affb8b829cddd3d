#include "ppu_registers.h"

// ----------------
// VramAddress
// ----------------

// 0x23C0 | nametable | (coarse_y / 4) * 8 | coarse_x / 4
uint16_t VramAddress::attributeAddress() const {
    return 0x23C0
        | (value & 0x0C00)
        | ((value >> 4) & 0x38)
        | ((value >> 2) & 0x07);
}

void VramAddress::incrementX() {
    if ((value & 0x001F) == 31) {
        value &= ~0x001F;
        value ^= 0x0400;
    }
    else {
        value++;
    }
}

void VramAddress::incrementY() {
    if ((value & 0x7000) != 0x7000) {
        value += 0x1000;
    }
    else {
        value &= ~0x7000;
        int y = (value & 0x03E0) >> 5;
        // Rows 30 and 31 hold attribute data; wrapping from them keeps the nametable
        if (y == 29) { y = 0; value ^= 0x0800; }
        else if (y == 31) y = 0;
        else y++;
        value = (value & ~0x03E0) | (y << 5);
    }
}

void VramAddress::copyHorizontal(const VramAddress& from) {
    // coarse X + nametable X
    value = (value & ~0x041F) | (from.value & 0x041F);
}

void VramAddress::copyVertical(const VramAddress& from) {
    // fine Y, coarse Y, nametable Y
    value = (value & ~0x7BE0) | (from.value & 0x7BE0);
}

// ----------------
// PPUFlags
// ----------------

PPUFlags::PPUFlags() {
    clear();
}

void PPUFlags::clear() {
    vblank = false;
    sprite0Hit = false;
    spriteOverflow = false;
}

uint8_t PPUFlags::toByte(uint8_t latch) const {
    return (vblank ? 0x80 : 0x00) |
        (sprite0Hit ? 0x40 : 0x00) |
        (spriteOverflow ? 0x20 : 0x00) |
        (latch & 0x1F);
}

void PPUFlags::set(PPUStatusFlag flag) {
    switch (flag) {
    case PPUStatusFlag::VBlank:        vblank = true;  break;
    case PPUStatusFlag::Sprite0Hit:    sprite0Hit = true;  break;
    case PPUStatusFlag::SpriteOverflow:spriteOverflow = true;  break;
    }
}

void PPUFlags::clear(PPUStatusFlag flag) {
    switch (flag) {
    case PPUStatusFlag::VBlank:        vblank = false; break;
    case PPUStatusFlag::Sprite0Hit:    sprite0Hit = false; break;
    case PPUStatusFlag::SpriteOverflow:spriteOverflow = false; break;
    }
}

bool PPUFlags::test(PPUStatusFlag flag) const {
    switch (flag) {
    case PPUStatusFlag::VBlank:         return vblank;
    case PPUStatusFlag::Sprite0Hit:     return sprite0Hit;
    case PPUStatusFlag::SpriteOverflow: return spriteOverflow;
    }
    return false;
}
