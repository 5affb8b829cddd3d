#include "video_memory.h"
#include "debugging/logger.h"

#include <algorithm>
#include <string>

VideoMemory::VideoMemory(MirrorMode mode)
    : mirrorMode(mode)
{
    clear();
}

void VideoMemory::clear() {
    patternRam.fill(0);
    nametables.fill(0);
    palette.fill(0);
}

void VideoMemory::setMirrorMode(MirrorMode mode) {
    mirrorMode = mode;
}

void VideoMemory::loadPatternData(std::span<const uint8_t> chr) {
    size_t count = std::min(chr.size(), patternRam.size());
    std::copy_n(chr.begin(), count, patternRam.begin());
    if (chr.size() > patternRam.size()) {
        logWarn("[VRAM] CHR data larger than 8 KiB, truncated (" + std::to_string(chr.size()) + " bytes).");
    }
}

uint8_t VideoMemory::read(uint16_t addr) {
    return peek(addr);
}

uint8_t VideoMemory::peek(uint16_t addr) const {
    // mirror into 0x0000-0x3FFF
    uint16_t addr_ = addr & 0x3FFF;

    // 1) Pattern tables: $0000-$1FFF
    if (addr_ < 0x2000) {
        return patternRam[addr_];
    }

    // 2) Name-tables: $2000-$2FFF mirrored through $3EFF
    if (addr_ < 0x3F00) {
        return nametables[nametableIndex(addr_)];
    }

    // 3) Palette: $3F00-$3F1F mirrored through $3FFF
    return palette[paletteIndex(addr_)];
}

void VideoMemory::write(uint16_t addr, uint8_t val) {
    uint16_t addr_ = addr & 0x3FFF;

    if (addr_ < 0x2000) {
        patternRam[addr_] = val;
    }
    else if (addr_ < 0x3F00) {
        nametables[nametableIndex(addr_)] = val;
    }
    else {
        palette[paletteIndex(addr_)] = val & 0x3F;
    }
}

uint16_t VideoMemory::nametableIndex(uint16_t addr) const {
    return mirrorAddress(addr, mirrorMode) - 0x2000;
}

uint8_t paletteIndex(uint16_t addr) {
    uint8_t p = addr & 0x1F;
    if ((p & 0x13) == 0x10) p &= 0x0F;
    return p;
}

uint16_t mirrorAddress(uint16_t addr, MirrorMode mode)
{
    uint16_t nt = (addr - 0x2000) & 0x0FFF;     // $3000-$3EFF folds onto $2000-$2EFF
    uint16_t table = (nt >> 10) & 3;            // 0-3
    uint16_t offset = nt & 0x03FF;

    switch (mode) {
    case MirrorMode::HORIZONTAL: table = (table >> 1);     break; // 0,1->0  2,3->1
    case MirrorMode::VERTICAL:   table = (table & 1);      break; // 0,2->0  1,3->1
    case MirrorMode::FOUR_SCREEN:                          break; // keep 0-3
    case MirrorMode::SINGLE_SCREEN: table = 0;             break;
    }
    return 0x2000 + (table << 10) + offset;
}
