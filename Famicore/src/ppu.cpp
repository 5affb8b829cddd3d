#include "ppu.h"
#include "debugging/logger.h"

#include <algorithm>
#include <sstream>
#include <string>

PPU::PPU(Bus& videoBus, InterruptLine& nmiLine, FrameSink& sink)
    : videoBus(videoBus), nmiLine(nmiLine), sink(sink),
    ioLatch(0), oamAddr(0), fineX(0), w(false), readBuffer(0),
    cycle(0), scanline(PRE_RENDER_SCANLINE), frame(0), oddFrame(false),
    resetDone(false), suppressVBlank(false),
    patternShiftLo(0), patternShiftHi(0), attribShiftLo(0), attribShiftHi(0),
    nextTileID(0), nextTileAttr(0), nextTileLo(0), nextTileHi(0)
{
    oam.fill(0);
}

void PPU::reset() {
    control.reg = 0;
    mask.reg = 0;
    status.clear();
    ioLatch = 0;
    oamAddr = 0;

    v.setRaw(0);
    t.setRaw(0);
    w = false;
    fineX = 0;
    readBuffer = 0;

    patternShiftLo = patternShiftHi = 0;
    attribShiftLo = attribShiftHi = 0;
    nextTileID = nextTileAttr = nextTileLo = nextTileHi = 0;

    scanline = PRE_RENDER_SCANLINE;
    cycle = 0;
    frame = 0;
    oddFrame = false;
    suppressVBlank = false;
    resetDone = true;

    logInfo("[PPU] Reset.");
}

// ----------------
// Register I/O
// ----------------

// $2000-$3FFF, mirrored every 8 bytes
static uint8_t registerIndex(uint16_t addr) {
    if (addr < 0x2000 || addr > 0x3FFF) {
        std::ostringstream msg;
        msg << "PPU register address 0x" << std::hex << std::uppercase << addr
            << " is outside $2000-$3FFF";
        throw ContractViolation(msg.str());
    }
    return addr & 0x7;
}

void PPU::writeRegister(uint16_t addr, uint8_t val) {
    const uint8_t index = registerIndex(addr);
    ioLatch = val;

    switch (index) {
    case 0: {  // PPUCTRL ($2000)
        bool oldNmiOut = control.nmiEnabled();
        control.reg = val;
        t.setNametable(val & 0x03);
        // NMI enabled in the middle of vblank fires right away
        if (!oldNmiOut && control.nmiEnabled() && status.vblank) {
            nmiLine.raise();
        }
        break;
    }
    case 1:    // PPUMASK ($2001)
        mask.reg = val;
        break;
    case 2:    // PPUSTATUS is read-only
        break;
    case 3:    // OAMADDR ($2003)
        oamAddr = val;
        break;
    case 4:    // OAMDATA ($2004)
        oam[oamAddr++] = val;
        break;
    case 5:    // PPUSCROLL ($2005)
        if (!w) {
            fineX = val & 0x07;
            t.setCoarseX(val >> 3);
        }
        else {
            t.setFineY(val & 0x07);
            t.setCoarseY(val >> 3);
        }
        w = !w;
        break;
    case 6:    // PPUADDR ($2006)
        if (!w) {
            // high byte, bit 14 is cleared
            t.setRaw((t.raw() & 0x00FF) | ((val & 0x3F) << 8));
        }
        else {
            t.setRaw((t.raw() & 0xFF00) | val);
            v = t;
        }
        w = !w;
        break;
    case 7:    // PPUDATA ($2007)
        videoBus.write(v.raw() & 0x3FFF, val);
        v.advance(control.incrementStep());
        break;
    }
}

uint8_t PPU::readRegister(uint16_t addr) {
    const uint8_t index = registerIndex(addr);
    uint8_t value = ioLatch;

    switch (index) {
    case 2: { // PPUSTATUS ($2002)
        value = status.toByte(ioLatch);
        status.clear(PPUStatusFlag::VBlank);
        w = false;
        // Reading one dot before vblank starts loses the flag and the NMI
        if (scanline == VBLANK_SCANLINE && cycle == 1) {
            suppressVBlank = true;
        }
        break;
    }
    case 4: // OAMDATA ($2004)
        value = oam[oamAddr];
        break;
    case 7: { // PPUDATA ($2007)
        uint16_t vaddr = v.raw() & 0x3FFF;
        if (vaddr >= 0x3F00) {
            // palette reads are immediate; the buffer gets the nametable byte underneath
            value = videoBus.read(vaddr);
            readBuffer = videoBus.read(vaddr & 0x2FFF);
        }
        else {
            // buffered read: return old buffer, then refill
            value = readBuffer;
            readBuffer = videoBus.read(vaddr);
        }
        v.advance(control.incrementStep());
        break;
    }
    default:
        // $2000, $2001, $2003, $2005, $2006 are write-only
        break;
    }

    ioLatch = value;
    return value;
}

uint8_t PPU::peekRegister(uint16_t addr) const {
    switch (registerIndex(addr)) {
    case 2: return status.toByte(ioLatch);
    case 4: return oam[oamAddr];
    case 7: {
        uint16_t vaddr = v.raw() & 0x3FFF;
        return vaddr >= 0x3F00 ? videoBus.peek(vaddr) : readBuffer;
    }
    default: return ioLatch;
    }
}

// ----------------
// DMA from CPU for sprites
// ----------------

void PPU::writeOAM(uint8_t data) {
    oam[oamAddr++] = data;
}

// ----------------
// Main clock step
// ----------------

void PPU::clock()
{
    if (!resetDone) {
        throw ContractViolation("PPU::clock() called before PPU::reset()");
    }

    const bool rendering = mask.renderingEnabled();
    const bool renderLine = scanline < POST_RENDER_SCANLINE;

    // Pre-render line reset
    if (scanline == PRE_RENDER_SCANLINE && cycle == 1) {
        status.clear();
        logDebug("[PPU] Frame start.");
    }

    // Background fetch / shifter pipeline
    if (rendering && renderLine) {
        if ((cycle >= 2 && cycle <= 257) || (cycle >= 321 && cycle <= 337)) {
            updateBackgroundShifters();
            fetchBackgroundData();
        }

        if (cycle == 256) {
            v.incrementY();
        }
        if (cycle == 257) {
            v.copyHorizontal(t);
            if (scanline >= 0 && mask.showSprites()) {
                evaluateSprites();
            }
        }
        if (scanline == PRE_RENDER_SCANLINE && cycle >= 280 && cycle <= 304) {
            v.copyVertical(t);
        }
    }

    // Render a pixel (visible scanlines, dots 1-256)
    if (scanline >= 0 && scanline < POST_RENDER_SCANLINE && cycle >= 1 && cycle <= SCREEN_WIDTH) {
        renderPixel();
    }

    if (scanline == VBLANK_SCANLINE && cycle == 1) {
        enterVBlank();
    }

    advanceCounters(rendering);
}

void PPU::enterVBlank() {
    if (suppressVBlank) {
        suppressVBlank = false;
        logDebug("[PPU] VBlank suppressed by PPUSTATUS read.");
        return;
    }

    status.set(PPUStatusFlag::VBlank);
    if (control.nmiEnabled()) {
        nmiLine.raise();
    }
    logDebug("[PPU] Frame complete.");
}

void PPU::advanceCounters(bool rendering) {
    // Odd frames drop the last pre-render dot when rendering
    if (scanline == PRE_RENDER_SCANLINE && cycle == LAST_CYCLE - 1 && oddFrame && rendering) {
        cycle = 0;
        scanline = 0;
        return;
    }

    ++cycle;
    if (cycle > LAST_CYCLE) {
        cycle = 0;
        ++scanline;
        if (scanline > LAST_SCANLINE) {
            scanline = PRE_RENDER_SCANLINE;
            ++frame;
            oddFrame = !oddFrame;
        }
    }
}

// ----------------
// Helpers
// ----------------

void PPU::evaluateSprites() {
    std::ostringstream msg;
    msg << "Sprite evaluation is not emulated (scanline " << scanline
        << ", PPUMASK=0x" << std::hex << int(mask.reg) << ")";
    logError(msg.str());
    throw UnsupportedFeature(msg.str());
}

void PPU::renderPixel() {
    int x = cycle - 1;
    int y = scanline;

    uint8_t bgPixel = 0;
    uint8_t bgPalette = 0;
    if (mask.showBackground() && (x >= 8 || mask.showBackgroundLeft())) {
        uint16_t bit = 0x8000 >> fineX;
        uint8_t p0 = (patternShiftLo & bit) ? 1 : 0;
        uint8_t p1 = (patternShiftHi & bit) ? 1 : 0;
        bgPixel = (p1 << 1) | p0;
        uint8_t pal0 = (attribShiftLo & bit) ? 1 : 0;
        uint8_t pal1 = (attribShiftHi & bit) ? 1 : 0;
        bgPalette = (pal1 << 1) | pal0;
    }

    // Transparent pixels show the backdrop color
    uint16_t paletteAddr = bgPixel ? (0x3F00 | (bgPalette << 2) | bgPixel) : 0x3F00;
    uint8_t colorIndex = videoBus.read(paletteAddr) & (mask.greyscale() ? 0x30 : 0x3F);
    sink.putPixel(x, y, colorIndex);
}

void PPU::fetchBackgroundData() {
    switch ((cycle - 1) % 8) {
    case 0:
        reloadBackgroundShifters();
        nextTileID = videoBus.read(v.tileAddress());
        break;
    case 2:
        nextTileAttr = videoBus.read(v.attributeAddress());
        // pick the 2-bit quadrant of the 32x32 attribute block
        if (v.coarseY() & 0x02) nextTileAttr >>= 4;
        if (v.coarseX() & 0x02) nextTileAttr >>= 2;
        nextTileAttr &= 0x03;
        break;
    case 4:
        nextTileLo = videoBus.read(control.backgroundPatternBase() + nextTileID * 16 + v.fineY());
        break;
    case 6:
        nextTileHi = videoBus.read(control.backgroundPatternBase() + nextTileID * 16 + v.fineY() + 8);
        break;
    case 7:
        v.incrementX();
        break;
    }
}

void PPU::updateBackgroundShifters() {
    if (!mask.showBackground()) return;
    patternShiftLo <<= 1; patternShiftHi <<= 1;
    attribShiftLo <<= 1; attribShiftHi <<= 1;
}

void PPU::reloadBackgroundShifters() {
    patternShiftLo = (patternShiftLo & 0xFF00) | nextTileLo;
    patternShiftHi = (patternShiftHi & 0xFF00) | nextTileHi;
    attribShiftLo = (attribShiftLo & 0xFF00) | ((nextTileAttr & 1) ? 0xFF : 0x00);
    attribShiftHi = (attribShiftHi & 0xFF00) | ((nextTileAttr & 2) ? 0xFF : 0x00);
}
