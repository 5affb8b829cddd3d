#pragma once

#include <cstdint>
#include <array>
#include <span>
#include "bus.h"
#include "config.h"
#include "core.h"
#include "frame_buffer.h"
#include "interrupt_line.h"
#include "ppu_registers.h"

class PPU {
public:
    // videoBus covers the PPU's own 14-bit address space (pattern, nametable, palette).
    PPU(Bus& videoBus, InterruptLine& nmiLine, FrameSink& sink);

    void reset();

    // Single PPU clock (dot): processes the dot at (scanline, cycle) and advances.
    void clock();

    // CPU register read/write ($2000-$2007, mirrored every 8 bytes through $3FFF).
    // Addresses outside $2000-$3FFF throw ContractViolation.
    uint8_t readRegister(uint16_t addr);
    void writeRegister(uint16_t addr, uint8_t value);

    // What readRegister would return, without touching any state.
    uint8_t peekRegister(uint16_t addr) const;

    // CPU OAM DMA writes.
    void writeOAM(uint8_t data);
    std::span<const uint8_t, 256> getOAM() const { return oam; }

    // For sync
    int getScanline() const { return scanline; }
    int getCycle()    const { return cycle; }
    uint64_t getFrameCount() const { return frame; }
    bool isOddFrame() const { return oddFrame; }

    // Inspection
    VramAddress getVramAddress() const { return v; }
    VramAddress getTempAddress() const { return t; }
    uint8_t getFineX() const { return fineX; }
    bool getWriteLatch() const { return w; }
    PPUControl getControl() const { return control; }
    PPUMask getMask() const { return mask; }
    PPUFlags getStatus() const { return status; }
    uint8_t getOAMAddress() const { return oamAddr; }
    uint8_t getReadBuffer() const { return readBuffer; }

    uint16_t getPatternShiftLo() const { return patternShiftLo; }
    uint16_t getPatternShiftHi() const { return patternShiftHi; }
    uint16_t getAttribShiftLo() const { return attribShiftLo; }
    uint16_t getAttribShiftHi() const { return attribShiftHi; }

    bool renderingEnabled() const { return mask.renderingEnabled(); }

private:
    // Background pipeline functions.
    void fetchBackgroundData();
    void updateBackgroundShifters();
    void reloadBackgroundShifters();

    // Render one pixel (dot) for background.
    void renderPixel();

    void evaluateSprites();

    void enterVBlank();
    void advanceCounters(bool rendering);

private:
    Bus& videoBus;
    InterruptLine& nmiLine;
    FrameSink& sink;

    PPUControl control;
    PPUMask mask;
    PPUFlags status;

    // Last value driven on the CPU-facing data lines.
    uint8_t ioLatch;

    // OAM memory (sprite RAM), 256 bytes.
    uint8_t oamAddr;
    std::array<uint8_t, 256> oam;

    // Loopy registers.
    VramAddress v;    // current VRAM address.
    VramAddress t;    // temporary VRAM address.
    uint8_t fineX;    // fine horizontal scroll.
    bool w;           // write toggle.

    // Read buffer for PPUDATA.
    uint8_t readBuffer;

    int cycle;        // 0 to 340
    int scanline;     // -1 (pre-render) to 260
    uint64_t frame;
    bool oddFrame;

    bool resetDone;

    // PPUSTATUS was read on the dot before vblank
    bool suppressVBlank;

    // Background shift registers and latches.
    uint16_t patternShiftLo;
    uint16_t patternShiftHi;
    uint16_t attribShiftLo;
    uint16_t attribShiftHi;
    uint8_t nextTileID;
    uint8_t nextTileAttr;
    uint8_t nextTileLo;
    uint8_t nextTileHi;
};
