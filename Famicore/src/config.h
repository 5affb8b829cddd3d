#pragma once

#include <cstdint>

// Interrupt vectors (little-endian words).
static constexpr uint16_t NMI_VECTOR = 0xFFFA;
static constexpr uint16_t RESET_VECTOR = 0xFFFC;
static constexpr uint16_t IRQ_VECTOR = 0xFFFE;

static constexpr uint16_t STACK_BASE = 0x0100;

// Power-up register state.
static constexpr uint8_t POWER_UP_SP = 0xFD;
static constexpr uint8_t POWER_UP_STATUS = 0x24;
static constexpr int RESET_CYCLES = 7;
static constexpr int INTERRUPT_CYCLES = 7;
static constexpr int OAM_DMA_STALL_CYCLES = 513;

// Picture timing (NTSC).
static constexpr int SCREEN_WIDTH = 256;
static constexpr int SCREEN_HEIGHT = 240;
static constexpr int CYCLES_PER_SCANLINE = 341;
static constexpr int LAST_CYCLE = 340;
static constexpr int PRE_RENDER_SCANLINE = -1;
static constexpr int POST_RENDER_SCANLINE = 240;
static constexpr int VBLANK_SCANLINE = 241;
static constexpr int LAST_SCANLINE = 260;
static constexpr int SCANLINES_PER_FRAME = 262;

// PPU dots per CPU cycle.
static constexpr int PPU_CLOCK_RATIO = 3;

// Frontend defaults.
static constexpr int SCALE_FACTOR = 3;
static constexpr int FRAME_DELAY = 16;
static constexpr int SKIP_FRAMES = 0;
