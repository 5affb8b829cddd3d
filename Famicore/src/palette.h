#pragma once

#include <cstdint>

// 2C02 output colors as 0xAARRGGBB, indexed by the 6-bit value the PPU emits.
extern const uint32_t systemPalette[64];

uint32_t paletteToARGB(uint8_t colorIndex);
