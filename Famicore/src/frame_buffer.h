#pragma once

#include <cstdint>
#include <array>
#include <span>
#include "config.h"

// Receives one background pixel per visible dot as a 6-bit system color index.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void putPixel(int x, int y, uint8_t colorIndex) = 0;
};

class FrameBuffer : public FrameSink {
public:
    FrameBuffer();

    void putPixel(int x, int y, uint8_t colorIndex) override;

    uint8_t pixel(int x, int y) const;
    void clear(uint8_t colorIndex = 0);

    std::span<const uint8_t> pixels() const { return indices; }
    const uint8_t* data() const { return indices.data(); }

private:
    std::array<uint8_t, SCREEN_WIDTH * SCREEN_HEIGHT> indices;
};
