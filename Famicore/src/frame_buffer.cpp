#include "frame_buffer.h"

#include <algorithm>

FrameBuffer::FrameBuffer() {
    clear();
}

void FrameBuffer::putPixel(int x, int y, uint8_t colorIndex) {
    if (x < 0 || x >= SCREEN_WIDTH || y < 0 || y >= SCREEN_HEIGHT) return;
    indices[y * SCREEN_WIDTH + x] = colorIndex & 0x3F;
}

uint8_t FrameBuffer::pixel(int x, int y) const {
    return indices.at(y * SCREEN_WIDTH + x);
}

void FrameBuffer::clear(uint8_t colorIndex) {
    std::ranges::fill(indices, uint8_t(colorIndex & 0x3F));
}
