#pragma once

// Edge-triggered NMI condition shared between the PPU (raises) and the CPU
// (consumes). A second raise before consumption coalesces.
class InterruptLine {
public:
    void raise() { pending = true; }

    // Returns true once per raised edge.
    bool consume() {
        bool was = pending;
        pending = false;
        return was;
    }

    bool isPending() const { return pending; }
    void clear() { pending = false; }

private:
    bool pending = false;
};
