#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_set>
#include <memory>

#include <SDL3/SDL.h>
#include "emulator.h"

struct CPUState {
    uint16_t PC;
    uint8_t  A, X, Y, SP, status;
    uint64_t cycles;
};

struct PPUState {
    int scanline;
    int cycle;
    uint64_t frame;

    // Internal registers for loopy-V/X/Y scrolling
    uint16_t v, t;
    uint8_t fineX;
    bool    writeLatch;
    uint8_t ppuCtrl, ppuMask;
    bool    vblank, sprite0Hit, spriteOverflow;
};

class DebugGUI;  // forward

class Debugger {
public:
    explicit Debugger(Emulator& emu);
    ~Debugger();

    // ImGui lifecycle (all inside DebugGUI)
    void initGui(SDL_Window* window, SDL_Renderer* renderer);
    void newFrameGui();
    void drawGui();
    void renderGui();
    void shutdownGui();

    // Emulation control: runs a frame, or one instruction when stepping
    void update();

    /// single-step one CPU instruction (pauses again afterwards)
    void requestStep();

    void pause();
    void resume();

    bool isPaused() const;

    // Breakpoints
    void toggleBreakpoint(uint16_t addr);
    bool hasBreakpoint(uint16_t addr) const;
    const std::unordered_set<uint16_t>& getBreakpoints() const;

    // Last core exception, empty when running cleanly
    const std::string& getLastError() const { return lastError; }

    // State accessors for GUI
    CPUState getCPUState() const;
    PPUState getPPUState() const;
    std::vector<uint8_t> peekMemory(uint16_t addr, size_t len) const;
    std::vector<uint8_t> peekPPUMemory(uint16_t addr, size_t len) const;

private:
    Emulator& emu;

    bool paused;
    bool stepRequested;
    std::unordered_set<uint16_t> breakpoints;
    std::string lastError;

    std::unique_ptr<DebugGUI> gui;

    void runFrame();
};
