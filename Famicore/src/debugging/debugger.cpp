#include "debugger.h"
#include "debug_gui.h"
#include "logger.h"

#include <stdexcept>

Debugger::Debugger(Emulator& emu)
    : emu(emu), paused(false), stepRequested(false)
{
    gui = std::make_unique<DebugGUI>(*this);

    // Start in paused mode for now.
    paused = true;
}

Debugger::~Debugger() = default;

void Debugger::initGui(SDL_Window* w, SDL_Renderer* r) {
    gui->init(w, r);
}

void Debugger::newFrameGui() {
    gui->newFrame();
}

void Debugger::drawGui() {
    gui->draw();
}

void Debugger::renderGui() {
    gui->render();
}

void Debugger::shutdownGui() {
    gui->shutdown();
}

void Debugger::update() {
    try {
        if (stepRequested) {
            emu.stepInstruction();
            stepRequested = false;
            paused = true;
        }
        else if (!paused) {
            runFrame();
        }
    }
    catch (const UnsupportedFeature& e) {
        lastError = e.what();
        logError(std::string("[DBG] ") + e.what());
        paused = true;
    }
    catch (const ContractViolation& e) {
        lastError = e.what();
        logError(std::string("[DBG] Contract violation: ") + e.what());
        paused = true;
    }
}

// Runs to the end of the frame, stopping early on a breakpoint
void Debugger::runFrame() {
    emu.resetFrameFlag();
    while (!emu.frameComplete()) {
        emu.stepInstruction();
        if (breakpoints.count(emu.getCPU().getPC())) {
            paused = true;
            return;
        }
    }
}

void Debugger::requestStep() { stepRequested = true; }
void Debugger::pause() { paused = true; }
void Debugger::resume() { paused = false; lastError.clear(); }
bool Debugger::isPaused() const { return paused; }

void Debugger::toggleBreakpoint(uint16_t addr) {
    if (breakpoints.count(addr)) breakpoints.erase(addr);
    else breakpoints.insert(addr);
}

bool Debugger::hasBreakpoint(uint16_t addr) const {
    return breakpoints.count(addr) > 0;
}

const std::unordered_set<uint16_t>& Debugger::getBreakpoints() const {
    return breakpoints;
}

CPUState Debugger::getCPUState() const {
    const CPU& cpu = emu.getCPU();
    return { cpu.getPC(), cpu.getA(), cpu.getX(), cpu.getY(), cpu.getSP(), cpu.getStatus(),
        cpu.getTotalCycles() };
}

PPUState Debugger::getPPUState() const {
    const PPU& ppu = emu.getPPU();
    PPUFlags status = ppu.getStatus();
    return { ppu.getScanline(), ppu.getCycle(), ppu.getFrameCount(),
        ppu.getVramAddress().raw(), ppu.getTempAddress().raw(), ppu.getFineX(),
        ppu.getWriteLatch(), ppu.getControl().reg, ppu.getMask().reg,
        status.vblank, status.sprite0Hit, status.spriteOverflow };
}

std::vector<uint8_t> Debugger::peekMemory(uint16_t addr, size_t len) const {
    std::vector<uint8_t> out;
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) out.push_back(emu.getMemory().peek(uint16_t(addr + i)));
    return out;
}

std::vector<uint8_t> Debugger::peekPPUMemory(uint16_t addr, size_t len) const {
    std::vector<uint8_t> out;
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) out.push_back(emu.getVideoMemory().peek(uint16_t(addr + i)));
    return out;
}
