#include "debug_gui.h"
#include "debugger.h"
#include "cpu.h"

#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

DebugGUI::DebugGUI(Debugger& dbg)
    : dbg(dbg), memViewAddr(0x0000), breakpointAddr(0x0000),
    showVideoMemory(false), initialized(false),
    sdlWindow(nullptr), sdlRenderer(nullptr)
{
}

DebugGUI::~DebugGUI() {
    shutdown();
}

void DebugGUI::init(SDL_Window* window, SDL_Renderer* renderer) {
    sdlWindow = window;
    sdlRenderer = renderer;
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplSDL3_InitForSDLRenderer(sdlWindow, sdlRenderer);
    ImGui_ImplSDLRenderer3_Init(sdlRenderer);
    initialized = true;
}

void DebugGUI::newFrame() {
    ImGui_ImplSDL3_NewFrame();
    ImGui_ImplSDLRenderer3_NewFrame();
    ImGui::NewFrame();
}

void DebugGUI::draw() {
    drawCPUWindow();
    drawPPUWindow();
    drawMemoryWindow();
}

void DebugGUI::drawCPUWindow() {
    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
    ImGui::Begin("CPU");
    auto s = dbg.getCPUState();
    ImGui::Text("PC: 0x%04X   CYC: %llu", s.PC, static_cast<unsigned long long>(s.cycles));
    ImGui::Text("A: %02X   X: %02X   Y: %02X", s.A, s.X, s.Y);
    ImGui::Text("SP: %02X   STATUS: %02X", s.SP, s.status);
    ImGui::Text("%c%c-%c%c%c%c%c",
        (s.status & FLAG_NEGATIVE) ? 'N' : 'n',
        (s.status & FLAG_OVERFLOW) ? 'V' : 'v',
        (s.status & FLAG_BREAK) ? 'B' : 'b',
        (s.status & FLAG_DECIMAL) ? 'D' : 'd',
        (s.status & FLAG_INTERRUPT) ? 'I' : 'i',
        (s.status & FLAG_ZERO) ? 'Z' : 'z',
        (s.status & FLAG_CARRY) ? 'C' : 'c');
    if (ImGui::Button(dbg.isPaused() ? "Run" : "Pause")) {
        dbg.isPaused() ? dbg.resume() : dbg.pause();
    }
    ImGui::SameLine();
    if (ImGui::Button("Step")) {
        dbg.requestStep();
    }

    if (!dbg.getLastError().empty()) {
        ImGui::Separator();
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", dbg.getLastError().c_str());
    }

    ImGui::Separator();
    ImGui::Text("Breakpoints:");
    ImGui::BeginChild("bps", ImVec2(0, 100), true);
    for (auto bp : dbg.getBreakpoints()) {
        ImGui::Text("0x%04X", bp);
    }
    ImGui::EndChild();
    ImGui::InputScalar("Toggle BP at", ImGuiDataType_U16,
        &breakpointAddr, nullptr, nullptr, "%04X");
    ImGui::SameLine();
    if (ImGui::Button("Toggle BP")) {
        dbg.toggleBreakpoint(breakpointAddr);
    }
    ImGui::End();
}

void DebugGUI::drawPPUWindow() {
    ImGui::SetNextWindowPos(ImVec2(10, 330), ImGuiCond_FirstUseEver);
    ImGui::Begin("PPU");
    auto p = dbg.getPPUState();
    ImGui::Text("Frame: %llu", static_cast<unsigned long long>(p.frame));
    ImGui::Text("Scanline: %d   Cycle: %d", p.scanline, p.cycle);
    ImGui::Text("CTRL: %02X   MASK: %02X", p.ppuCtrl, p.ppuMask);
    ImGui::Text("v: %04X   t: %04X   x: %d   w: %d", p.v, p.t, p.fineX, p.writeLatch ? 1 : 0);
    ImGui::Text("VBlank: %d   Sprite0: %d   Overflow: %d",
        p.vblank ? 1 : 0, p.sprite0Hit ? 1 : 0, p.spriteOverflow ? 1 : 0);
    ImGui::End();
}

void DebugGUI::drawMemoryWindow() {
    ImGui::SetNextWindowPos(ImVec2(530, 10), ImGuiCond_FirstUseEver);
    ImGui::Begin("Memory");
    ImGui::Checkbox("PPU address space", &showVideoMemory);
    ImGui::InputScalar("Addr", ImGuiDataType_U16,
        &memViewAddr, nullptr, nullptr, "%04X");
    auto block = showVideoMemory ? dbg.peekPPUMemory(memViewAddr, 256)
                                 : dbg.peekMemory(memViewAddr, 256);
    for (int i = 0; i < 16; ++i) {
        ImGui::Text("%04X:", uint16_t(memViewAddr + i * 16));
        for (int j = 0; j < 16; ++j) {
            ImGui::SameLine();
            ImGui::Text("%02X", block[i * 16 + j]);
        }
    }
    ImGui::End();
}

void DebugGUI::render() {
    ImGui::Render();
    ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), sdlRenderer);
}

void DebugGUI::shutdown() {
    if (!initialized) return;
    ImGui_ImplSDLRenderer3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    initialized = false;
}
