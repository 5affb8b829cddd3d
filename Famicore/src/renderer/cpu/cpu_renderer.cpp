#include "cpu_renderer.h"
#include "palette.h"
#include "debugging/logger.h"

#include <imgui_impl_sdl3.h>
#include <algorithm>
#include <stdexcept>
#include <string>

Renderer::Renderer(int w, int h, const std::string& title)
    : sdlWindow(nullptr), sdlRenderer(nullptr), texture(nullptr),
    width(w), height(h), pixelBuffer(w * h, 0xFF000000)
{
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        throw std::runtime_error(std::string("SDL init error: ") + SDL_GetError());
    }
    sdlWindow = SDL_CreateWindow(title.c_str(), width, height, 0);
    if (!sdlWindow) {
        std::string err = std::string("Window creation error: ") + SDL_GetError();
        destroy();
        throw std::runtime_error(err);
    }
    sdlRenderer = SDL_CreateRenderer(sdlWindow, nullptr);
    if (!sdlRenderer) {
        std::string err = std::string("Renderer creation error: ") + SDL_GetError();
        destroy();
        throw std::runtime_error(err);
    }
    texture = SDL_CreateTexture(sdlRenderer, SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING, width, height);
    if (!texture) {
        std::string err = std::string("Texture creation error: ") + SDL_GetError();
        destroy();
        throw std::runtime_error(err);
    }
    logInfo("[SDL] Window " + std::to_string(width) + "x" + std::to_string(height) + " ready.");
}

Renderer::~Renderer()
{
    destroy();
}

void Renderer::destroy() {
    if (texture) SDL_DestroyTexture(texture);
    if (sdlRenderer) SDL_DestroyRenderer(sdlRenderer);
    if (sdlWindow) SDL_DestroyWindow(sdlWindow);
    texture = nullptr;
    sdlRenderer = nullptr;
    sdlWindow = nullptr;
    SDL_Quit();
}

void Renderer::renderFrame()
{
    SDL_UpdateTexture(texture, nullptr, pixelBuffer.data(), width * sizeof(uint32_t));
    SDL_RenderClear(sdlRenderer);
    SDL_RenderTexture(sdlRenderer, texture, nullptr, nullptr);
}

void Renderer::presentFrame() {
    SDL_RenderPresent(sdlRenderer);
}

bool Renderer::pollEvents()
{
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        processDebugGuiEvents(event);
        if (event.type == SDL_EVENT_QUIT) {
            return false;
        }
    }
    return true;
}

void Renderer::processDebugGuiEvents(SDL_Event event) {
    ImGui_ImplSDL3_ProcessEvent(&event);
}

void Renderer::upscaleImage(std::span<const uint8_t> source, int sw, int sh, int scale)
{
    int dw = std::min(sw * scale, width);
    int dh = std::min(sh * scale, height);

    for (int y = 0; y < dh; y++) {
        int sy = y / scale;
        for (int x = 0; x < dw; x++) {
            int sx = x / scale;
            pixelBuffer[y * width + x] = paletteToARGB(source[sy * sw + sx]);
        }
    }
}

SDL_Window* Renderer::getSDLWindow() { return sdlWindow; }
SDL_Renderer* Renderer::getSDLRenderer() { return sdlRenderer; }
