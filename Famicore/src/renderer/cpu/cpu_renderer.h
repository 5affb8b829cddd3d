#pragma once

#include <SDL3/SDL.h>
#include <cstdint>
#include <span>
#include <vector>
#include <string>

// Software upscaler: PPU color indices -> ARGB texture in an SDL window.
class Renderer {
public:
    Renderer(int w, int h, const std::string& title);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Returns false once the window was closed.
    bool pollEvents();
    void processDebugGuiEvents(SDL_Event event);

    void upscaleImage(std::span<const uint8_t> source, int sw, int sh, int scale);
    void renderFrame();
    void presentFrame();

    SDL_Window* getSDLWindow();
    SDL_Renderer* getSDLRenderer();
private:
    SDL_Window* sdlWindow;
    SDL_Renderer* sdlRenderer;
    SDL_Texture* texture;
    int width;
    int height;

    std::vector<uint32_t> pixelBuffer;

    void destroy();
};
