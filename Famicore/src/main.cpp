#include <memory>
#include <iostream>
#include <string>
#include <stdexcept>

#include "debugging/debugger.h"
#include "debugging/logger.h"

#include "config.h"
#include "emulator.h"
#include "renderer/cpu/cpu_renderer.h"

struct Options {
    std::string programPath;
    uint16_t loadAddress = 0x8000;
    MirrorMode mirror = MirrorMode::HORIZONTAL;
    bool trace = false;
    bool verbose = false;
    std::string logFile;
};

static void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0
        << " <program.bin> [--load-address HEX] [--mirror h|v|4|1]"
        << " [--trace] [--verbose] [--log FILE]\n";
}

static Options parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--load-address") {
            unsigned long addr = std::stoul(next(), nullptr, 16);
            if (addr > 0xFFFF) throw std::invalid_argument("load address out of range");
            opts.loadAddress = static_cast<uint16_t>(addr);
        }
        else if (arg == "--mirror") {
            std::string m = next();
            if (m == "h") opts.mirror = MirrorMode::HORIZONTAL;
            else if (m == "v") opts.mirror = MirrorMode::VERTICAL;
            else if (m == "4") opts.mirror = MirrorMode::FOUR_SCREEN;
            else if (m == "1") opts.mirror = MirrorMode::SINGLE_SCREEN;
            else throw std::invalid_argument("unknown mirroring: " + m);
        }
        else if (arg == "--trace") opts.trace = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--log") opts.logFile = next();
        else if (!arg.empty() && arg[0] == '-') throw std::invalid_argument("unknown option: " + arg);
        else opts.programPath = arg;
    }
    if (opts.programPath.empty()) throw std::invalid_argument("no program image given");
    return opts;
}

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    LoggerOptions logOptions;
    logOptions.logFile = opts.logFile;
    if (opts.trace) logOptions.level = quill::LogLevel::Debug;
    initLogger(logOptions);
    if (opts.verbose || opts.trace) enableDebugLogging();

    auto emulator = std::make_unique<Emulator>(opts.mirror);
    MemoryBus& memory = emulator->getMemory();

    try {
        size_t size = memory.loadProgramFile(opts.programPath, opts.loadAddress);

        // Images that stop short of the vectors start at their load address
        if (opts.loadAddress + size <= RESET_VECTOR) {
            memory.write(RESET_VECTOR, opts.loadAddress & 0xFF);
            memory.write(RESET_VECTOR + 1, opts.loadAddress >> 8);
        }
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdownLogger();
        return 1;
    }

    emulator->getCPU().setTraceEnabled(opts.trace);
    emulator->reset();

    std::unique_ptr<Renderer> renderer;
    try {
        renderer = std::make_unique<Renderer>
            (SCREEN_WIDTH * SCALE_FACTOR, SCREEN_HEIGHT * SCALE_FACTOR, "Famicore");
    }
    catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        shutdownLogger();
        return 1;
    }

    auto debugger = std::make_unique<Debugger>(*emulator);
    debugger->initGui(renderer->getSDLWindow(), renderer->getSDLRenderer());

    int skipFrames = SKIP_FRAMES;
    while (renderer->pollEvents()) {
        bool wasPaused = debugger->isPaused();
        debugger->update();

        if (!wasPaused) {
            if (skipFrames > 0) {
                --skipFrames;
            }
            else {
                renderer->upscaleImage(emulator->getFrameBuffer().pixels(),
                    SCREEN_WIDTH, SCREEN_HEIGHT, SCALE_FACTOR);
            }
        }
        renderer->renderFrame();

        debugger->newFrameGui();
        debugger->drawGui();
        debugger->renderGui();

        renderer->presentFrame();

        SDL_Delay(FRAME_DELAY);
    }

    debugger->shutdownGui();
    shutdownLogger();
    return 0;
}
