#include "memory_bus.h"
#include "ppu.h"
#include "cpu.h"
#include "config.h"
#include "debugging/logger.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sstream>

MemoryBus::MemoryBus(PPU& ppu)
    : cartridge(0x10000 - CARTRIDGE_START, 0), busValue(0), ppu(ppu), cpu(nullptr)
{
    ram.fill(0);
}

void MemoryBus::connectCPU(CPU* p) {
    cpu = p;
}

//-----------------------------------------------------------------------------
// Program loading
//-----------------------------------------------------------------------------

void MemoryBus::loadProgram(std::span<const uint8_t> image, uint16_t loadAddress) {
    if (loadAddress < CARTRIDGE_START || loadAddress + image.size() > 0x10000) {
        std::ostringstream msg;
        msg << "Program of " << image.size() << " bytes at 0x" << std::hex << loadAddress
            << " does not fit in cartridge space";
        throw ContractViolation(msg.str());
    }
    std::copy(image.begin(), image.end(), cartridge.begin() + (loadAddress - CARTRIDGE_START));

    std::ostringstream msg;
    msg << "[BUS] Loaded " << image.size() << " bytes at $" << std::hex << std::uppercase << loadAddress;
    logInfo(msg.str());
}

size_t MemoryBus::loadProgramFile(const std::string& path, uint16_t loadAddress) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Could not open program image: " + path);

    std::vector<uint8_t> image((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    loadProgram(image, loadAddress);
    return image.size();
}

//-----------------------------------------------------------------------------
// CPU access
//-----------------------------------------------------------------------------

uint8_t MemoryBus::read(uint16_t addr) {
    // 1) 2 KB work RAM, mirrored every 0x800
    if (addr < 0x2000) busValue = ram[addr & 0x07FF];

    // 2) PPU registers $2000-$2007 (mirrored through $3FFF)
    else if (addr < 0x4000) busValue = ppu.readRegister(0x2000 + (addr & 0x7));

    // 3) APU / controllers / OAM DMA ($4000-$401F): nothing drives the bus
    else if (addr < CARTRIDGE_START) return busValue;

    // 4) Cartridge space
    else busValue = cartridge[addr - CARTRIDGE_START];

    return busValue;
}

void MemoryBus::write(uint16_t addr, uint8_t val) {
    busValue = val;

    if (addr < 0x2000) {
        ram[addr & 0x07FF] = val;                        return;
    }
    if (addr < 0x4000) {
        ppu.writeRegister(0x2000 + (addr & 0x7), val);   return;
    }
    if (addr == 0x4014) {
        runOamDma(val);                                  return;
    }
    if (addr < CARTRIDGE_START) return;  // APU / controller strobe
    cartridge[addr - CARTRIDGE_START] = val;
}

uint8_t MemoryBus::peek(uint16_t addr) const {
    // same as read but without side-effects (no PPU latch or buffer changes)
    if (addr < 0x2000) return ram[addr & 0x07FF];
    if (addr < 0x4000) return ppu.peekRegister(0x2000 + (addr & 0x7));
    if (addr < CARTRIDGE_START) return busValue;
    return cartridge[addr - CARTRIDGE_START];
}

//-----------------------------------------------------------------------------
// OAM DMA: copy 256 bytes from CPU page to PPU OAM
//-----------------------------------------------------------------------------

void MemoryBus::runOamDma(uint8_t page) {
    if (!cpu) {
        throw ContractViolation("OAM DMA requested with no CPU connected to the bus");
    }

    uint16_t base = uint16_t(page) << 8;
    for (int i = 0; i < 256; ++i) {
        ppu.writeOAM(read(base + i));
    }
    cpu->addStallCycles(OAM_DMA_STALL_CYCLES);
}
