#pragma once

#include <cstdint>

// Address-decoded device dispatcher. Reads and writes are total over the
// whole 16-bit space: unmapped regions return a defined value.
class Bus {
public:
    virtual ~Bus() = default;

    virtual uint8_t read(uint16_t addr) = 0;
    virtual void    write(uint16_t addr, uint8_t val) = 0;

    // What read() would return, without side effects.
    virtual uint8_t peek(uint16_t addr) const = 0;
};
