#pragma once

#include <stdexcept>
#include <string>

enum class MirrorMode {
    HORIZONTAL,
    VERTICAL,
    FOUR_SCREEN,
    SINGLE_SCREEN
};

enum class PPUStatusFlag {
    VBlank,
    Sprite0Hit,
    SpriteOverflow
};

// A collaborator broke the calling contract of a unit (stepping before
// reset(), a PPU register address outside $2000-$3FFF, loading an image
// outside cartridge space). Never an emulated condition.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what)
        : std::logic_error(what) {}
};

// Hardware behavior this core deliberately does not model.
class UnsupportedFeature : public std::runtime_error {
public:
    explicit UnsupportedFeature(const std::string& what)
        : std::runtime_error(what) {}
};
