#pragma once
#include <array>
#include <cstdint>
#include <vector>

// How the module is wired. data[0] carries bit 0 of each nibble (D4),
// data[3] carries bit 3 (D7).
struct PinAssignment {
    uint8_t rs;                     // register select: low = command, high = data
    uint8_t enable;                 // strobe, latched on the falling edge
    std::array<uint8_t, 4> data;    // D4..D7
};

// Character layout of the module.
struct DisplayGeometry {
    uint8_t columns;                    // characters per line, > 0
    std::vector<uint8_t> lineAddresses; // "set DDRAM address" command per line, top to bottom
};
