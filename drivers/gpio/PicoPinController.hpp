#pragma once
#include <cstdint>
#include <vector>
#include "PinController.hpp"

/**
 * PinController on the RP2040 bank-0 GPIOs (Pico SDK hardware_gpio).
 * Pins are numbered as on the Pico pinout (GPn), there is no other scheme.
 */
class PicoPinController : public PinController {
public:
    bool configureOutput(uint8_t pin) override;
    void setLevel(uint8_t pin, bool level) override;

    // Return every pin configured through this object to its reset state.
    // Call once at shutdown.
    void releaseAll();

private:
    std::vector<uint8_t> _configured;
};
