#pragma once
#include <cstdint>

// Digital output lines, addressed by GPIO number.
class PinController {
public:
    virtual ~PinController() = default;

    // Make `pin` a digital output driven low. Returns false if the platform
    // rejects the pin id.
    virtual bool configureOutput(uint8_t pin) = 0;

    // Drive one output high (true) or low (false). Takes effect immediately.
    virtual void setLevel(uint8_t pin, bool level) = 0;
};
