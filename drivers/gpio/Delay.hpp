#pragma once
#include <cstdint>

// Blocking wait. Bus timing goes through this so it can be faked in tests.
class Delay {
public:
    virtual ~Delay() = default;
    virtual void sleepUs(uint32_t us) = 0;
};
