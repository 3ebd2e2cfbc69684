#pragma once
#include "pico/stdlib.h"
#include "Delay.hpp"

class PicoDelay : public Delay {
public:
    void sleepUs(uint32_t us) override { sleep_us(us); }
};
