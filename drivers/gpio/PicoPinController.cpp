#include "PicoPinController.hpp"
#include "pico/stdlib.h"
#include <algorithm>
#include <cstdio>

bool PicoPinController::configureOutput(uint8_t pin) {
    if (pin >= NUM_BANK0_GPIOS) {
        printf("GPIO %u: not a bank 0 pin\r\n", (unsigned)pin);
        return false;
    }
    gpio_init(pin);
    gpio_put(pin, false);          // latch low before enabling the driver
    gpio_set_dir(pin, GPIO_OUT);
    if (std::find(_configured.begin(), _configured.end(), pin) == _configured.end())
        _configured.push_back(pin);
    return true;
}

void PicoPinController::setLevel(uint8_t pin, bool level) {
    gpio_put(pin, level);
}

void PicoPinController::releaseAll() {
    for (uint8_t pin : _configured) {
        gpio_put(pin, false);
        gpio_deinit(pin);
    }
    _configured.clear();
}
