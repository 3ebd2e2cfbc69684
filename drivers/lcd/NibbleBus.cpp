#include "NibbleBus.hpp"
#include <cstddef>

NibbleBus::NibbleBus(const PinAssignment& pins, PinController& gpio, Delay& delay)
: _pins(pins), _gpio(gpio), _delay(delay) {}

std::array<bool, 4> NibbleBus::nibbleBits(uint8_t value, bool highNibble) {
    const uint8_t nibble = highNibble ? (value >> 4) : (value & 0x0F);
    return { (nibble & 0x01) != 0,
             (nibble & 0x02) != 0,
             (nibble & 0x04) != 0,
             (nibble & 0x08) != 0 };
}

void NibbleBus::sendByte(Mode mode, uint8_t value) {
    // the controller always expects the high nibble first
    sendNibble(mode, nibbleBits(value, true));
    sendNibble(mode, nibbleBits(value, false));
}

void NibbleBus::sendNibble(Mode mode, const std::array<bool, 4>& bits) {
    _gpio.setLevel(_pins.rs, mode == Mode::Data);
    for (size_t i = 0; i < bits.size(); ++i) {
        _gpio.setLevel(_pins.data[i], bits[i]);
    }

    _delay.sleepUs(kTransferDelayUs);
    _gpio.setLevel(_pins.enable, true);
    _delay.sleepUs(kTransferDelayUs);
    _gpio.setLevel(_pins.enable, false);
    _delay.sleepUs(kTransferDelayUs);
}
