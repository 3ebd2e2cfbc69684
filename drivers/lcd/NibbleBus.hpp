#pragma once
#include <array>
#include <cstdint>
#include "LcdConfig.hpp"
#include "PinController.hpp"
#include "Delay.hpp"

/**
 * HD44780 write path in 4-bit mode (RW tied to ground).
 * Every byte goes out as two nibbles, high nibble first, each one framed as:
 *   RS = mode, D4..D7 = nibble, wait, E high, wait, E low, wait.
 * There is no busy-flag polling, the fixed waits are the only pacing.
 */
class NibbleBus {
public:
    enum class Mode : uint8_t { Command, Data };

    // Settle, strobe-high and recovery time, in microseconds.
    static constexpr uint32_t kTransferDelayUs = 50;

    NibbleBus(const PinAssignment& pins, PinController& gpio, Delay& delay);

    void sendByte(Mode mode, uint8_t value);

    void command(uint8_t value) { sendByte(Mode::Command, value); }
    void data(uint8_t value)    { sendByte(Mode::Data, value); }

    // Bits of the high (bits 4..7) or low (bits 0..3) nibble, D4 first.
    static std::array<bool, 4> nibbleBits(uint8_t value, bool highNibble);

private:
    void sendNibble(Mode mode, const std::array<bool, 4>& bits);

    const PinAssignment _pins;
    PinController& _gpio;
    Delay& _delay;
};
