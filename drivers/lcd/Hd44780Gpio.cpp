#include "Hd44780Gpio.hpp"
#include "LineFormatter.hpp"
#include <cstdio>

std::optional<Hd44780Gpio> Hd44780Gpio::create(PinController& gpio, Delay& delay,
                                               const PinAssignment& pins,
                                               const DisplayGeometry& geometry) {
    if (geometry.columns == 0 || geometry.lineAddresses.empty()) {
        printf("LCD: bad geometry (%u columns, %u lines)\r\n",
               (unsigned)geometry.columns, (unsigned)geometry.lineAddresses.size());
        return std::nullopt;
    }

    const uint8_t order[] = { pins.rs, pins.enable,
                              pins.data[0], pins.data[1], pins.data[2], pins.data[3] };
    for (uint8_t pin : order) {
        if (!gpio.configureOutput(pin)) {
            printf("LCD: GPIO %u rejected as output\r\n", (unsigned)pin);
            return std::nullopt;
        }
    }

    Hd44780Gpio lcd(pins, geometry, gpio, delay);
    lcd.initDisplay();
    return lcd;
}

Hd44780Gpio::Hd44780Gpio(const PinAssignment& pins, const DisplayGeometry& geometry,
                         PinController& gpio, Delay& delay)
: _pins(pins), _geometry(geometry), _bus(pins, gpio, delay) {}

void Hd44780Gpio::initDisplay() {
    // 0x28: 4-bit interface, two lines, 5x8 font. The first nibble (0x2)
    // is what switches an 8-bit-mode controller over to 4 bits.
    _bus.command(LCD_FUNCTIONSET | LCD_4BITMODE | LCD_2LINE);

    // 0x0C: display on, cursor off, blink off
    _bus.command(LCD_DISPLAYCONTROL | LCD_DISPLAYON);

    _bus.command(LCD_CLEARDISPLAY);
}

void Hd44780Gpio::render(std::string_view text) {
    const auto& addresses = _geometry.lineAddresses;
    const auto rows = LineFormatter::format(LineFormatter::splitLines(text),
                                            _geometry.columns, addresses.size());

    for (size_t line = 0; line < addresses.size(); ++line) {
        _bus.command(addresses[line]);
        for (char c : rows[line]) {
            _bus.data(static_cast<uint8_t>(c));
        }
    }
}
