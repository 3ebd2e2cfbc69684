#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include "LcdConfig.hpp"
#include "NibbleBus.hpp"

/**
 * HD44780 character LCD wired directly to six GPIOs (RS, E, D4..D7), RW
 * grounded, driven write-only in 4-bit mode.
 *
 * The driver keeps no display state of its own: every render() rewrites
 * all lines from scratch.
 */
class Hd44780Gpio {
public:
    // Configure RS, E and D4..D7 as outputs (in that order) and initialise
    // the controller. Returns nothing if the geometry is unusable or a pin is
    // rejected; in that case no transfer has been sent to the module.
    static std::optional<Hd44780Gpio> create(PinController& gpio, Delay& delay,
                                             const PinAssignment& pins,
                                             const DisplayGeometry& geometry);

    // Show `text` on the display, one '\n'-separated line per display line.
    // Lines are space padded or truncated to the column count; display lines
    // without text are blanked and surplus text lines are dropped.
    void render(std::string_view text);

    const PinAssignment&   pins() const     { return _pins; }
    const DisplayGeometry& geometry() const { return _geometry; }

private:
    Hd44780Gpio(const PinAssignment& pins, const DisplayGeometry& geometry,
                PinController& gpio, Delay& delay);

    void initDisplay();

    // Commands
    static constexpr uint8_t LCD_CLEARDISPLAY   = 0x01;
    static constexpr uint8_t LCD_DISPLAYCONTROL = 0x08;
    static constexpr uint8_t LCD_FUNCTIONSET    = 0x20;

    // Display control
    static constexpr uint8_t LCD_DISPLAYON = 0x04;

    // Function set
    static constexpr uint8_t LCD_4BITMODE = 0x00;
    static constexpr uint8_t LCD_2LINE    = 0x08;

    const PinAssignment   _pins;
    const DisplayGeometry _geometry;
    NibbleBus             _bus;
};
