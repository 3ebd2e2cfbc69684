#ifndef _LCD_BOARD_CONFIG_H
#define _LCD_BOARD_CONFIG_H

#include "LcdConfig.hpp"

// 20x4 HD44780 module on the Pico, RW tied to GND.
//   GP16 -> RS (pin 4)    GP18 -> D4 (pin 11)    GP20 -> D6 (pin 13)
//   GP17 -> E  (pin 6)    GP19 -> D5 (pin 12)    GP21 -> D7 (pin 14)
inline const PinAssignment LCD_PINS = {
    16,                 // RS
    17,                 // E
    { 18, 19, 20, 21 }, // D4..D7
};

// Line starts of a 20x4 module, as "set DDRAM address" commands
inline const DisplayGeometry LCD_GEOMETRY = {
    20,
    { 0x80, 0xC0, 0x94, 0xD4 },
};

#endif // _LCD_BOARD_CONFIG_H
