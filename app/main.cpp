#include "pico/stdlib.h"
#include <cstdio>
#include <deque>
#include <string>

#include "lcd_board_config.h"
#include "PicoPinController.hpp"
#include "PicoDelay.hpp"
#include "Hd44780Gpio.hpp"
#include "LineReader.hpp"

PicoPinController pins;
PicoDelay delay;
LineReader console;

// Read one line from the console with echo. Returns false on Ctrl-C.
static bool readLine(std::string& line)
{
    while (true)
    {
        int c = getchar();
        switch (console.feed(c))
        {
        case LineReader::Event::Interrupt:
            return false;
        case LineReader::Event::Line:
            printf("\r\n");
            line = console.line();
            return true;
        case LineReader::Event::Erased:
            printf("\b \b");
            break;
        case LineReader::Event::Appended:
            putchar(c);
            break;
        case LineReader::Event::Ignored:
            break;
        }
    }
}

static std::string joinLines(const std::deque<std::string>& lines)
{
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i)
            text.push_back('\n');
        text += lines[i];
    }
    return text;
}

int main()
{
    stdio_init_all();

    while (!stdio_usb_connected())
    {
        sleep_ms(500);
    }

    printf("Serial connected. Ready.\r\n");

    auto lcd = Hd44780Gpio::create(pins, delay, LCD_PINS, LCD_GEOMETRY);
    if (!lcd)
        panic("LCD init failed");

    // newest line at the bottom, at most one entry per display line
    const size_t rows = LCD_GEOMETRY.lineAddresses.size();
    std::deque<std::string> lines{"Welcome..."};
    std::string input;

    while (true)
    {
        lcd->render(joinLines(lines));

        printf(">");
        fflush(stdout);
        if (!readLine(input))
            break;

        lines.push_back(input);
        while (lines.size() > rows)
            lines.pop_front();
    }

    printf("\r\nBye.\r\n");
    pins.releaseAll();
    return 0;
}
