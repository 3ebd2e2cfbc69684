#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <vector>
#include "PinController.hpp"
#include "Delay.hpp"
#include "LcdConfig.hpp"

// Fake GPIO + clock that logs every call in order.
class RecordingGpio : public PinController, public Delay {
public:
    enum class Kind { Configure, Level, Wait };

    struct Event {
        Kind     kind;
        uint8_t  pin;
        bool     level;
        uint32_t us;
    };

    // A byte as seen by the controller: RS level and the two latched nibbles.
    struct Transfer {
        bool    data;
        uint8_t value;
        bool operator==(const Transfer& o) const { return data == o.data && value == o.value; }
    };

    std::vector<Event> events;
    std::set<uint8_t>  rejected;

    bool configureOutput(uint8_t pin) override {
        events.push_back({Kind::Configure, pin, false, 0});
        if (rejected.count(pin))
            return false;
        levels_[pin] = false;
        return true;
    }

    void setLevel(uint8_t pin, bool level) override {
        events.push_back({Kind::Level, pin, level, 0});
    }

    void sleepUs(uint32_t us) override {
        events.push_back({Kind::Wait, 0, false, us});
    }

    void clear() { events.clear(); }

    size_t count(Kind kind) const {
        size_t n = 0;
        for (const auto& e : events)
            if (e.kind == kind) ++n;
        return n;
    }

    // Replay the log and return what the controller latched, one entry per
    // falling edge of E paired into bytes (high nibble first).
    std::vector<Transfer> transfers(const PinAssignment& pins) const {
        std::map<uint8_t, bool> level = levels_;
        std::vector<Transfer> out;
        bool havingHigh = false;
        uint8_t high = 0;
        bool highRs = false;
        for (const auto& e : events) {
            if (e.kind != Kind::Level)
                continue;
            bool wasHigh = level[e.pin];
            level[e.pin] = e.level;
            if (e.pin != pins.enable || !wasHigh || e.level)
                continue;
            uint8_t nibble = 0;
            for (int i = 0; i < 4; ++i)
                if (level[pins.data[i]]) nibble |= (uint8_t)(1u << i);
            bool rs = level[pins.rs];
            if (!havingHigh) {
                high = nibble;
                highRs = rs;
                havingHigh = true;
            } else {
                out.push_back({highRs && rs, (uint8_t)((high << 4) | nibble)});
                havingHigh = false;
            }
        }
        return out;
    }

private:
    std::map<uint8_t, bool> levels_;
};
