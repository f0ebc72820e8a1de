#pragma once
#include <atomic>
#include <cstdint>

// Bit order of the controller shift register, first bit read is A
#define BUTTON_A      (1 << 0)
#define BUTTON_B      (1 << 1)
#define BUTTON_SELECT (1 << 2)
#define BUTTON_START  (1 << 3)
#define BUTTON_UP     (1 << 4)
#define BUTTON_DOWN   (1 << 5)
#define BUTTON_LEFT   (1 << 6)
#define BUTTON_RIGHT  (1 << 7)


/*
 * The two standard controller ports at $4016/$4017.
 *
 * set_buttons() may be called from an input thread; the live state is an
 * atomic byte and the CPU side only ever copies it whole on a strobe, so a
 * read sequence never sees half an update.
 */
class Input {
public:
    Input();

    void set_buttons(int port, uint8_t state);
    void set_buttons(int port, bool a, bool b, bool select, bool start,
                     bool up, bool down, bool left, bool right);
    uint8_t get_buttons(int port) const;

    void write_strobe(uint8_t value);
    uint8_t read_controller(int port);

private:
    struct NESController {
        std::atomic<uint8_t> state; // Current button states
        uint8_t shift_reg;          // Serial shift register
    };

    NESController controllers[2];
    bool strobe; // Strobe flag, shared by both ports
};
