// input.cpp
#include "input.h"

Input::Input() : strobe(false) {
    for (int i = 0; i < 2; i++) {
        controllers[i].state.store(0);
        controllers[i].shift_reg = 0;
    }
}

void Input::set_buttons(int port, uint8_t state) {
    controllers[port & 1].state.store(state);
}

void Input::set_buttons(int port, bool a, bool b, bool select, bool start,
                        bool up, bool down, bool left, bool right) {
    uint8_t state = 0;
    if (a)      state |= BUTTON_A;
    if (b)      state |= BUTTON_B;
    if (select) state |= BUTTON_SELECT;
    if (start)  state |= BUTTON_START;
    if (up)     state |= BUTTON_UP;
    if (down)   state |= BUTTON_DOWN;
    if (left)   state |= BUTTON_LEFT;
    if (right)  state |= BUTTON_RIGHT;
    set_buttons(port, state);
}

uint8_t Input::get_buttons(int port) const {
    return controllers[port & 1].state.load();
}

void Input::write_strobe(uint8_t value) {
    strobe = value & 1;

    if (strobe) {
        controllers[0].shift_reg = controllers[0].state.load();
        controllers[1].shift_reg = controllers[1].state.load();
    }
}

uint8_t Input::read_controller(int port) {
    NESController& controller = controllers[port & 1];

    // while strobe is held the register keeps reloading, so A is all you get
    if (strobe) {
        controller.shift_reg = controller.state.load();
    }

    uint8_t return_value = controller.shift_reg & 1;
    if (!strobe) {
        // official pads shift in 1s once the 8 buttons are out
        controller.shift_reg = (controller.shift_reg >> 1) | 0x80;
    }
    return return_value | 0x40;
}
