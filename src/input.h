// input.h
// Platform-neutral keyboard state. The frontend fills an InputState from
// whatever the OS reports and forwards key-down edges as KeyPress events.
#pragma once
#include <cstdint>

enum Key : uint16_t {
    KEY_UP    = 1 << 0,
    KEY_DOWN  = 1 << 1,
    KEY_LEFT  = 1 << 2,
    KEY_RIGHT = 1 << 3,

    KEY_W     = 1 << 4,
    KEY_A     = 1 << 5,
    KEY_S     = 1 << 6,
    KEY_D     = 1 << 7,

    KEY_SPACE  = 1 << 8,
    KEY_R      = 1 << 9,
    KEY_ESCAPE = 1 << 10,
};

struct InputState {
    uint16_t held = 0;

    bool down(Key k) const { return (held & k) != 0; }
    void set(Key k, bool on) { if (on) held = uint16_t(held | k); else held = uint16_t(held & ~k); }
};

// Keys that went down between `prev` and `now`.
inline uint16_t pressedEdges(const InputState& now, const InputState& prev) {
    return uint16_t(now.held & ~prev.held);
}
