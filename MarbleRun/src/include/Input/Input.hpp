#pragma once

// ── MarbleRun::Input: steering input sources ────────────────────────────────
//
// The controller only asks "is this direction held right now".  The window
// build answers from the raylib keyboard; tests answer from a fixed set.
//
//   A / Left arrow   -> Steer::Left
//   D / Right arrow  -> Steer::Right

#include <raylib.h>

namespace MarbleRun::Input {

enum class Steer { Left, Right };

class InputSource {
public:
    virtual ~InputSource() = default;
    virtual bool IsHeld(Steer dir) const = 0;
};

/// Reads the raylib keyboard state sampled at the start of the frame.
class KeyboardInput : public InputSource {
public:
    bool IsHeld(Steer dir) const override
    {
        if (dir == Steer::Left) return IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT);
        return IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT);
    }
};

/// Nothing held.  Used when the window does not have focus.
class NoInput : public InputSource {
public:
    bool IsHeld(Steer) const override { return false; }
};

} // namespace MarbleRun::Input
