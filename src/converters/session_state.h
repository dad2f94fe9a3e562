#ifndef MARIONETTE_SESSION_STATE_H
#define MARIONETTE_SESSION_STATE_H

#include <optional>
#include <utility>
#include "../keys/capslock_state.h"

namespace marionette {

// Mutable per-session state shared by every action a converter processes
struct SessionState {
    std::optional<std::pair<int, int>> cursor;  // target pixels, set after positional actions
    CapsLockState capslock;

    explicit SessionState(CapsLockMode mode = CapsLockMode::SESSION)
        : capslock(mode) {}

    void reset() {
        cursor.reset();
        capslock.reset();
    }
};

} // namespace marionette

#endif // MARIONETTE_SESSION_STATE_H
