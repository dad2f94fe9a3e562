#include "types.h"

namespace marionette {

std::string capsLockModeToString(CapsLockMode mode) {
    switch (mode) {
        case CapsLockMode::SESSION: return "session";
        case CapsLockMode::SYSTEM: return "system";
    }
    return "session";
}

} // namespace marionette
