#ifndef MARIONETTE_CAPSLOCK_STATE_H
#define MARIONETTE_CAPSLOCK_STATE_H

#include <string>
#include "../common/types.h"

namespace marionette {

/**
 * @brief Caps-lock toggle tracked across one session
 *
 * In SESSION mode the flag is virtual and typed text is upper-cased while it
 * is enabled. In SYSTEM mode the real key is forwarded and this object never
 * changes state.
 */
class CapsLockState {
public:
    explicit CapsLockState(CapsLockMode mode = CapsLockMode::SESSION);

    void toggle();
    void reset();

    std::string transformText(const std::string& text) const;
    bool shouldDelegateToSystem() const;

    bool isEnabled() const { return m_enabled; }
    CapsLockMode getMode() const { return m_mode; }

private:
    CapsLockMode m_mode;
    bool m_enabled;
};

} // namespace marionette

#endif // MARIONETTE_CAPSLOCK_STATE_H
