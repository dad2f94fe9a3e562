#include "capslock_state.h"
#include "../common/string_utils.h"

namespace marionette {

CapsLockState::CapsLockState(CapsLockMode mode)
    : m_mode(mode), m_enabled(false) {}

void CapsLockState::toggle() {
    if (m_mode == CapsLockMode::SESSION) {
        m_enabled = !m_enabled;
    }
}

void CapsLockState::reset() {
    m_enabled = false;
}

std::string CapsLockState::transformText(const std::string& text) const {
    if (m_mode == CapsLockMode::SESSION && m_enabled) {
        return utils::StringUtils::toUpperCase(text);
    }
    return text;
}

bool CapsLockState::shouldDelegateToSystem() const {
    return m_mode == CapsLockMode::SYSTEM;
}

} // namespace marionette
