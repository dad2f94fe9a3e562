#ifndef MARIONETTE_CURSOR_ACTION_CONVERTER_H
#define MARIONETTE_CURSOR_ACTION_CONVERTER_H

#include <string>
#include <vector>
#include "action_converter.h"
#include "dialect_actions.h"

namespace marionette {

/**
 * @brief Converts cursor dialect actions (0-999 normalized) to commands
 *
 * The cursor starts at the centre of the target display and follows every
 * action that carries a coordinate. Actions without one act at the cursor.
 */
class CursorActionConverter : public ActionConverter<CursorAction> {
public:
    static constexpr int COORD_SIZE = 999;

    explicit CursorActionConverter(const ConverterConfig& config = ConverterConfig());

    std::string name() const override { return "CursorActionConverter"; }

    // Current cursor in target pixels
    std::pair<int, int> cursor() const { return lastOrCenter(m_session); }

protected:
    std::vector<std::string> convertSingle(const CursorAction& action, SessionState& state) override;
    bool isTerminalAction(const CursorAction& action) const override;
    std::string describe(const CursorAction& action) const override;

private:
    std::pair<int, int> coordsOrCursor(const CursorAction& action, SessionState& state) const;
};

} // namespace marionette

#endif // MARIONETTE_CURSOR_ACTION_CONVERTER_H
