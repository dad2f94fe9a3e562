#ifndef MARIONETTE_XGA_ACTION_CONVERTER_H
#define MARIONETTE_XGA_ACTION_CONVERTER_H

#include <string>
#include <vector>
#include "action_converter.h"
#include "dialect_actions.h"

namespace marionette {

/**
 * @brief Converts XGA dialect actions (1024x768 pixels) to commands
 *
 * Clicks without a coordinate reuse the last cursor position. A drag without
 * a start coordinate starts from the cursor. finish is the only terminal kind.
 */
class XgaActionConverter : public ActionConverter<XgaAction> {
public:
    static constexpr int XGA_WIDTH = 1024;
    static constexpr int XGA_HEIGHT = 768;

    explicit XgaActionConverter(const ConverterConfig& config = ConverterConfig());

    std::string name() const override { return "XgaActionConverter"; }

protected:
    std::vector<std::string> convertSingle(const XgaAction& action, SessionState& state) override;
    bool isTerminalAction(const XgaAction& action) const override;
    std::string describe(const XgaAction& action) const override;

private:
    std::pair<int, int> coordsOrLast(const XgaAction& action, SessionState& state) const;
    std::vector<std::string> parseKeyText(const std::string& text) const;
};

} // namespace marionette

#endif // MARIONETTE_XGA_ACTION_CONVERTER_H
