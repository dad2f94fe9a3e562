#ifndef MARIONETTE_BROWSER_ACTION_CONVERTER_H
#define MARIONETTE_BROWSER_ACTION_CONVERTER_H

#include <string>
#include <vector>
#include "action_converter.h"
#include "dialect_actions.h"

namespace marionette {

/**
 * @brief Converts browser dialect actions (0-1000 normalized) to commands
 *
 * High-level verbs such as navigate, search and go_back expand into keyboard
 * sequences against the focused browser window. The dialect has no terminal kind.
 */
class BrowserActionConverter : public ActionConverter<BrowserAction> {
public:
    static constexpr int COORD_SIZE = 1000;
    static constexpr const char* SEARCH_URL = "https://www.google.com";

    explicit BrowserActionConverter(const ConverterConfig& config = ConverterConfig());

    std::string name() const override { return "BrowserActionConverter"; }

protected:
    std::vector<std::string> convertSingle(const BrowserAction& action, SessionState& state) override;
    bool isTerminalAction(const BrowserAction&) const override { return false; }
    std::string describe(const BrowserAction& action) const override;

private:
    std::pair<int, int> requirePoint(const BrowserAction& action, const std::string& verb) const;
};

} // namespace marionette

#endif // MARIONETTE_BROWSER_ACTION_CONVERTER_H
