#ifndef MARIONETTE_NATIVE_ACTION_CONVERTER_H
#define MARIONETTE_NATIVE_ACTION_CONVERTER_H

#include <string>
#include <vector>
#include <utility>
#include "action_converter.h"
#include "../actions/action.h"

namespace marionette {

/**
 * @brief Converts native actions (0-1000 coordinate space) to commands
 *
 * Positional arguments come as "x, y", "x1, y1, x2, y2" or "x, y, direction".
 * With strict coordinate validation on, out-of-range inputs raise
 * CoordinateRangeError instead of being clamped.
 */
class NativeActionConverter : public ActionConverter<Action> {
public:
    static constexpr int COORD_SIZE = 1000;

    explicit NativeActionConverter(const ConverterConfig& config = ConverterConfig());

    std::string name() const override { return "NativeActionConverter"; }

protected:
    std::vector<std::string> convertSingle(const Action& action, SessionState& state) override;
    bool isTerminalAction(const Action& action) const override;
    std::string describe(const Action& action) const override;
    int repeatCount(const Action& action) const override;

private:
    std::pair<int, int> parseClickCoords(const std::string& argument) const;
    std::pair<std::pair<int, int>, std::pair<int, int>> parseDragCoords(const std::string& argument) const;

    std::vector<std::string> convertHotkey(const std::string& argument, SessionState& state) const;
    std::vector<std::string> convertScroll(const std::string& argument, SessionState& state) const;
    std::vector<std::string> convertPressClick(const std::string& argument, SessionState& state) const;
    std::vector<std::string> convertWait(const std::string& argument) const;
};

} // namespace marionette

#endif // MARIONETTE_NATIVE_ACTION_CONVERTER_H
