#include "command_builder.h"
#include "../common/string_utils.h"
#include "../common/error_handler.h"
#include <cmath>
#include <cstdio>

namespace marionette {

using utils::StringUtils;

namespace {
    std::string pointCall(const std::string& function, int x, int y) {
        return "pyautogui." + function + "(x=" + std::to_string(x) + ", y=" + std::to_string(y) + ")";
    }

    // Plain "digits.digits" form; never an exponent
    std::string plainSeconds(double seconds) {
        std::string text = StringUtils::formatDecimal(seconds);
        if (text.find_first_of("eE") == std::string::npos) {
            return text;
        }
        char buf[512];
        std::snprintf(buf, sizeof(buf), "%.6f", seconds);
        text = buf;
        while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') {
            text.pop_back();
        }
        return text;
    }
}

std::string CommandBuilder::click(int x, int y) {
    return pointCall("click", x, y);
}

std::string CommandBuilder::doubleClick(int x, int y) {
    return pointCall("doubleClick", x, y);
}

std::string CommandBuilder::tripleClick(int x, int y) {
    return pointCall("tripleClick", x, y);
}

std::string CommandBuilder::rightClick(int x, int y) {
    return pointCall("rightClick", x, y);
}

std::string CommandBuilder::middleClick(int x, int y) {
    return "pyautogui.click(x=" + std::to_string(x) + ", y=" + std::to_string(y) + ", button='middle')";
}

std::string CommandBuilder::moveTo(int x, int y) {
    return "pyautogui.moveTo(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

std::string CommandBuilder::dragTo(int x, int y, double duration) {
    return "pyautogui.dragTo(" + std::to_string(x) + ", " + std::to_string(y) +
           ", duration=" + StringUtils::formatDecimal(duration) + ")";
}

std::string CommandBuilder::hotkey(const std::vector<std::string>& keys, double interval) {
    std::vector<std::string> quoted;
    quoted.reserve(keys.size());
    for (const auto& key : keys) {
        quoted.push_back(StringUtils::quoteLiteral(key));
    }
    return "pyautogui.hotkey(" + StringUtils::join(quoted, ", ") +
           ", interval=" + StringUtils::formatDecimal(interval) + ")";
}

std::string CommandBuilder::press(const std::string& key) {
    return "pyautogui.press(" + StringUtils::quoteLiteral(key) + ")";
}

std::string CommandBuilder::keyDown(const std::string& key) {
    return "pyautogui.keyDown(" + StringUtils::quoteLiteral(key) + ")";
}

std::string CommandBuilder::keyUp(const std::string& key) {
    return "pyautogui.keyUp(" + StringUtils::quoteLiteral(key) + ")";
}

std::string CommandBuilder::scroll(int amount) {
    return "pyautogui.scroll(" + std::to_string(amount) + ")";
}

std::string CommandBuilder::typeText(const std::string& text) {
    bool typeable = text.size() <= MAX_TYPED_LENGTH &&
                    StringUtils::isPrintableAscii(text);
    if (typeable) {
        return "PynputController().type(" + StringUtils::quoteLiteral(text) + ")";
    }
    return "_smart_paste(" + StringUtils::quoteLiteral(text) + ")";
}

std::string CommandBuilder::wait(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw FormatError("Invalid wait duration: " + StringUtils::formatDecimal(seconds) +
                          ". Expected a finite, non-negative number of seconds");
    }
    if (seconds == 0.0) {
        return "WAIT(0.0)";
    }
    return "WAIT(" + plainSeconds(seconds) + ")";
}

std::string CommandBuilder::waitWholeSeconds(int seconds) {
    return "WAIT(" + std::to_string(seconds) + ")";
}

std::string CommandBuilder::done() {
    return "DONE";
}

std::string CommandBuilder::fail() {
    return "FAIL";
}

} // namespace marionette
