#include "native_action_converter.h"
#include "command_builder.h"
#include "../keys/key_normalizer.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include <cmath>

namespace marionette {

using utils::StringUtils;

namespace {
    void rejectCompoundAction(const std::string& argument, const std::string& kind) {
        std::string lowered = StringUtils::toLowerCase(argument);
        if (StringUtils::contains(lowered, " and ") || StringUtils::contains(lowered, " then ")) {
            throw FormatError("Invalid " + kind + " format: '" + argument + "'. "
                              "Cannot combine multiple actions with 'and' or 'then'. "
                              "Each action must be separate in the action list.");
        }
    }

    double parseNumber(const std::string& part, const std::string& argument, const std::string& kind,
                       const std::string& example) {
        double value = 0.0;
        if (!StringUtils::tryParseDouble(part, value)) {
            throw FormatError("Failed to parse " + kind + " coords '" + argument + "': "
                              "could not convert string to float: '" + StringUtils::trim(part) + "'. "
                              "Coordinates must be comma-separated numeric values, e.g., '" + example + "'");
        }
        return value;
    }
}

NativeActionConverter::NativeActionConverter(const ConverterConfig& config)
    : ActionConverter<Action>(COORD_SIZE, COORD_SIZE, config) {}

bool NativeActionConverter::isTerminalAction(const Action& action) const {
    return isTerminal(action.type);
}

std::string NativeActionConverter::describe(const Action& action) const {
    return actionTypeToString(action.type) + "(" + action.argument + ")";
}

int NativeActionConverter::repeatCount(const Action& action) const {
    return action.count;
}

std::vector<std::string> NativeActionConverter::convertSingle(const Action& action, SessionState& state) {
    // type() and press_click keep their payload; the rest lose wrapping parentheses
    const bool rawArgument = action.type == ActionType::TYPE || action.type == ActionType::PRESS_CLICK;
    const std::string argument = rawArgument
        ? action.argument
        : StringUtils::strip(action.argument, "()");

    switch (action.type) {
        case ActionType::CLICK: {
            auto [x, y] = parseClickCoords(argument);
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::click(x, y)};
        }

        case ActionType::LEFT_DOUBLE: {
            auto [x, y] = parseClickCoords(argument);
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::doubleClick(x, y)};
        }

        case ActionType::LEFT_TRIPLE: {
            auto [x, y] = parseClickCoords(argument);
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::tripleClick(x, y)};
        }

        case ActionType::RIGHT_SINGLE: {
            auto [x, y] = parseClickCoords(argument);
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::rightClick(x, y)};
        }

        case ActionType::DRAG: {
            auto [start, end] = parseDragCoords(argument);
            state.cursor = end;
            return {
                CommandBuilder::moveTo(start.first, start.second),
                CommandBuilder::dragTo(end.first, end.second, m_config.dragDuration)
            };
        }

        case ActionType::MOUSE_MOVE: {
            auto [x, y] = parseClickCoords(argument);
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::moveTo(x, y)};
        }

        case ActionType::LEFT_CLICK_DRAG: {
            auto end = parseClickCoords(argument);
            auto start = lastOrCenter(state);
            state.cursor = end;
            return {
                CommandBuilder::moveTo(start.first, start.second),
                CommandBuilder::dragTo(end.first, end.second, m_config.dragDuration)
            };
        }

        case ActionType::PRESS_CLICK:
            return convertPressClick(argument, state);

        case ActionType::HOTKEY:
            return convertHotkey(argument, state);

        case ActionType::TYPE: {
            std::string text = StringUtils::strip(argument, "\"'");
            text = state.capslock.transformText(text);
            return {CommandBuilder::typeText(text)};
        }

        case ActionType::SCROLL:
            return convertScroll(argument, state);

        case ActionType::WAIT:
            return convertWait(argument);

        case ActionType::FINISH:
            SLOG_INFO().message("Task completion action -> DONE").component(name());
            return {CommandBuilder::done()};

        case ActionType::FAIL:
            SLOG_INFO().message("Task infeasible action -> FAIL").component(name());
            return {CommandBuilder::fail()};

        case ActionType::CALL_USER:
            SLOG_INFO().message("User intervention requested").component(name());
            return {};
    }

    throw UnknownActionError("Unknown action type: '" + actionTypeToString(action.type) + "'", name());
}

std::pair<int, int> NativeActionConverter::parseClickCoords(const std::string& argument) const {
    rejectCompoundAction(argument, "click");

    auto parts = StringUtils::split(argument, ",");
    if (parts.size() < 2) {
        throw FormatError("Invalid click coordinate format: '" + argument + "'. "
                          "Expected 'x, y' (comma-separated numeric values)");
    }

    double x = parseNumber(parts[0], argument, "click", "click(500, 300)");
    double y = parseNumber(parts[1], argument, "click", "click(500, 300)");
    return scalePoint(x, y, m_config.strictCoordinateValidation);
}

std::pair<std::pair<int, int>, std::pair<int, int>>
NativeActionConverter::parseDragCoords(const std::string& argument) const {
    rejectCompoundAction(argument, "drag");

    auto parts = StringUtils::split(argument, ",");
    if (parts.size() != 4) {
        throw FormatError("Invalid drag coordinate format: '" + argument + "'. "
                          "Expected 'x1, y1, x2, y2' (4 comma-separated numeric values)");
    }

    const std::string example = "drag(100, 200, 300, 400)";
    double sx = parseNumber(parts[0], argument, "drag", example);
    double sy = parseNumber(parts[1], argument, "drag", example);
    double ex = parseNumber(parts[2], argument, "drag", example);
    double ey = parseNumber(parts[3], argument, "drag", example);

    bool strict = m_config.strictCoordinateValidation;
    return {scalePoint(sx, sy, strict), scalePoint(ex, ey, strict)};
}

std::vector<std::string> NativeActionConverter::convertHotkey(const std::string& argument,
                                                              SessionState& state) const {
    auto keys = KeyNormalizer::parseHotkey(argument, true);
    if (keys.empty()) {
        throw FormatError("Invalid hotkey format: '" + argument + "'. "
                          "Expected key names like 'ctrl+c', 'alt+tab'");
    }

    if (keys.size() == 1 && keys[0] == "capslock") {
        if (state.capslock.shouldDelegateToSystem()) {
            return {CommandBuilder::hotkey(keys, m_config.hotkeyInterval)};
        }
        state.capslock.toggle();
        SLOG_DEBUG().message("Session capslock toggled")
            .component(name())
            .context("enabled", state.capslock.isEnabled());
        return {};
    }

    return {CommandBuilder::hotkey(keys, m_config.hotkeyInterval)};
}

std::vector<std::string> NativeActionConverter::convertScroll(const std::string& argument,
                                                              SessionState& state) const {
    auto parts = StringUtils::split(argument, ",");
    for (auto& part : parts) {
        part = StringUtils::trim(part);
    }
    if (parts.size() != 3) {
        throw FormatError("Invalid scroll format: '" + argument + "'. "
                          "Expected 'x, y, direction' (3 comma-separated values), got " +
                          std::to_string(parts.size()) + " parts");
    }

    double x = 0.0;
    double y = 0.0;
    if (!StringUtils::tryParseDouble(parts[0], x) || !StringUtils::tryParseDouble(parts[1], y)) {
        throw FormatError("Invalid scroll coordinates: '" + argument + "'. "
                          "x and y must be numeric values, e.g., 'scroll(500, 300, up)'");
    }

    auto point = scalePoint(x, y, m_config.strictCoordinateValidation);
    std::string direction = StringUtils::toLowerCase(parts[2]);

    int amount = 0;
    if (direction == "up") {
        amount = m_config.scrollAmount;
    } else if (direction == "down") {
        amount = -m_config.scrollAmount;
    } else {
        throw FormatError("Invalid scroll direction: '" + direction + "' in '" + argument + "'. "
                          "Expected 'up' or 'down'");
    }

    state.cursor = point;
    return {CommandBuilder::moveTo(point.first, point.second), CommandBuilder::scroll(amount)};
}

std::vector<std::string> NativeActionConverter::convertPressClick(const std::string& argument,
                                                                  SessionState& state) const {
    nlohmann::json payload;
    if (!utils::JsonUtils::tryParse(argument, payload) || !payload.is_object()) {
        throw FormatError("Invalid press_click argument: '" + argument + "'. "
                          "Expected {\"keys\": [...], \"click_type\": \"...\", \"coordinate\": [x, y]}");
    }

    nlohmann::json coordinate;
    if (!utils::JsonUtils::getArrayField(payload, "coordinate", coordinate) || coordinate.size() < 2 ||
        !coordinate[0].is_number() || !coordinate[1].is_number()) {
        throw FormatError("press_click requires a numeric coordinate pair: '" + argument + "'");
    }

    std::vector<std::string> keys;
    nlohmann::json rawKeys;
    if (utils::JsonUtils::getArrayField(payload, "keys", rawKeys)) {
        for (const auto& key : rawKeys) {
            if (!key.is_string()) continue;
            std::string normalized = KeyNormalizer::normalize(key.get<std::string>());
            if (!normalized.empty()) {
                keys.push_back(normalized);
            }
        }
    }
    KeyNormalizer::validateKeys(keys);

    auto [x, y] = scalePoint(coordinate[0].get<double>(), coordinate[1].get<double>(),
                             m_config.strictCoordinateValidation);

    std::string clickType = utils::JsonUtils::getStringField(payload, "click_type", "left_click");
    std::string click;
    if (clickType == "left_click") {
        click = CommandBuilder::click(x, y);
    } else if (clickType == "right_click") {
        click = CommandBuilder::rightClick(x, y);
    } else if (clickType == "double_click") {
        click = CommandBuilder::doubleClick(x, y);
    } else if (clickType == "triple_click") {
        click = CommandBuilder::tripleClick(x, y);
    } else {
        throw FormatError("Unsupported press_click click_type: '" + clickType + "'");
    }

    std::vector<std::string> commands;
    for (const auto& key : keys) {
        commands.push_back(CommandBuilder::keyDown(key));
    }
    commands.push_back(click);
    for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
        commands.push_back(CommandBuilder::keyUp(*it));
    }

    state.cursor = std::make_pair(x, y);
    return commands;
}

std::vector<std::string> NativeActionConverter::convertWait(const std::string& argument) const {
    std::string trimmed = StringUtils::trim(argument);
    if (trimmed.empty()) {
        return {CommandBuilder::wait(m_config.waitDuration)};
    }

    double seconds = 0.0;
    if (!StringUtils::tryParseDouble(trimmed, seconds)) {
        throw FormatError("Invalid wait duration: '" + argument + "'. "
                          "Expected numeric value in seconds, e.g., 'wait(2.0)'");
    }
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw FormatError("Invalid wait duration: '" + argument + "'. "
                          "Duration must be a finite, non-negative number of seconds");
    }
    return {CommandBuilder::wait(seconds)};
}

} // namespace marionette
