#include "xga_action_converter.h"
#include "command_builder.h"
#include "../keys/key_normalizer.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"

namespace marionette {

using utils::StringUtils;

XgaActionConverter::XgaActionConverter(const ConverterConfig& config)
    : ActionConverter<XgaAction>(XGA_WIDTH, XGA_HEIGHT, config) {}

bool XgaActionConverter::isTerminalAction(const XgaAction& action) const {
    auto kind = action.kind();
    return kind && *kind == XgaActionKind::FINISH;
}

std::string XgaActionConverter::describe(const XgaAction& action) const {
    return utils::JsonUtils::safeDump(action.toJson());
}

std::pair<int, int> XgaActionConverter::coordsOrLast(const XgaAction& action, SessionState& state) const {
    if (action.coordinate) {
        auto point = scalePoint(action.coordinate->first, action.coordinate->second);
        state.cursor = point;
        return point;
    }
    return lastOrCenter(state);
}

// "ctrl-c" and "ctrl+c" are equivalent
std::vector<std::string> XgaActionConverter::parseKeyText(const std::string& text) const {
    std::vector<std::string> keys;
    for (const auto& part : StringUtils::split(StringUtils::replaceAll(text, "-", "+"), "+")) {
        if (StringUtils::isWhitespaceOnly(part)) continue;
        std::string key = KeyNormalizer::normalize(part);
        if (!key.empty()) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::vector<std::string> XgaActionConverter::convertSingle(const XgaAction& action, SessionState& state) {
    auto kind = action.kind();
    if (!kind) {
        throw UnknownActionError("Unknown XGA action type: '" + action.actionType + "'", name());
    }

    switch (*kind) {
        case XgaActionKind::SCREENSHOT:
        case XgaActionKind::CURSOR_POSITION:
            return {};

        case XgaActionKind::MOUSE_MOVE: {
            if (!action.coordinate) {
                throw FormatError("coordinate is required for mouse_move", name());
            }
            auto [x, y] = scalePoint(action.coordinate->first, action.coordinate->second);
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::moveTo(x, y)};
        }

        case XgaActionKind::LEFT_CLICK: {
            auto [x, y] = coordsOrLast(action, state);
            return {CommandBuilder::click(x, y)};
        }

        case XgaActionKind::DOUBLE_CLICK: {
            auto [x, y] = coordsOrLast(action, state);
            return {CommandBuilder::doubleClick(x, y)};
        }

        case XgaActionKind::TRIPLE_CLICK: {
            auto [x, y] = coordsOrLast(action, state);
            return {CommandBuilder::tripleClick(x, y)};
        }

        case XgaActionKind::RIGHT_CLICK: {
            auto [x, y] = coordsOrLast(action, state);
            return {CommandBuilder::rightClick(x, y)};
        }

        case XgaActionKind::MIDDLE_CLICK: {
            auto [x, y] = coordsOrLast(action, state);
            return {CommandBuilder::middleClick(x, y)};
        }

        case XgaActionKind::LEFT_CLICK_DRAG: {
            auto start = action.startCoordinate
                ? scalePoint(action.startCoordinate->first, action.startCoordinate->second)
                : lastOrCenter(state);
            if (!action.coordinate) {
                throw FormatError("coordinate (end position) is required for left_click_drag", name());
            }
            auto end = scalePoint(action.coordinate->first, action.coordinate->second);
            state.cursor = end;
            return {
                CommandBuilder::moveTo(start.first, start.second),
                CommandBuilder::dragTo(end.first, end.second, m_config.dragDuration)
            };
        }

        case XgaActionKind::TYPE:
            if (!action.text) {
                throw FormatError("text is required for type action", name());
            }
            return {CommandBuilder::typeText(*action.text)};

        case XgaActionKind::KEY: {
            if (!action.text) {
                throw FormatError("text is required for key action", name());
            }
            auto keys = parseKeyText(*action.text);
            if (keys.empty()) {
                throw FormatError("Invalid key combination: " + *action.text, name());
            }
            return {CommandBuilder::hotkey(keys, m_config.hotkeyInterval)};
        }

        case XgaActionKind::SCROLL: {
            if (!action.coordinate) {
                throw FormatError("coordinate is required for scroll action", name());
            }
            auto [x, y] = scalePoint(action.coordinate->first, action.coordinate->second);

            std::string direction = StringUtils::toLowerCase(
                StringUtils::trim(action.scrollDirection.value_or("down")));
            int amount = action.scrollAmount.value_or(m_config.scrollAmount);

            int value = 0;
            if (direction == "up") {
                value = amount;
            } else if (direction == "down") {
                value = -amount;
            } else {
                throw FormatError("Invalid scroll direction: " + direction, name());
            }
            return {CommandBuilder::moveTo(x, y), CommandBuilder::scroll(value)};
        }

        case XgaActionKind::WAIT:
            return {CommandBuilder::wait(action.duration.value_or(m_config.waitDuration))};

        case XgaActionKind::FINISH:
            SLOG_INFO().message("Task completion action -> DONE").component(name());
            return {CommandBuilder::done()};
    }

    throw UnknownActionError("Unhandled XGA action type: '" + action.actionType + "'", name());
}

} // namespace marionette
