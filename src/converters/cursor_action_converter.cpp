#include "cursor_action_converter.h"
#include "command_builder.h"
#include "../keys/key_normalizer.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"

namespace marionette {

using utils::StringUtils;

CursorActionConverter::CursorActionConverter(const ConverterConfig& config)
    : ActionConverter<CursorAction>(COORD_SIZE, COORD_SIZE, config) {}

bool CursorActionConverter::isTerminalAction(const CursorAction& action) const {
    auto kind = action.kind();
    return kind && *kind == CursorActionKind::TERMINATE;
}

std::string CursorActionConverter::describe(const CursorAction& action) const {
    return utils::JsonUtils::safeDump(action.toJson());
}

std::pair<int, int> CursorActionConverter::coordsOrCursor(const CursorAction& action, SessionState& state) const {
    if (action.coordinate) {
        auto point = scalePoint(action.coordinate->first, action.coordinate->second);
        state.cursor = point;
        return point;
    }
    return lastOrCenter(state);
}

std::vector<std::string> CursorActionConverter::convertSingle(const CursorAction& action, SessionState& state) {
    auto kind = action.kind();
    if (!kind) {
        throw UnknownActionError("Unknown cursor action type: '" + action.actionType + "'", name());
    }

    switch (*kind) {
        case CursorActionKind::MOUSE_MOVE: {
            auto [x, y] = coordsOrCursor(action, state);
            return {CommandBuilder::moveTo(x, y)};
        }

        case CursorActionKind::LEFT_CLICK: {
            auto [x, y] = coordsOrCursor(action, state);
            return {CommandBuilder::click(x, y)};
        }

        case CursorActionKind::DOUBLE_CLICK: {
            auto [x, y] = coordsOrCursor(action, state);
            return {CommandBuilder::doubleClick(x, y)};
        }

        case CursorActionKind::TRIPLE_CLICK: {
            auto [x, y] = coordsOrCursor(action, state);
            return {CommandBuilder::tripleClick(x, y)};
        }

        case CursorActionKind::RIGHT_CLICK: {
            auto [x, y] = coordsOrCursor(action, state);
            return {CommandBuilder::rightClick(x, y)};
        }

        case CursorActionKind::MIDDLE_CLICK: {
            auto [x, y] = coordsOrCursor(action, state);
            return {CommandBuilder::middleClick(x, y)};
        }

        case CursorActionKind::LEFT_CLICK_DRAG: {
            auto start = lastOrCenter(state);
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

        case CursorActionKind::TYPE:
            if (!action.text) {
                throw FormatError("text is required for type action", name());
            }
            return {CommandBuilder::typeText(*action.text)};

        case CursorActionKind::KEY: {
            if (!action.keys || action.keys->empty()) {
                throw FormatError("keys array is required for key action", name());
            }
            std::vector<std::string> keys;
            for (const auto& raw : *action.keys) {
                std::string key = KeyNormalizer::normalize(raw);
                if (!key.empty()) {
                    keys.push_back(key);
                }
            }
            if (keys.empty()) {
                throw FormatError("Invalid key combination: [" + StringUtils::join(*action.keys, ", ") + "]", name());
            }
            return {CommandBuilder::hotkey(keys, m_config.hotkeyInterval)};
        }

        // Horizontal scroll has no separate primitive downstream
        case CursorActionKind::SCROLL:
        case CursorActionKind::HSCROLL: {
            auto [x, y] = coordsOrCursor(action, state);
            int value = action.pixels.value_or(0) >= 0 ? m_config.scrollAmount : -m_config.scrollAmount;
            return {CommandBuilder::moveTo(x, y), CommandBuilder::scroll(value)};
        }

        case CursorActionKind::WAIT:
            return {CommandBuilder::wait(action.time.value_or(m_config.waitDuration))};

        case CursorActionKind::TERMINATE: {
            std::string status = StringUtils::toLowerCase(action.status.value_or("success"));
            SLOG_INFO().message("Task terminated")
                .component(name())
                .context("status", status);
            if (status == "failure") {
                return {CommandBuilder::fail()};
            }
            return {CommandBuilder::done()};
        }

        case CursorActionKind::ANSWER:
            SLOG_INFO().message("Model answer")
                .component(name())
                .context("answer", action.text.value_or(""));
            return {};
    }

    throw UnknownActionError("Unhandled cursor action type: '" + action.actionType + "'", name());
}

} // namespace marionette
