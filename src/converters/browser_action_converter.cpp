#include "browser_action_converter.h"
#include "command_builder.h"
#include "../keys/key_normalizer.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"

namespace marionette {

using utils::StringUtils;

BrowserActionConverter::BrowserActionConverter(const ConverterConfig& config)
    : ActionConverter<BrowserAction>(COORD_SIZE, COORD_SIZE, config) {}

std::string BrowserActionConverter::describe(const BrowserAction& action) const {
    return utils::JsonUtils::safeDump(action.toJson());
}

std::pair<int, int> BrowserActionConverter::requirePoint(const BrowserAction& action,
                                                         const std::string& verb) const {
    if (!action.x || !action.y) {
        throw FormatError("x and y are required for " + verb, name());
    }
    return scalePoint(*action.x, *action.y);
}

std::vector<std::string> BrowserActionConverter::convertSingle(const BrowserAction& action,
                                                               SessionState& state) {
    auto kind = action.kind();
    if (!kind) {
        throw UnknownActionError("Unknown browser action type: '" + action.actionType + "'", name());
    }

    const double interval = m_config.hotkeyInterval;

    switch (*kind) {
        case BrowserActionKind::OPEN_WEB_BROWSER:
            return {};

        case BrowserActionKind::CLICK_AT: {
            auto [x, y] = requirePoint(action, "click_at");
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::click(x, y)};
        }

        case BrowserActionKind::HOVER_AT: {
            auto [x, y] = requirePoint(action, "hover_at");
            state.cursor = std::make_pair(x, y);
            return {CommandBuilder::moveTo(x, y)};
        }

        case BrowserActionKind::TYPE_TEXT_AT: {
            auto [x, y] = requirePoint(action, "type_text_at");
            if (!action.text) {
                throw FormatError("text is required for type_text_at", name());
            }
            state.cursor = std::make_pair(x, y);

            std::vector<std::string> commands = {CommandBuilder::click(x, y)};
            if (action.clearBeforeTyping.value_or(false)) {
                commands.push_back(CommandBuilder::hotkey({"ctrl", "a"}, interval));
                commands.push_back(CommandBuilder::press("delete"));
            }
            commands.push_back(CommandBuilder::typeText(*action.text));
            if (action.pressEnter.value_or(false)) {
                commands.push_back(CommandBuilder::press("enter"));
            }
            return commands;
        }

        case BrowserActionKind::SCROLL_DOCUMENT: {
            std::string direction = StringUtils::toLowerCase(StringUtils::trim(action.direction.value_or("down")));
            if (direction == "down") return {CommandBuilder::press("pagedown")};
            if (direction == "up") return {CommandBuilder::press("pageup")};
            if (direction == "left") return {CommandBuilder::press("left")};
            if (direction == "right") return {CommandBuilder::press("right")};
            throw FormatError("Invalid scroll direction: " + direction, name());
        }

        case BrowserActionKind::SCROLL_AT: {
            auto [x, y] = requirePoint(action, "scroll_at");
            std::string direction = StringUtils::toLowerCase(StringUtils::trim(action.direction.value_or("down")));

            int amount = m_config.scrollAmount;
            if (action.magnitude) {
                amount = std::max(1, *action.magnitude / 100);
            }

            int value = -amount;
            if (direction == "up") {
                value = amount;
            } else if (direction != "down") {
                SLOG_DEBUG().message("Unsupported scroll direction, defaulting to down")
                    .component(name())
                    .context("direction", direction);
            }
            return {CommandBuilder::moveTo(x, y), CommandBuilder::scroll(value)};
        }

        case BrowserActionKind::WAIT_5_SECONDS:
            return {CommandBuilder::waitWholeSeconds(5)};

        case BrowserActionKind::GO_BACK:
            return {CommandBuilder::hotkey({"alt", "left"}, interval)};

        case BrowserActionKind::GO_FORWARD:
            return {CommandBuilder::hotkey({"alt", "right"}, interval)};

        case BrowserActionKind::SEARCH:
            return {
                CommandBuilder::hotkey({"ctrl", "l"}, interval),
                CommandBuilder::typeText(SEARCH_URL),
                CommandBuilder::press("enter")
            };

        case BrowserActionKind::NAVIGATE: {
            if (!action.url) {
                throw FormatError("url is required for navigate action", name());
            }
            std::string url = *action.url;
            if (!StringUtils::startsWith(url, "http://") && !StringUtils::startsWith(url, "https://")) {
                url = "https://" + url;
            }
            return {
                CommandBuilder::hotkey({"ctrl", "l"}, interval),
                CommandBuilder::hotkey({"ctrl", "a"}, interval),
                CommandBuilder::typeText(url),
                CommandBuilder::press("enter")
            };
        }

        case BrowserActionKind::KEY_COMBINATION: {
            if (!action.keys) {
                throw FormatError("keys is required for key_combination action", name());
            }
            std::vector<std::string> keys;
            for (const auto& part : StringUtils::split(StringUtils::replaceAll(*action.keys, "-", "+"), "+")) {
                if (StringUtils::isWhitespaceOnly(part)) continue;
                std::string key = KeyNormalizer::normalize(part);
                if (!key.empty()) {
                    keys.push_back(key);
                }
            }
            if (keys.empty()) {
                throw FormatError("Invalid key combination: " + *action.keys, name());
            }
            return {CommandBuilder::hotkey(keys, interval)};
        }

        case BrowserActionKind::DRAG_AND_DROP: {
            if (!action.x || !action.y) {
                throw FormatError("x and y (start position) are required for drag_and_drop", name());
            }
            if (!action.destinationX || !action.destinationY) {
                throw FormatError("destination_x and destination_y are required for drag_and_drop", name());
            }
            auto start = scalePoint(*action.x, *action.y);
            auto end = scalePoint(*action.destinationX, *action.destinationY);
            state.cursor = end;
            return {
                CommandBuilder::moveTo(start.first, start.second),
                CommandBuilder::dragTo(end.first, end.second, m_config.dragDuration)
            };
        }
    }

    throw UnknownActionError("Unhandled browser action type: '" + action.actionType + "'", name());
}

} // namespace marionette
