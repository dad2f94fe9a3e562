#include "action.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include <algorithm>
#include <map>

namespace marionette {

namespace {
    const std::map<std::string, ActionType>& nameTable() {
        static const std::map<std::string, ActionType> table = {
            {"click", ActionType::CLICK},
            {"left_double", ActionType::LEFT_DOUBLE},
            {"left_triple", ActionType::LEFT_TRIPLE},
            {"right_single", ActionType::RIGHT_SINGLE},
            {"drag", ActionType::DRAG},
            {"mouse_move", ActionType::MOUSE_MOVE},
            {"left_click_drag", ActionType::LEFT_CLICK_DRAG},
            {"press_click", ActionType::PRESS_CLICK},
            {"hotkey", ActionType::HOTKEY},
            {"type", ActionType::TYPE},
            {"scroll", ActionType::SCROLL},
            {"wait", ActionType::WAIT},
            {"finish", ActionType::FINISH},
            {"fail", ActionType::FAIL},
            {"call_user", ActionType::CALL_USER}
        };
        return table;
    }
}

std::string actionTypeToString(ActionType type) {
    for (const auto& [name, value] : nameTable()) {
        if (value == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ActionType> actionTypeFromString(const std::string& name) {
    auto it = nameTable().find(name);
    if (it == nameTable().end()) {
        return std::nullopt;
    }
    return it->second;
}

int clampRepeatCount(long long count) {
    if (count < 1) {
        return 1;
    }
    return static_cast<int>(std::min<long long>(count, MAX_REPEAT_COUNT));
}

bool isTerminal(ActionType type) {
    return type == ActionType::FINISH || type == ActionType::FAIL;
}

nlohmann::json Action::toJson() const {
    return nlohmann::json{
        {"type", actionTypeToString(type)},
        {"argument", argument},
        {"count", count}
    };
}

Action Action::fromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        throw FormatError("Action record must be an object with a string 'type'", utils::JsonUtils::safeDump(json));
    }

    std::string name = json["type"].get<std::string>();
    auto type = actionTypeFromString(name);
    if (!type) {
        throw UnknownActionError("Unknown action type: '" + name + "'", utils::JsonUtils::safeDump(json));
    }

    std::string argument;
    if (json.contains("argument") && json["argument"].is_string()) {
        argument = json["argument"].get<std::string>();
    }

    int count = 1;
    if (json.contains("count")) {
        const auto& value = json["count"];
        if (value.is_number_integer()) {
            count = clampRepeatCount(value.get<long long>());
        } else if (value.is_number_float()) {
            count = clampRepeatCount(utils::StringUtils::saturateToInt(value.get<double>()));
        }
    }

    return Action(*type, argument, count);
}

nlohmann::json Step::toJson() const {
    nlohmann::json actionsJson = nlohmann::json::array();
    for (const auto& action : actions) {
        actionsJson.push_back(action.toJson());
    }
    return nlohmann::json{
        {"reason", reason},
        {"actions", actionsJson},
        {"stop", stop}
    };
}

bool containsTerminal(const std::vector<Action>& actions) {
    return std::any_of(actions.begin(), actions.end(),
                       [](const Action& a) { return isTerminal(a.type); });
}

} // namespace marionette
