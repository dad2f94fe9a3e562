#include "output_parser.h"
#include "../common/structured_logger.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace marionette {

using utils::StringUtils;

namespace {
    const std::string THINK_START = "<|think_start|>";
    const std::string ACTION_START = "<|action_start|>";

    // Text form of a JSON scalar as the model meant it
    std::string scalarText(const nlohmann::json& value) {
        if (value.is_string()) return value.get<std::string>();
        if (value.is_number_integer()) return std::to_string(value.get<long long>());
        if (value.is_number_float()) return StringUtils::formatDecimal(value.get<double>());
        if (value.is_boolean()) return value.get<bool>() ? "True" : "False";
        if (value.is_null()) return "None";
        return utils::JsonUtils::safeDump(value);
    }

    const nlohmann::json* field(const nlohmann::json& object, const char* name) {
        auto it = object.find(name);
        return it == object.end() ? nullptr : &(*it);
    }

    int coercePositiveInt(const nlohmann::json* value, int defaultValue) {
        if (value == nullptr) return defaultValue;

        long long parsed = 0;
        if (value->is_boolean()) {
            parsed = value->get<bool>() ? 1 : 0;
        } else if (value->is_number_integer()) {
            parsed = value->get<long long>();
        } else if (value->is_number_float()) {
            double d = value->get<double>();
            if (!std::isfinite(d)) return defaultValue;
            parsed = StringUtils::saturateToInt(d);
        } else if (value->is_string()) {
            if (!StringUtils::tryParseInt(value->get<std::string>(), parsed)) return defaultValue;
        } else {
            return defaultValue;
        }
        return clampRepeatCount(parsed);
    }

    double coerceFloat(const nlohmann::json* value, double defaultValue) {
        if (value == nullptr) return defaultValue;
        if (value->is_boolean()) return value->get<bool>() ? 1.0 : 0.0;
        if (value->is_number()) return value->get<double>();
        if (value->is_string()) {
            double parsed = 0.0;
            if (StringUtils::tryParseDouble(value->get<std::string>(), parsed)) return parsed;
        }
        return defaultValue;
    }

    bool coordinateComponent(const nlohmann::json& value, int& out) {
        double d = 0.0;
        if (value.is_boolean()) {
            d = value.get<bool>() ? 1.0 : 0.0;
        } else if (value.is_number()) {
            d = value.get<double>();
        } else if (value.is_string()) {
            if (!StringUtils::tryParseDouble(value.get<std::string>(), d)) return false;
        } else {
            return false;
        }
        if (!std::isfinite(d)) return false;
        out = StringUtils::saturateToInt(d);
        return true;
    }

    std::optional<std::pair<int, int>> extractCoords(const nlohmann::json* value) {
        if (value == nullptr || !value->is_array() || value->size() < 2) {
            return std::nullopt;
        }
        int x = 0;
        int y = 0;
        if (!coordinateComponent((*value)[0], x) || !coordinateComponent((*value)[1], y)) {
            return std::nullopt;
        }
        return std::make_pair(x, y);
    }

    std::vector<std::string> extractKeys(const nlohmann::json* value) {
        std::vector<std::string> keys;
        if (value == nullptr) return keys;

        if (value->is_array()) {
            for (const auto& item : *value) {
                std::string key = StringUtils::trim(scalarText(item));
                if (!key.empty()) keys.push_back(key);
            }
        } else if (value->is_string()) {
            for (const auto& part : StringUtils::splitAny(value->get<std::string>(), "+,")) {
                std::string key = StringUtils::trim(part);
                if (!key.empty()) keys.push_back(key);
            }
        }
        return keys;
    }

    std::string coordinateArgument(const std::pair<int, int>& coords) {
        return std::to_string(coords.first) + ", " + std::to_string(coords.second);
    }

    // A negative signed count scrolls down when no direction is given
    std::pair<std::string, int> scrollDirectionAndCount(const nlohmann::json& arguments) {
        const nlohmann::json* directionField = field(arguments, "direction");
        std::string direction = directionField
            ? StringUtils::toLowerCase(StringUtils::trim(scalarText(*directionField)))
            : "";

        long long signedCount = 1;
        const nlohmann::json* countField = field(arguments, "count");
        if (countField != nullptr) {
            if (countField->is_boolean()) {
                signedCount = countField->get<bool>() ? 1 : 0;
            } else if (countField->is_number_integer()) {
                signedCount = countField->get<long long>();
            } else if (countField->is_number_float() && std::isfinite(countField->get<double>())) {
                signedCount = StringUtils::saturateToInt(countField->get<double>());
            }
        }

        if (direction != "up" && direction != "down") {
            direction = signedCount < 0 ? "down" : "up";
        }

        long long magnitude = signedCount;
        if (signedCount < 0) {
            magnitude = signedCount == std::numeric_limits<long long>::min()
                ? std::numeric_limits<long long>::max()
                : -signedCount;
        }
        int count = clampRepeatCount(magnitude);
        return {direction, count};
    }
}

std::string parserModeToString(ParserMode mode) {
    switch (mode) {
        case ParserMode::TAGGED: return "tagged";
        case ParserMode::TOOL_CALL: return "tool-call";
        case ParserMode::AUTO: return "auto";
    }
    return "auto";
}

std::optional<ParserMode> parserModeFromString(const std::string& name) {
    std::string lowered = StringUtils::toLowerCase(StringUtils::trim(name));
    if (lowered == "tagged" || lowered == "legacy") return ParserMode::TAGGED;
    if (lowered == "tool-call" || lowered == "tool_call" || lowered == "qwen3") return ParserMode::TOOL_CALL;
    if (lowered == "auto") return ParserMode::AUTO;
    return std::nullopt;
}

OutputParser::OutputParser()
    : m_thinkPattern(R"(<\|think_start\|>([\s\S]*?)<\|think_end\|>)")
    , m_actionBlockPattern(R"(<\|action_start\|>([\s\S]*?)<\|action_end\|>)")
    , m_toolThinkPattern(R"(<think>([\s\S]*?)</think>)", std::regex_constants::icase)
    , m_toolCallPattern(R"(<tool_call>\s*([\s\S]*?)\s*</tool_call>)", std::regex_constants::icase) {
}

Step OutputParser::parse(const std::string& rawOutput, ParserMode mode) {
    m_statistics.totalParses++;

    switch (mode) {
        case ParserMode::TAGGED:
            return parseTagged(rawOutput);

        case ParserMode::TOOL_CALL: {
            Step step = parseToolCall(rawOutput);
            if (!isProductive(step) && hasTaggedMarkers(rawOutput)) {
                SLOG_DEBUG().message("Tool-call grammar produced nothing, reading tagged markers instead");
                return parseTagged(rawOutput);
            }
            return step;
        }

        case ParserMode::AUTO: {
            if (StringUtils::contains(rawOutput, "<tool_call>")) {
                Step step = parseToolCall(rawOutput);
                if (isProductive(step)) {
                    return step;
                }
            }
            if (hasTaggedMarkers(rawOutput)) {
                return parseTagged(rawOutput);
            }
            Step step = parseToolCall(rawOutput);
            if (isProductive(step)) {
                return step;
            }
            return parseTagged(rawOutput);
        }
    }

    return parseTagged(rawOutput);
}

Step OutputParser::parseTagged(const std::string& rawOutput) {
    m_statistics.taggedParses++;
    Step step;

    std::smatch thinkMatch;
    if (std::regex_search(rawOutput, thinkMatch, m_thinkPattern)) {
        step.reason = StringUtils::trim(thinkMatch[1].str());
    }

    std::smatch actionMatch;
    if (!std::regex_search(rawOutput, actionMatch, m_actionBlockPattern)) {
        return step;
    }

    std::string actionBlock = StringUtils::trim(actionMatch[1].str());
    for (const auto& fragment : splitActions(actionBlock)) {
        auto action = parseAction(StringUtils::trim(fragment));
        if (!action) {
            m_statistics.fragmentsDropped++;
            SLOG_DEBUG().message("Skipping unparseable action fragment").context("fragment", fragment);
            continue;
        }
        m_statistics.actionsParsed++;
        step.actions.push_back(*action);
        if (isTerminal(action->type)) {
            step.stop = true;
        }
    }

    return step;
}

Step OutputParser::parseToolCall(const std::string& rawOutput) {
    m_statistics.toolCallParses++;
    Step step;

    std::smatch thinkMatch;
    if (std::regex_search(rawOutput, thinkMatch, m_toolThinkPattern)) {
        step.reason = StringUtils::trim(thinkMatch[1].str());
    }
    if (step.reason.empty()) {
        step.reason = extractActionSummary(rawOutput);
    }

    auto begin = std::sregex_iterator(rawOutput.begin(), rawOutput.end(), m_toolCallPattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string payloadText = stripCodeFence((*it)[1].str());

        nlohmann::json payload;
        if (!utils::JsonUtils::tryParse(payloadText, payload) || !payload.is_object()) {
            m_statistics.malformedPayloads++;
            SLOG_DEBUG().message("Skipping malformed tool-call payload").context("payload", payloadText);
            continue;
        }

        auto action = parseToolCallPayload(payload);
        if (!action) {
            m_statistics.fragmentsDropped++;
            SLOG_DEBUG().message("Skipping unsupported tool call").context("payload", payloadText);
            continue;
        }
        m_statistics.actionsParsed++;
        step.actions.push_back(*action);
    }

    step.stop = containsTerminal(step.actions);
    return step;
}

std::vector<std::string> OutputParser::splitActions(const std::string& actionBlock) {
    std::vector<std::string> actions;
    std::string current;
    int parenLevel = 0;

    for (char c : actionBlock) {
        if (c == '(') {
            parenLevel++;
            current += c;
        } else if (c == ')') {
            parenLevel--;
            current += c;
        } else if (c == '&' && parenLevel == 0) {
            std::string action = StringUtils::trim(current);
            if (!action.empty()) {
                actions.push_back(action);
            }
            current.clear();
        } else {
            current += c;
        }
    }

    std::string action = StringUtils::trim(current);
    if (!action.empty()) {
        actions.push_back(action);
    }
    return actions;
}

std::optional<Action> OutputParser::parseAction(const std::string& actionText) {
    std::string text = StringUtils::trim(actionText);

    size_t open = text.find('(');
    size_t close = text.rfind(')');
    if (open == std::string::npos || open == 0 || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    std::string name = text.substr(0, open);
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
            return std::nullopt;
        }
    }

    auto type = actionTypeFromString(StringUtils::toLowerCase(name));
    if (!type) {
        return std::nullopt;
    }

    std::string rawArguments = text.substr(open + 1, close - open - 1);
    std::string arguments = (*type == ActionType::TYPE) ? rawArguments : StringUtils::trim(rawArguments);
    int count = 1;

    if (*type == ActionType::HOTKEY) {
        size_t comma = arguments.rfind(',');
        if (comma != std::string::npos) {
            std::string tail = StringUtils::trim(arguments.substr(comma + 1));
            long long parsed = 0;
            if (!tail.empty() && StringUtils::tryParseInt(tail, parsed)) {
                count = clampRepeatCount(parsed);
                arguments = StringUtils::trim(arguments.substr(0, comma));
            }
        }
    } else if (*type == ActionType::SCROLL) {
        auto parts = StringUtils::split(arguments, ",");
        if (parts.size() >= 4) {
            long long parsed = 0;
            if (StringUtils::tryParseInt(parts[3], parsed)) {
                count = clampRepeatCount(parsed);
            }
            arguments = StringUtils::trim(parts[0]) + "," + StringUtils::trim(parts[1]) + "," +
                        StringUtils::trim(parts[2]);
        }
    }

    return Action(*type, arguments, count);
}

std::optional<Action> OutputParser::parseToolCallPayload(const nlohmann::json& toolCall) {
    if (!toolCall.is_object()) {
        return std::nullopt;
    }

    const nlohmann::json* nameField = field(toolCall, "name");
    std::string name = nameField ? StringUtils::trim(scalarText(*nameField)) : "";
    if (!name.empty() && name != "computer_use") {
        return std::nullopt;
    }

    const nlohmann::json* argumentsField = field(toolCall, "arguments");
    if (argumentsField == nullptr) {
        return std::nullopt;
    }

    nlohmann::json arguments = *argumentsField;
    if (arguments.is_string()) {
        nlohmann::json decoded;
        if (!utils::JsonUtils::tryParse(arguments.get<std::string>(), decoded)) {
            return std::nullopt;
        }
        arguments = decoded;
    }
    if (!arguments.is_object()) {
        return std::nullopt;
    }

    const nlohmann::json* actionField = field(arguments, "action");
    std::string actionName = actionField
        ? StringUtils::toLowerCase(StringUtils::trim(scalarText(*actionField)))
        : "";
    if (actionName.empty()) {
        return std::nullopt;
    }

    int count = coercePositiveInt(field(arguments, "count"), 1);

    if (actionName == "key") {
        auto keys = extractKeys(field(arguments, "keys"));
        if (keys.empty()) {
            return std::nullopt;
        }
        return Action(ActionType::HOTKEY, StringUtils::join(keys, "+"), count);
    }

    if (actionName == "type") {
        const nlohmann::json* textField = field(arguments, "text");
        return Action(ActionType::TYPE, textField ? scalarText(*textField) : "", count);
    }

    if (actionName == "mouse_move" || actionName == "left_click_drag") {
        auto coords = extractCoords(field(arguments, "coordinate"));
        if (!coords) {
            return std::nullopt;
        }
        ActionType type = actionName == "mouse_move" ? ActionType::MOUSE_MOVE : ActionType::LEFT_CLICK_DRAG;
        return Action(type, coordinateArgument(*coords), count);
    }

    if (actionName == "left_click" || actionName == "right_click" ||
        actionName == "double_click" || actionName == "triple_click") {
        auto coords = extractCoords(field(arguments, "coordinate"));
        if (!coords) {
            return std::nullopt;
        }
        ActionType type = ActionType::CLICK;
        if (actionName == "right_click") type = ActionType::RIGHT_SINGLE;
        else if (actionName == "double_click") type = ActionType::LEFT_DOUBLE;
        else if (actionName == "triple_click") type = ActionType::LEFT_TRIPLE;
        return Action(type, coordinateArgument(*coords), count);
    }

    if (actionName == "press_click") {
        auto coords = extractCoords(field(arguments, "coordinate"));
        auto keys = extractKeys(field(arguments, "keys"));
        const nlohmann::json* clickField = field(arguments, "click_type");
        std::string clickType = clickField
            ? StringUtils::toLowerCase(StringUtils::trim(scalarText(*clickField)))
            : "";
        if (!coords) {
            return std::nullopt;
        }
        if (clickType != "left_click" && clickType != "right_click" &&
            clickType != "double_click" && clickType != "triple_click") {
            return std::nullopt;
        }

        // Field order is part of the argument text
        nlohmann::ordered_json argument;
        argument["keys"] = keys;
        argument["click_type"] = clickType;
        argument["coordinate"] = {coords->first, coords->second};
        return Action(ActionType::PRESS_CLICK, utils::JsonUtils::safeDump(argument), count);
    }

    if (actionName == "scroll") {
        auto coords = extractCoords(field(arguments, "coordinate"));
        std::pair<int, int> point = coords ? *coords : std::make_pair(500, 500);
        auto [direction, scrollCount] = scrollDirectionAndCount(arguments);
        return Action(ActionType::SCROLL, coordinateArgument(point) + ", " + direction, scrollCount);
    }

    if (actionName == "wait") {
        double seconds = coerceFloat(field(arguments, "time"), 1.0);
        return Action(ActionType::WAIT, StringUtils::formatDecimal(seconds), 1);
    }

    if (actionName == "terminate") {
        const nlohmann::json* statusField = field(arguments, "status");
        std::string status = statusField
            ? StringUtils::toLowerCase(StringUtils::trim(scalarText(*statusField)))
            : "success";
        return Action(status == "failure" ? ActionType::FAIL : ActionType::FINISH, "", 1);
    }

    return std::nullopt;
}

std::string OutputParser::extractActionSummary(const std::string& rawOutput) {
    for (const auto& rawLine : StringUtils::split(rawOutput, "\n")) {
        std::string line = StringUtils::trim(rawLine);
        if (!StringUtils::startsWith(line, "Action")) {
            continue;
        }
        std::string rest = StringUtils::trimLeft(line.substr(6));
        if (rest.empty() || rest[0] != ':') {
            continue;
        }
        std::string summary = StringUtils::trim(rest.substr(1));
        if (!summary.empty()) {
            return summary;
        }
    }
    return "";
}

std::string OutputParser::stripCodeFence(const std::string& text) {
    std::string stripped = StringUtils::trim(text);
    if (!StringUtils::startsWith(stripped, "```")) {
        return stripped;
    }

    stripped = stripped.substr(3);
    if (StringUtils::startsWith(StringUtils::toLowerCase(stripped), "json")) {
        stripped = stripped.substr(4);
    }
    stripped = StringUtils::trimLeft(stripped);

    std::string tail = StringUtils::trimRight(stripped);
    if (StringUtils::endsWith(tail, "```")) {
        stripped = tail.substr(0, tail.size() - 3);
    }
    return StringUtils::trim(stripped);
}

void OutputParser::resetStatistics() {
    m_statistics = ParsingStatistics{};
}

bool OutputParser::hasTaggedMarkers(const std::string& rawOutput) {
    return StringUtils::contains(rawOutput, ACTION_START) || StringUtils::contains(rawOutput, THINK_START);
}

bool OutputParser::isProductive(const Step& step) {
    return !step.actions.empty() || !step.reason.empty();
}

} // namespace marionette
