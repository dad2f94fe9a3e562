#include "dialect_actions.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/json_utils.h"
#include <map>

namespace marionette {

using utils::StringUtils;

namespace {
    template <typename Kind>
    std::optional<Kind> lookupKind(const std::map<std::string, Kind>& table, const std::string& name) {
        auto it = table.find(StringUtils::toLowerCase(StringUtils::trim(name)));
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    template <typename Kind>
    std::string kindName(const std::map<std::string, Kind>& table, Kind kind) {
        for (const auto& [name, value] : table) {
            if (value == kind) {
                return name;
            }
        }
        return "unknown";
    }

    const std::map<std::string, XgaActionKind>& xgaTable() {
        static const std::map<std::string, XgaActionKind> table = {
            {"screenshot", XgaActionKind::SCREENSHOT},
            {"cursor_position", XgaActionKind::CURSOR_POSITION},
            {"mouse_move", XgaActionKind::MOUSE_MOVE},
            {"left_click", XgaActionKind::LEFT_CLICK},
            {"double_click", XgaActionKind::DOUBLE_CLICK},
            {"triple_click", XgaActionKind::TRIPLE_CLICK},
            {"right_click", XgaActionKind::RIGHT_CLICK},
            {"middle_click", XgaActionKind::MIDDLE_CLICK},
            {"left_click_drag", XgaActionKind::LEFT_CLICK_DRAG},
            {"type", XgaActionKind::TYPE},
            {"key", XgaActionKind::KEY},
            {"scroll", XgaActionKind::SCROLL},
            {"wait", XgaActionKind::WAIT},
            {"finish", XgaActionKind::FINISH}
        };
        return table;
    }

    const std::map<std::string, BrowserActionKind>& browserTable() {
        static const std::map<std::string, BrowserActionKind> table = {
            {"open_web_browser", BrowserActionKind::OPEN_WEB_BROWSER},
            {"click_at", BrowserActionKind::CLICK_AT},
            {"hover_at", BrowserActionKind::HOVER_AT},
            {"type_text_at", BrowserActionKind::TYPE_TEXT_AT},
            {"scroll_document", BrowserActionKind::SCROLL_DOCUMENT},
            {"scroll_at", BrowserActionKind::SCROLL_AT},
            {"wait_5_seconds", BrowserActionKind::WAIT_5_SECONDS},
            {"go_back", BrowserActionKind::GO_BACK},
            {"go_forward", BrowserActionKind::GO_FORWARD},
            {"search", BrowserActionKind::SEARCH},
            {"navigate", BrowserActionKind::NAVIGATE},
            {"key_combination", BrowserActionKind::KEY_COMBINATION},
            {"drag_and_drop", BrowserActionKind::DRAG_AND_DROP}
        };
        return table;
    }

    const std::map<std::string, CursorActionKind>& cursorTable() {
        static const std::map<std::string, CursorActionKind> table = {
            {"mouse_move", CursorActionKind::MOUSE_MOVE},
            {"left_click", CursorActionKind::LEFT_CLICK},
            {"double_click", CursorActionKind::DOUBLE_CLICK},
            {"triple_click", CursorActionKind::TRIPLE_CLICK},
            {"right_click", CursorActionKind::RIGHT_CLICK},
            {"middle_click", CursorActionKind::MIDDLE_CLICK},
            {"left_click_drag", CursorActionKind::LEFT_CLICK_DRAG},
            {"type", CursorActionKind::TYPE},
            {"key", CursorActionKind::KEY},
            {"scroll", CursorActionKind::SCROLL},
            {"hscroll", CursorActionKind::HSCROLL},
            {"wait", CursorActionKind::WAIT},
            {"terminate", CursorActionKind::TERMINATE},
            {"answer", CursorActionKind::ANSWER}
        };
        return table;
    }

    // Field readers: absent or null gives nullopt, a value of the wrong shape is a FormatError

    bool isAbsent(const nlohmann::json& json, const std::string& key) {
        return !json.contains(key) || json[key].is_null();
    }

    FormatError fieldError(const nlohmann::json& json, const std::string& key, const std::string& expected) {
        return FormatError("Field '" + key + "' must be " + expected, utils::JsonUtils::safeDump(json));
    }

    std::optional<std::string> readString(const nlohmann::json& json, const std::string& key) {
        if (isAbsent(json, key)) return std::nullopt;
        if (!json[key].is_string()) throw fieldError(json, key, "a string");
        return json[key].get<std::string>();
    }

    std::optional<int> readInt(const nlohmann::json& json, const std::string& key) {
        if (isAbsent(json, key)) return std::nullopt;
        if (!json[key].is_number()) throw fieldError(json, key, "a number");
        return StringUtils::saturateToInt(json[key].get<double>());
    }

    std::optional<double> readDouble(const nlohmann::json& json, const std::string& key) {
        if (isAbsent(json, key)) return std::nullopt;
        if (!json[key].is_number()) throw fieldError(json, key, "a number");
        return json[key].get<double>();
    }

    std::optional<bool> readBool(const nlohmann::json& json, const std::string& key) {
        if (isAbsent(json, key)) return std::nullopt;
        if (!json[key].is_boolean()) throw fieldError(json, key, "a boolean");
        return json[key].get<bool>();
    }

    std::optional<Coordinate> readCoordinate(const nlohmann::json& json, const std::string& key) {
        if (isAbsent(json, key)) return std::nullopt;
        const auto& value = json[key];
        if (!value.is_array() || value.size() < 2 || !value[0].is_number() || !value[1].is_number()) {
            throw fieldError(json, key, "an [x, y] pair of numbers");
        }
        return Coordinate(StringUtils::saturateToInt(value[0].get<double>()),
                          StringUtils::saturateToInt(value[1].get<double>()));
    }

    std::optional<std::vector<std::string>> readStringList(const nlohmann::json& json, const std::string& key) {
        if (isAbsent(json, key)) return std::nullopt;
        const auto& value = json[key];
        if (!value.is_array()) throw fieldError(json, key, "an array of strings");
        std::vector<std::string> items;
        for (const auto& item : value) {
            if (!item.is_string()) throw fieldError(json, key, "an array of strings");
            items.push_back(item.get<std::string>());
        }
        return items;
    }

    std::string readType(const nlohmann::json& json) {
        if (!json.is_object()) {
            throw FormatError("Dialect action record must be a JSON object", utils::JsonUtils::safeDump(json));
        }
        auto type = readString(json, "type");
        if (!type) {
            throw FormatError("Dialect action record is missing its 'type'", utils::JsonUtils::safeDump(json));
        }
        return *type;
    }

    template <typename T>
    nlohmann::json orNull(const std::optional<T>& value) {
        if (!value) return nullptr;
        return nlohmann::json(*value);
    }

    nlohmann::json coordinateOrNull(const std::optional<Coordinate>& value) {
        if (!value) return nullptr;
        return nlohmann::json::array({value->first, value->second});
    }
}

std::optional<XgaActionKind> xgaActionKindFromString(const std::string& name) {
    return lookupKind(xgaTable(), name);
}

std::string xgaActionKindToString(XgaActionKind kind) {
    return kindName(xgaTable(), kind);
}

std::optional<BrowserActionKind> browserActionKindFromString(const std::string& name) {
    return lookupKind(browserTable(), name);
}

std::string browserActionKindToString(BrowserActionKind kind) {
    return kindName(browserTable(), kind);
}

std::optional<CursorActionKind> cursorActionKindFromString(const std::string& name) {
    return lookupKind(cursorTable(), name);
}

std::string cursorActionKindToString(CursorActionKind kind) {
    return kindName(cursorTable(), kind);
}

// XgaAction

std::optional<XgaActionKind> XgaAction::kind() const {
    return xgaActionKindFromString(actionType);
}

nlohmann::json XgaAction::toJson() const {
    nlohmann::json json;
    json["type"] = actionType;
    json["coordinate"] = coordinateOrNull(coordinate);
    json["start_coordinate"] = coordinateOrNull(startCoordinate);
    json["text"] = orNull(text);
    json["scroll_direction"] = orNull(scrollDirection);
    json["scroll_amount"] = orNull(scrollAmount);
    json["duration"] = orNull(duration);
    return json;
}

XgaAction XgaAction::fromJson(const nlohmann::json& json) {
    XgaAction action(readType(json));
    action.coordinate = readCoordinate(json, "coordinate");
    action.startCoordinate = readCoordinate(json, "start_coordinate");
    action.text = readString(json, "text");
    action.scrollDirection = readString(json, "scroll_direction");
    action.scrollAmount = readInt(json, "scroll_amount");
    action.duration = readDouble(json, "duration");
    return action;
}

// BrowserAction

std::optional<BrowserActionKind> BrowserAction::kind() const {
    return browserActionKindFromString(actionType);
}

nlohmann::json BrowserAction::toJson() const {
    nlohmann::json json;
    json["type"] = actionType;
    json["x"] = orNull(x);
    json["y"] = orNull(y);
    json["text"] = orNull(text);
    json["press_enter"] = orNull(pressEnter);
    json["clear_before_typing"] = orNull(clearBeforeTyping);
    json["direction"] = orNull(direction);
    json["magnitude"] = orNull(magnitude);
    json["destination_x"] = orNull(destinationX);
    json["destination_y"] = orNull(destinationY);
    json["keys"] = orNull(keys);
    json["url"] = orNull(url);
    return json;
}

BrowserAction BrowserAction::fromJson(const nlohmann::json& json) {
    BrowserAction action(readType(json));
    action.x = readInt(json, "x");
    action.y = readInt(json, "y");
    action.text = readString(json, "text");
    action.pressEnter = readBool(json, "press_enter");
    action.clearBeforeTyping = readBool(json, "clear_before_typing");
    action.direction = readString(json, "direction");
    action.magnitude = readInt(json, "magnitude");
    action.destinationX = readInt(json, "destination_x");
    action.destinationY = readInt(json, "destination_y");
    action.keys = readString(json, "keys");
    action.url = readString(json, "url");
    return action;
}

// CursorAction

std::optional<CursorActionKind> CursorAction::kind() const {
    return cursorActionKindFromString(actionType);
}

nlohmann::json CursorAction::toJson() const {
    nlohmann::json json;
    json["type"] = actionType;
    json["coordinate"] = coordinateOrNull(coordinate);
    json["text"] = orNull(text);
    json["keys"] = orNull(keys);
    json["pixels"] = orNull(pixels);
    json["time"] = orNull(time);
    json["status"] = orNull(status);
    return json;
}

CursorAction CursorAction::fromJson(const nlohmann::json& json) {
    CursorAction action(readType(json));
    action.coordinate = readCoordinate(json, "coordinate");
    action.text = readString(json, "text");
    action.keys = readStringList(json, "keys");
    action.pixels = readInt(json, "pixels");
    action.time = readDouble(json, "time");
    action.status = readString(json, "status");
    return action;
}

} // namespace marionette
