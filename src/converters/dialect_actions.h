#ifndef MARIONETTE_DIALECT_ACTIONS_H
#define MARIONETTE_DIALECT_ACTIONS_H

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <nlohmann/json.hpp>

namespace marionette {

using Coordinate = std::pair<int, int>;

// ---------------------------------------------------------------------------
// XGA dialect (1024x768 pixel space)
// ---------------------------------------------------------------------------

enum class XgaActionKind {
    SCREENSHOT,
    CURSOR_POSITION,
    MOUSE_MOVE,
    LEFT_CLICK,
    DOUBLE_CLICK,
    TRIPLE_CLICK,
    RIGHT_CLICK,
    MIDDLE_CLICK,
    LEFT_CLICK_DRAG,
    TYPE,
    KEY,
    SCROLL,
    WAIT,
    FINISH
};

std::optional<XgaActionKind> xgaActionKindFromString(const std::string& name);
std::string xgaActionKindToString(XgaActionKind kind);

struct XgaAction {
    std::string actionType;
    std::optional<Coordinate> coordinate;
    std::optional<Coordinate> startCoordinate;
    std::optional<std::string> text;
    std::optional<std::string> scrollDirection;
    std::optional<int> scrollAmount;
    std::optional<double> duration;   // seconds

    XgaAction() = default;
    explicit XgaAction(std::string type) : actionType(std::move(type)) {}

    // Kind for actionType, case-insensitive; nullopt when unknown
    std::optional<XgaActionKind> kind() const;

    nlohmann::json toJson() const;
    static XgaAction fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// Browser dialect (0-1000 normalized space)
// ---------------------------------------------------------------------------

enum class BrowserActionKind {
    OPEN_WEB_BROWSER,
    CLICK_AT,
    HOVER_AT,
    TYPE_TEXT_AT,
    SCROLL_DOCUMENT,
    SCROLL_AT,
    WAIT_5_SECONDS,
    GO_BACK,
    GO_FORWARD,
    SEARCH,
    NAVIGATE,
    KEY_COMBINATION,
    DRAG_AND_DROP
};

std::optional<BrowserActionKind> browserActionKindFromString(const std::string& name);
std::string browserActionKindToString(BrowserActionKind kind);

struct BrowserAction {
    std::string actionType;
    std::optional<int> x;
    std::optional<int> y;
    std::optional<std::string> text;
    std::optional<bool> pressEnter;
    std::optional<bool> clearBeforeTyping;
    std::optional<std::string> direction;
    std::optional<int> magnitude;     // pixels
    std::optional<int> destinationX;
    std::optional<int> destinationY;
    std::optional<std::string> keys;  // "ctrl+c" or "ctrl-c"
    std::optional<std::string> url;

    BrowserAction() = default;
    explicit BrowserAction(std::string type) : actionType(std::move(type)) {}

    std::optional<BrowserActionKind> kind() const;

    nlohmann::json toJson() const;
    static BrowserAction fromJson(const nlohmann::json& json);
};

// ---------------------------------------------------------------------------
// Cursor dialect (0-999 normalized space)
// ---------------------------------------------------------------------------

enum class CursorActionKind {
    MOUSE_MOVE,
    LEFT_CLICK,
    DOUBLE_CLICK,
    TRIPLE_CLICK,
    RIGHT_CLICK,
    MIDDLE_CLICK,
    LEFT_CLICK_DRAG,
    TYPE,
    KEY,
    SCROLL,
    HSCROLL,
    WAIT,
    TERMINATE,
    ANSWER
};

std::optional<CursorActionKind> cursorActionKindFromString(const std::string& name);
std::string cursorActionKindToString(CursorActionKind kind);

struct CursorAction {
    std::string actionType;
    std::optional<Coordinate> coordinate;
    std::optional<std::string> text;
    std::optional<std::vector<std::string>> keys;
    std::optional<int> pixels;
    std::optional<double> time;       // seconds
    std::optional<std::string> status; // "success" or "failure"

    CursorAction() = default;
    explicit CursorAction(std::string type) : actionType(std::move(type)) {}

    std::optional<CursorActionKind> kind() const;

    nlohmann::json toJson() const;
    static CursorAction fromJson(const nlohmann::json& json);
};

} // namespace marionette

#endif // MARIONETTE_DIALECT_ACTIONS_H
