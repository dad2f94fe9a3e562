#ifndef MARIONETTE_ACTION_H
#define MARIONETTE_ACTION_H

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace marionette {

// Native action vocabulary produced by the output parser
enum class ActionType {
    CLICK,
    LEFT_DOUBLE,
    LEFT_TRIPLE,
    RIGHT_SINGLE,
    DRAG,
    MOUSE_MOVE,
    LEFT_CLICK_DRAG,
    PRESS_CLICK,    // keys held down around a click
    HOTKEY,
    TYPE,
    SCROLL,
    WAIT,
    FINISH,         // terminal
    FAIL,           // terminal
    CALL_USER
};

std::string actionTypeToString(ActionType type);

/**
 * @brief Look up an action type by its wire name ("click", "left_double", ...)
 * @return The type, or std::nullopt for an unknown name
 */
std::optional<ActionType> actionTypeFromString(const std::string& name);

bool isTerminal(ActionType type);

// Upper bound on how many times one action may repeat
constexpr int MAX_REPEAT_COUNT = 1000000;

// Clamp a requested repeat count into [1, MAX_REPEAT_COUNT]
int clampRepeatCount(long long count);

// One parsed instruction. argument is positional text, e.g. "500, 300"
struct Action {
    ActionType type;
    std::string argument;
    int count;

    Action() : type(ActionType::WAIT), count(1) {}
    Action(ActionType t, std::string arg, int c = 1)
        : type(t), argument(std::move(arg)), count(c < 1 ? 1 : c) {}

    nlohmann::json toJson() const;

    /**
     * @brief Decode {"type", "argument", "count"}
     * @throws UnknownActionError for an unknown type, FormatError for a malformed record
     */
    static Action fromJson(const nlohmann::json& json);

    bool operator==(const Action& other) const {
        return type == other.type && argument == other.argument && count == other.count;
    }
    bool operator!=(const Action& other) const { return !(*this == other); }
};

// Parsed model turn
struct Step {
    std::string reason;
    std::vector<Action> actions;
    bool stop;

    Step() : stop(false) {}

    nlohmann::json toJson() const;
};

// True when any action in the list is terminal
bool containsTerminal(const std::vector<Action>& actions);

} // namespace marionette

#endif // MARIONETTE_ACTION_H
