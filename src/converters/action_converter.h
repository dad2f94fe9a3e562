#ifndef MARIONETTE_ACTION_CONVERTER_H
#define MARIONETTE_ACTION_CONVERTER_H

#include <string>
#include <vector>
#include <utility>
#include <algorithm>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "session_state.h"
#include "../coordinate/coordinate_scaler.h"
#include "../common/types.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace marionette {

// One emitted command; isLast marks the final command of the whole batch
struct ConvertedCommand {
    std::string command;
    bool isLast;

    ConvertedCommand() : isLast(false) {}
    ConvertedCommand(std::string cmd, bool last) : command(std::move(cmd)), isLast(last) {}

    bool operator==(const ConvertedCommand& other) const {
        return command == other.command && isLast == other.isLast;
    }
};

/**
 * @brief Optional capability: drop cursor and capslock state between sessions
 */
class ISessionResettable {
public:
    virtual ~ISessionResettable() = default;
    virtual void reset() = 0;
};

/**
 * @brief Optional capability: retarget output onto another display
 */
class ITargetReconfigurable {
public:
    virtual ~ITargetReconfigurable() = default;
    virtual void setTargetScreen(const Screen& screen) = 0;
};

/**
 * @brief Shared batch logic for every model dialect
 *
 * Subclasses supply the source extents and convertSingle(). The base class
 * enforces the single-terminal rule, repeat expansion, per-action failure
 * isolation and the is-last marker.
 *
 * @tparam T Dialect action record; must provide toJson()
 */
template <typename T>
class ActionConverter : public ISessionResettable, public ITargetReconfigurable {
public:
    ActionConverter(int coordWidth, int coordHeight, const ConverterConfig& config)
        : m_config(config)
        , m_scaler(coordWidth, coordHeight, config.targetWidth, config.targetHeight)
        , m_session(config.capslockMode) {}

    ~ActionConverter() override = default;

    int coordWidth() const { return m_scaler.getSourceWidth(); }
    int coordHeight() const { return m_scaler.getSourceHeight(); }

    /**
     * @brief Convert a batch against explicit session state
     *
     * @throws DuplicateTerminalActionError before anything is converted when
     *         the batch holds more than one terminal action
     * @throws AllConversionsFailedError when a non-empty batch produced no
     *         command and at least one action failed
     */
    std::vector<ConvertedCommand> convert(const std::vector<T>& actions, SessionState& state) {
        std::vector<ConvertedCommand> converted;
        if (actions.empty()) {
            return converted;
        }

        size_t terminalCount = static_cast<size_t>(std::count_if(actions.begin(), actions.end(),
            [this](const T& action) { return isTerminalAction(action); }));
        if (terminalCount > 1) {
            throw DuplicateTerminalActionError(
                "Duplicate finish()/fail() detected. Only one finish() or fail() is allowed per action sequence.",
                name());
        }

        std::vector<std::string> failures;
        std::vector<std::string> skipped;

        for (size_t index = 0; index < actions.size(); ++index) {
            const T& action = actions[index];
            std::vector<std::string> commands;

            try {
                commands = convertSingle(action, state);
            } catch (const std::exception& e) {
                std::string description = describe(action);
                SLOG_ERROR().message("Failed to convert action")
                    .component(name())
                    .context("action", description)
                    .context("error", e.what());
                ErrorHandler::getInstance().handleException(e, name() + ": " + description,
                                                            ErrorSeverity::MEDIUM);
                failures.push_back(std::to_string(index) + ": " + description + ": " + e.what());
                if (isTerminalAction(action)) {
                    state.reset();
                }
                continue;
            }

            if (isTerminalAction(action)) {
                state.reset();
            }

            if (commands.empty()) {
                skipped.push_back(describe(action));
                continue;
            }

            int repeat = std::max(1, repeatCount(action));
            for (int r = 0; r < repeat; ++r) {
                for (const auto& command : commands) {
                    converted.emplace_back(command, false);
                }
            }
        }

        if (!skipped.empty()) {
            SLOG_DEBUG().message("Skipped no-op actions")
                .component(name())
                .context("actions", skipped);
        }

        if (!converted.empty()) {
            converted.back().isLast = true;
        }

        if (converted.empty() && !failures.empty()) {
            throw AllConversionsFailedError(
                "All action conversions failed (" + std::to_string(failures.size()) + "/" +
                    std::to_string(actions.size()) + ")",
                failures);
        }

        return converted;
    }

    // Convenience overload against the converter's own session
    std::vector<ConvertedCommand> convert(const std::vector<T>& actions) {
        return convert(actions, m_session);
    }

    void reset() override {
        m_session.reset();
    }

    void setTargetScreen(const Screen& screen) override {
        m_scaler.applyScreen(screen);
        SLOG_INFO().message("Target screen changed")
            .component(name())
            .context("screen", screen.name)
            .context("width", screen.width)
            .context("height", screen.height);
    }

    nlohmann::json serializeActions(const std::vector<T>& actions) const {
        nlohmann::json serialized = nlohmann::json::array();
        for (const auto& action : actions) {
            serialized.push_back(action.toJson());
        }
        return serialized;
    }

    SessionState& session() { return m_session; }
    const ConverterConfig& config() const { return m_config; }
    const CoordinateScaler& scaler() const { return m_scaler; }

    virtual std::string name() const = 0;

protected:
    virtual std::vector<std::string> convertSingle(const T& action, SessionState& state) = 0;
    virtual bool isTerminalAction(const T& action) const = 0;
    virtual std::string describe(const T& action) const = 0;
    virtual int repeatCount(const T&) const { return 1; }

    std::pair<int, int> scalePoint(double x, double y, bool strict = false) const {
        return m_scaler.scale(x, y, true, false, strict);
    }

    // Last cursor position, or the centre of the target display
    std::pair<int, int> lastOrCenter(const SessionState& state) const {
        if (state.cursor) {
            return *state.cursor;
        }
        return {m_scaler.getOriginX() + m_scaler.getTargetWidth() / 2,
                m_scaler.getOriginY() + m_scaler.getTargetHeight() / 2};
    }

    ConverterConfig m_config;
    CoordinateScaler m_scaler;
    SessionState m_session;
};

/**
 * @brief Reset a handler when it supports session reset, otherwise do nothing
 * @return true when the handler was reset
 */
template <typename Handler>
bool resetHandler(Handler& handler) {
    if constexpr (std::is_base_of<ISessionResettable, Handler>::value) {
        handler.reset();
        return true;
    } else {
        (void)handler;
        return false;
    }
}

/**
 * @brief Apply a screen to a handler when it supports retargeting
 * @return true when the screen was applied
 */
template <typename Handler>
bool configureTargetScreen(Handler& handler, const Screen& screen) {
    if constexpr (std::is_base_of<ITargetReconfigurable, Handler>::value) {
        handler.setTargetScreen(screen);
        return true;
    } else {
        (void)handler;
        (void)screen;
        return false;
    }
}

} // namespace marionette

#endif // MARIONETTE_ACTION_CONVERTER_H
