#ifndef MARIONETTE_STEP_TRANSLATOR_H
#define MARIONETTE_STEP_TRANSLATOR_H

#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace marionette {

enum class ExecutionType {
    SLEEP,
    AUTOMATION,
    SHELL
};

std::string executionTypeToString(ExecutionType type);

// Record handed to a remote executor: {"type": ..., "parameters": {...}}
struct ExecutionRequest {
    ExecutionType type;
    nlohmann::json parameters;

    ExecutionRequest() : type(ExecutionType::SLEEP), parameters(nlohmann::json::object()) {}
    ExecutionRequest(ExecutionType t, nlohmann::json params)
        : type(t), parameters(std::move(params)) {}

    nlohmann::json toJson() const;
};

/**
 * @brief Maps command strings onto execution requests
 *
 * Dispatch order:
 * - DONE / FAIL (any case)      -> sleep, seconds 0
 * - WAIT(n)                     -> sleep, seconds n
 * - automation primitive call   -> automation, code
 * - anything else               -> shell, command, shell=true
 */
class StepTranslator {
public:
    /**
     * @brief Translate one command
     * @throws FormatError for an empty or whitespace-only command
     */
    static ExecutionRequest toStep(const std::string& command);

    static std::vector<ExecutionRequest> toSteps(const std::vector<std::string>& commands);

    // True when the command calls one of the automation primitives
    static bool isAutomationCommand(const std::string& command);

    static const std::vector<std::string>& automationPrefixes();
};

} // namespace marionette

#endif // MARIONETTE_STEP_TRANSLATOR_H
