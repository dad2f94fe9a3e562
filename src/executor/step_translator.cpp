#include "step_translator.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include <regex>

namespace marionette {

using utils::StringUtils;

std::string executionTypeToString(ExecutionType type) {
    switch (type) {
        case ExecutionType::SLEEP: return "sleep";
        case ExecutionType::AUTOMATION: return "automation";
        case ExecutionType::SHELL: return "shell";
        default: return "unknown";
    }
}

nlohmann::json ExecutionRequest::toJson() const {
    return nlohmann::json{
        {"type", executionTypeToString(type)},
        {"parameters", parameters}
    };
}

const std::vector<std::string>& StepTranslator::automationPrefixes() {
    static const std::vector<std::string> prefixes = {
        "pyautogui.",
        "PynputController",
        "_smart_paste"
    };
    return prefixes;
}

bool StepTranslator::isAutomationCommand(const std::string& command) {
    std::string lowered = StringUtils::toLowerCase(StringUtils::trim(command));
    for (const auto& prefix : automationPrefixes()) {
        if (StringUtils::startsWith(lowered, StringUtils::toLowerCase(prefix))) {
            return true;
        }
    }
    return false;
}

ExecutionRequest StepTranslator::toStep(const std::string& command) {
    static const std::regex waitPattern(R"(^WAIT\(\s*([0-9]*\.?[0-9]+)\s*\)$)", std::regex::icase);

    std::string trimmed = StringUtils::trim(command);
    if (trimmed.empty()) {
        throw FormatError("Cannot translate an empty command", "StepTranslator");
    }

    std::string upper = StringUtils::toUpperCase(trimmed);
    if (upper == "DONE" || upper == "FAIL") {
        return ExecutionRequest(ExecutionType::SLEEP, {{"seconds", 0}});
    }

    std::smatch match;
    if (std::regex_match(trimmed, match, waitPattern)) {
        double seconds = 0.0;
        if (!StringUtils::tryParseDouble(match[1].str(), seconds)) {
            throw FormatError("Invalid WAIT duration: '" + trimmed + "'", "StepTranslator");
        }
        return ExecutionRequest(ExecutionType::SLEEP, {{"seconds", seconds}});
    }

    if (isAutomationCommand(trimmed)) {
        return ExecutionRequest(ExecutionType::AUTOMATION, {{"code", trimmed}});
    }

    return ExecutionRequest(ExecutionType::SHELL, {{"command", trimmed}, {"shell", true}});
}

std::vector<ExecutionRequest> StepTranslator::toSteps(const std::vector<std::string>& commands) {
    std::vector<ExecutionRequest> steps;
    steps.reserve(commands.size());
    for (const auto& command : commands) {
        steps.push_back(toStep(command));
    }
    return steps;
}

} // namespace marionette
