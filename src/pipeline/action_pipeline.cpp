#include "action_pipeline.h"
#include "../common/config_manager.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace marionette {

nlohmann::json PipelineResult::toJson() const {
    nlohmann::json commandsJson = nlohmann::json::array();
    for (const auto& command : commands) {
        commandsJson.push_back({{"command", command.command}, {"is_last", command.isLast}});
    }
    nlohmann::json requestsJson = nlohmann::json::array();
    for (const auto& request : requests) {
        requestsJson.push_back(request.toJson());
    }
    return nlohmann::json{
        {"step", step.toJson()},
        {"commands", commandsJson},
        {"requests", requestsJson}
    };
}

ActionPipeline::ActionPipeline(const ConverterConfig& config, ParserMode mode)
    : m_converter(config)
    , m_mode(mode) {}

ActionPipeline ActionPipeline::fromConfig(const ConfigManager& config) {
    std::string modeName = config.getParserMode();
    auto mode = parserModeFromString(modeName);
    if (!mode) {
        MARIONETTE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                         "Unknown parser mode", modeName, "parser");
    }
    return ActionPipeline(config.getConverterConfig(), *mode);
}

PipelineResult ActionPipeline::process(const std::string& rawOutput) {
    Step step = m_parser.parse(rawOutput, m_mode);
    SLOG_DEBUG().message("Parsed model output")
        .component("ActionPipeline")
        .context("mode", parserModeToString(m_mode))
        .context("actions", step.actions.size())
        .context("stop", step.stop);
    return process(step);
}

PipelineResult ActionPipeline::process(const Step& step) {
    PipelineResult result;
    result.step = step;
    result.commands = m_converter.convert(step.actions);

    result.requests.reserve(result.commands.size());
    for (const auto& command : result.commands) {
        result.requests.push_back(StepTranslator::toStep(command.command));
    }
    return result;
}

void ActionPipeline::reset() {
    m_converter.reset();
}

void ActionPipeline::setTargetScreen(const Screen& screen) {
    m_converter.setTargetScreen(screen);
}

} // namespace marionette
