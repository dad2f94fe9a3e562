#include <iostream>
#include <iterator>
#include <string>
#include "common/structured_logger.h"
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "pipeline/action_pipeline.h"
#include "common/json_utils.h"

using namespace marionette;

// Reads one model response from stdin and prints the pipeline result as JSON.
// Settings come from config/marionette.json when present.
int main() {
    auto& config = ConfigManager::getInstance();
    config.loadConfig();
    config.applyLoggingConfig();

    std::string rawOutput((std::istreambuf_iterator<char>(std::cin)),
                          std::istreambuf_iterator<char>());
    if (rawOutput.empty()) {
        SLOG_WARNING().message("No model output on stdin");
        return 1;
    }

    try {
        ActionPipeline pipeline = ActionPipeline::fromConfig(config);
        PipelineResult result = pipeline.process(rawOutput);

        SLOG_INFO().message("Model output converted")
            .context("actions", result.step.actions.size())
            .context("commands", result.commands.size())
            .context("stop", result.step.stop);

        std::cout << utils::JsonUtils::safeDump(result.toJson(), 2) << std::endl;
    } catch (const AllConversionsFailedError& e) {
        SLOG_ERROR().message(e.what())
            .context("failures", e.getFailures());
        return 1;
    } catch (const MarionetteException& e) {
        ErrorHandler::getInstance().handleException(e, "main");
        return 1;
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Unexpected failure")
            .context("error", e.what());
        return 1;
    }

    StructuredLogger::getInstance().flush();
    return 0;
}
