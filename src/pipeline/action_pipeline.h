#ifndef MARIONETTE_ACTION_PIPELINE_H
#define MARIONETTE_ACTION_PIPELINE_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/types.h"
#include "../actions/action.h"
#include "../parser/output_parser.h"
#include "../converters/native_action_converter.h"
#include "../executor/step_translator.h"

namespace marionette {

class ConfigManager;

struct PipelineResult {
    Step step;
    std::vector<ConvertedCommand> commands;
    std::vector<ExecutionRequest> requests;   // one per command, same order

    nlohmann::json toJson() const;
};

/**
 * @class ActionPipeline
 * @brief Simplified interface over parsing, native conversion and step translation
 *
 * One pipeline serves one automation session. Its converter keeps the cursor
 * and capslock state between calls to process().
 */
class ActionPipeline {
public:
    explicit ActionPipeline(const ConverterConfig& config = ConverterConfig(),
                            ParserMode mode = ParserMode::AUTO);

    /**
     * @brief Build a pipeline from the "converter" and "parser" sections
     * @throws MarionetteException (CONFIGURATION_ERROR) on invalid settings
     */
    static ActionPipeline fromConfig(const ConfigManager& config);

    /**
     * @brief Parse raw model output, convert its actions and translate the commands
     * @throws DuplicateTerminalActionError, AllConversionsFailedError
     */
    PipelineResult process(const std::string& rawOutput);

    // Convert an already parsed step
    PipelineResult process(const Step& step);

    void reset();
    void setTargetScreen(const Screen& screen);

    ParserMode getParserMode() const { return m_mode; }
    void setParserMode(ParserMode mode) { m_mode = mode; }

    OutputParser& parser() { return m_parser; }
    NativeActionConverter& converter() { return m_converter; }

private:
    OutputParser m_parser;
    NativeActionConverter m_converter;
    ParserMode m_mode;
};

} // namespace marionette

#endif // MARIONETTE_ACTION_PIPELINE_H
