#ifndef MARIONETTE_OUTPUT_PARSER_H
#define MARIONETTE_OUTPUT_PARSER_H

#include <string>
#include <vector>
#include <optional>
#include <regex>
#include <nlohmann/json.hpp>
#include "../actions/action.h"

namespace marionette {

// Which output grammar to read
enum class ParserMode {
    TAGGED,     // <|think_start|>...<|action_start|>click(1, 2)&type(x)<|action_end|>
    TOOL_CALL,  // <think>...</think> <tool_call>{"name": "computer_use", ...}</tool_call>
    AUTO
};

std::string parserModeToString(ParserMode mode);

/**
 * @brief Accepts "tagged"/"legacy", "tool-call"/"tool_call"/"qwen3" and "auto"
 * @return std::nullopt for any other name
 */
std::optional<ParserMode> parserModeFromString(const std::string& name);

/**
 * @brief Turns raw model output into a Step
 *
 * Parsing never throws on bad model output. Malformed payloads, unknown action
 * names and fragments that do not look like calls are dropped and counted.
 */
class OutputParser {
public:
    OutputParser();

    Step parse(const std::string& rawOutput, ParserMode mode = ParserMode::AUTO);

    Step parseTagged(const std::string& rawOutput);
    Step parseToolCall(const std::string& rawOutput);

    /**
     * @brief Split an action block on '&' at parenthesis depth zero
     * @note Quotes are not tracked, so type("a&b") splits inside the text
     */
    static std::vector<std::string> splitActions(const std::string& actionBlock);

    /**
     * @brief Parse one "name(arguments)" call
     *
     * The name runs up to the first '(' and the arguments up to the last ')'.
     * type() keeps its arguments verbatim; everything else is trimmed.
     * hotkey(keys, n) and scroll(x, y, dir, n) carry a trailing repeat count.
     */
    static std::optional<Action> parseAction(const std::string& actionText);

    /**
     * @brief Map one decoded tool-call object onto a native action
     * @return std::nullopt for foreign tools, unknown actions or missing fields
     */
    static std::optional<Action> parseToolCallPayload(const nlohmann::json& toolCall);

    static std::string extractActionSummary(const std::string& rawOutput);
    static std::string stripCodeFence(const std::string& text);

    struct ParsingStatistics {
        int totalParses = 0;
        int taggedParses = 0;
        int toolCallParses = 0;
        int actionsParsed = 0;
        int fragmentsDropped = 0;
        int malformedPayloads = 0;
    };

    ParsingStatistics getStatistics() const { return m_statistics; }
    void resetStatistics();

private:
    std::regex m_thinkPattern;
    std::regex m_actionBlockPattern;
    std::regex m_toolThinkPattern;
    std::regex m_toolCallPattern;

    ParsingStatistics m_statistics;

    static bool hasTaggedMarkers(const std::string& rawOutput);
    static bool isProductive(const Step& step);
};

} // namespace marionette

#endif // MARIONETTE_OUTPUT_PARSER_H
