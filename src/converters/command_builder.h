#ifndef MARIONETTE_COMMAND_BUILDER_H
#define MARIONETTE_COMMAND_BUILDER_H

#include <string>
#include <vector>

namespace marionette {

/**
 * @brief Renders the portable command vocabulary
 *
 * Every string a converter emits is built here so that quoting and number
 * formatting stay identical across dialects.
 */
class CommandBuilder {
public:
    // Longest text sent through keystroke typing before switching to paste
    static constexpr size_t MAX_TYPED_LENGTH = 200;

    static std::string click(int x, int y);
    static std::string doubleClick(int x, int y);
    static std::string tripleClick(int x, int y);
    static std::string rightClick(int x, int y);
    static std::string middleClick(int x, int y);

    static std::string moveTo(int x, int y);
    static std::string dragTo(int x, int y, double duration);

    static std::string hotkey(const std::vector<std::string>& keys, double interval);
    static std::string press(const std::string& key);
    static std::string keyDown(const std::string& key);
    static std::string keyUp(const std::string& key);

    static std::string scroll(int amount);

    /**
     * @brief Type text via keystrokes, or paste it when typing is unsafe
     *
     * Printable ASCII of at most MAX_TYPED_LENGTH characters without a newline
     * becomes PynputController().type('...'); anything else _smart_paste('...').
     */
    static std::string typeText(const std::string& text);

    /**
     * @brief WAIT(<seconds>) in plain decimal form
     * @throws FormatError for a negative or non-finite duration
     */
    static std::string wait(double seconds);
    static std::string waitWholeSeconds(int seconds);
    static std::string done();
    static std::string fail();
};

} // namespace marionette

#endif // MARIONETTE_COMMAND_BUILDER_H
