#ifndef MARIONETTE_KEY_NORMALIZER_H
#define MARIONETTE_KEY_NORMALIZER_H

#include <string>
#include <vector>
#include <set>

namespace marionette {

/**
 * @brief Canonical key names for the automation runtime
 *
 * Model outputs spell keys many ways (page_down, Control, caps). Everything
 * that reaches a hotkey command goes through normalize() and, where
 * requested, is checked against the closed vocabulary of validKeys().
 */
class KeyNormalizer {
public:
    /**
     * @brief Trim, lower-case and map aliases to their canonical name
     * @param key Raw key spelling, e.g. " Page_Up "
     * @return Canonical name, e.g. "pageup"; unknown names come back lower-cased
     */
    static std::string normalize(const std::string& key);

    /**
     * @brief Split a hotkey string into canonical key names
     *
     * Surrounding parentheses are stripped. Splits on '+' when present,
     * otherwise on ','. Empty tokens are dropped.
     *
     * @param text Hotkey text such as "ctrl+c" or "alt, tab"
     * @param validate Check every key against the vocabulary
     * @throws InvalidKeyError when validate is set and a key is unknown
     */
    static std::vector<std::string> parseHotkey(const std::string& text, bool validate = true);

    /**
     * @throws InvalidKeyError naming each unknown key with a suggestion
     */
    static void validateKeys(const std::vector<std::string>& keys);

    static bool isValidKey(const std::string& key);
    static const std::set<std::string>& validKeys();

private:
    static std::string suggestionFor(const std::string& invalidKey);
};

} // namespace marionette

#endif // MARIONETTE_KEY_NORMALIZER_H
