#include "key_normalizer.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include <map>
#include <sstream>

namespace marionette {

using utils::StringUtils;

namespace {
    const std::map<std::string, std::string>& aliasTable() {
        static const std::map<std::string, std::string> aliases = {
            {"page_up", "pageup"},
            {"pgup", "pageup"},
            {"page_down", "pagedown"},
            {"pgdn", "pagedown"},
            {"print_screen", "printscreen"},
            {"prtsc", "printscreen"},
            {"prtscr", "printscreen"},
            {"num_lock", "numlock"},
            {"scroll_lock", "scrolllock"},
            {"caps_lock", "capslock"},
            {"caps", "capslock"},
            {"windows", "win"},
            {"super", "win"},
            {"meta", "win"},
            {"cmd", "command"},
            {"control", "ctrl"},
            {"mute", "volumemute"},
            {"play", "playpause"}
        };
        return aliases;
    }

    std::set<std::string> buildVocabulary() {
        std::set<std::string> keys = {
            "\t", "\n", "\r", " ", "!", "\"", "#", "$", "%", "&", "'", "(", ")", "*",
            "+", ",", "-", ".", "/", ":", ";", "<", "=", ">", "?", "@", "[", "\\",
            "]", "^", "_", "`", "{", "|", "}", "~",
            "accept", "add", "alt", "altleft", "altright", "apps", "backspace",
            "browserback", "browserfavorites", "browserforward", "browserhome",
            "browserrefresh", "browsersearch", "browserstop", "capslock", "clear",
            "convert", "ctrl", "ctrlleft", "ctrlright", "decimal", "del", "delete",
            "divide", "down", "end", "enter", "esc", "escape", "execute", "final",
            "fn", "hanguel", "hangul", "hanja", "help", "home", "insert", "junja",
            "kana", "kanji", "launchapp1", "launchapp2", "launchmail",
            "launchmediaselect", "left", "modechange", "multiply", "nexttrack",
            "nonconvert", "numlock", "pagedown", "pageup", "pause", "pgdn", "pgup",
            "playpause", "prevtrack", "print", "printscreen", "prntscrn", "prtsc",
            "prtscr", "return", "right", "scrolllock", "select", "separator",
            "shift", "shiftleft", "shiftright", "sleep", "space", "stop",
            "subtract", "tab", "up", "volumedown", "volumemute", "volumeup", "win",
            "winleft", "winright", "yen", "command", "option", "optionleft",
            "optionright"
        };
        for (char c = '0'; c <= '9'; ++c) {
            keys.insert(std::string(1, c));
            keys.insert(std::string("num") + c);
        }
        for (char c = 'a'; c <= 'z'; ++c) {
            keys.insert(std::string(1, c));
        }
        for (int i = 1; i <= 24; ++i) {
            keys.insert("f" + std::to_string(i));
        }
        return keys;
    }
}

std::string KeyNormalizer::normalize(const std::string& key) {
    std::string lowered = StringUtils::toLowerCase(StringUtils::trim(key));
    auto it = aliasTable().find(lowered);
    if (it != aliasTable().end()) {
        return it->second;
    }
    return lowered;
}

std::vector<std::string> KeyNormalizer::parseHotkey(const std::string& text, bool validate) {
    std::string stripped = StringUtils::strip(text, "()");

    std::vector<std::string> tokens;
    if (StringUtils::contains(stripped, "+")) {
        tokens = StringUtils::split(stripped, "+");
    } else {
        tokens = StringUtils::split(stripped, ",");
    }

    std::vector<std::string> keys;
    for (const auto& token : tokens) {
        std::string key = normalize(token);
        if (!key.empty()) {
            keys.push_back(key);
        }
    }

    if (validate) {
        validateKeys(keys);
    }
    return keys;
}

void KeyNormalizer::validateKeys(const std::vector<std::string>& keys) {
    std::vector<std::string> suggestions;
    std::string firstInvalid;

    for (const auto& key : keys) {
        if (key.empty() || isValidKey(key)) {
            continue;
        }
        if (firstInvalid.empty()) {
            firstInvalid = key;
        }
        suggestions.push_back(suggestionFor(key));
    }

    if (suggestions.empty()) {
        return;
    }

    // First thirty names in sorted order as a hint
    std::vector<std::string> sample;
    for (const auto& valid : validKeys()) {
        if (sample.size() >= 30) break;
        if (valid.size() > 1) {
            sample.push_back(valid);
        }
    }

    std::ostringstream message;
    message << "Invalid key name(s) in hotkey: " << StringUtils::join(suggestions, ", ")
            << "\n\nValid keys include: " << StringUtils::join(sample, ", ") << "... (and more)";
    throw InvalidKeyError(message.str(), firstInvalid);
}

bool KeyNormalizer::isValidKey(const std::string& key) {
    return validKeys().count(key) > 0;
}

const std::set<std::string>& KeyNormalizer::validKeys() {
    static const std::set<std::string> vocabulary = buildVocabulary();
    return vocabulary;
}

std::string KeyNormalizer::suggestionFor(const std::string& invalidKey) {
    if (invalidKey == "return" || invalidKey == "ret") {
        return "'" + invalidKey + "' -> use 'enter'";
    }
    if (invalidKey == "delete" || invalidKey == "del") {
        return "'" + invalidKey + "' -> use 'delete' or 'del'";
    }
    if (invalidKey == "escape" || invalidKey == "esc") {
        return "'" + invalidKey + "' -> use 'escape' or 'esc'";
    }
    if (StringUtils::startsWith(invalidKey, "num") && invalidKey.size() > 3) {
        return "'" + invalidKey + "' -> numpad keys use format 'num0'-'num9'";
    }
    return "'" + invalidKey + "' is not a valid key name";
}

} // namespace marionette
