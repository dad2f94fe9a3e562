#include <iostream>
#include <cassert>
#include <string>
#include "keys/key_normalizer.h"
#include "keys/capslock_state.h"
#include "common/error_handler.h"
#include "test_helpers.h"

using namespace marionette;
using marionette::test::expectThrows;

void testAliases() {
    std::cout << "\n[TEST] Key Aliases\n";

    assert(KeyNormalizer::normalize(" Page_Up ") == "pageup");
    assert(KeyNormalizer::normalize("PGDN") == "pagedown");
    assert(KeyNormalizer::normalize("prtscr") == "printscreen");
    assert(KeyNormalizer::normalize("caps") == "capslock");
    assert(KeyNormalizer::normalize("super") == "win");
    assert(KeyNormalizer::normalize("cmd") == "command");
    assert(KeyNormalizer::normalize("Control") == "ctrl");
    assert(KeyNormalizer::normalize("mute") == "volumemute");
    assert(KeyNormalizer::normalize("play") == "playpause");
    assert(KeyNormalizer::normalize("Enter") == "enter");

    std::cout << "[PASS] Aliases map to canonical names\n";
}

void testParseHotkey() {
    std::cout << "\n[TEST] Hotkey Parsing\n";

    auto plus = KeyNormalizer::parseHotkey("(Control+Shift+T)");
    assert(plus.size() == 3);
    assert(plus[0] == "ctrl" && plus[1] == "shift" && plus[2] == "t");

    auto comma = KeyNormalizer::parseHotkey("alt, tab");
    assert(comma.size() == 2);
    assert(comma[0] == "alt" && comma[1] == "tab");

    auto sparse = KeyNormalizer::parseHotkey("ctrl++c");
    assert(sparse.size() == 2);

    auto unchecked = KeyNormalizer::parseHotkey("ctrl+bogus", false);
    assert(unchecked.size() == 2);
    assert(unchecked[1] == "bogus");

    std::cout << "[PASS] '+' takes precedence over ',' and empty tokens are dropped\n";
}

void testValidation() {
    std::cout << "\n[TEST] Key Validation\n";

    assert(KeyNormalizer::isValidKey("enter"));
    assert(KeyNormalizer::isValidKey("f12"));
    assert(KeyNormalizer::isValidKey("num7"));
    assert(!KeyNormalizer::isValidKey("ret"));

    try {
        KeyNormalizer::parseHotkey("ctrl+ret");
        assert(false);
    } catch (const InvalidKeyError& e) {
        std::string message = e.what();
        assert(e.getKey() == "ret");
        assert(message.find("'ret' -> use 'enter'") != std::string::npos);
        assert(message.find("Valid keys include:") != std::string::npos);
    }

    try {
        KeyNormalizer::validateKeys({"numpad5"});
        assert(false);
    } catch (const InvalidKeyError& e) {
        std::string message = e.what();
        assert(message.find("num0") != std::string::npos);
    }

    assert(expectThrows<InvalidKeyError>([]() { KeyNormalizer::parseHotkey("hyper"); }));

    std::cout << "[PASS] Unknown keys raise InvalidKeyError with suggestions\n";
}

void testCapsLockSessionMode() {
    std::cout << "\n[TEST] CapsLock Session Mode\n";

    CapsLockState caps(CapsLockMode::SESSION);
    assert(!caps.isEnabled());
    assert(caps.transformText("Hello") == "Hello");

    caps.toggle();
    assert(caps.isEnabled());
    assert(caps.transformText("Hello 1!") == "HELLO 1!");
    assert(!caps.shouldDelegateToSystem());

    caps.toggle();
    assert(!caps.isEnabled());

    caps.toggle();
    caps.reset();
    assert(!caps.isEnabled());

    std::cout << "[PASS] Toggle flips a virtual flag that upper-cases text\n";
}

void testCapsLockSystemMode() {
    std::cout << "\n[TEST] CapsLock System Mode\n";

    CapsLockState caps(CapsLockMode::SYSTEM);
    caps.toggle();
    assert(!caps.isEnabled());
    assert(caps.shouldDelegateToSystem());
    assert(caps.transformText("Hello") == "Hello");
    assert(capsLockModeToString(caps.getMode()) == "system");

    std::cout << "[PASS] System mode leaves text alone and delegates the key\n";
}

int main() {
    std::cout << "=== Marionette Key Normalizer Test ===\n";

    try {
        testAliases();
        testParseHotkey();
        testValidation();
        testCapsLockSessionMode();
        testCapsLockSystemMode();

        std::cout << "\n[SUCCESS] All key handling tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Test failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
