#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include "converters/native_action_converter.h"
#include "converters/command_builder.h"
#include "common/structured_logger.h"
#include "common/error_handler.h"
#include "test_helpers.h"

using namespace marionette;
using marionette::test::expectThrows;
using marionette::test::commandsOf;

void testClickEndToEnd() {
    std::cout << "\n[TEST] Click End to End\n";

    NativeActionConverter converter;
    assert(converter.coordWidth() == 1000);
    assert(converter.coordHeight() == 1000);

    auto result = converter.convert({Action(ActionType::CLICK, "500, 300")});
    assert(result.size() == 1);
    assert(result[0].command == "pyautogui.click(x=960, y=324)");
    assert(result[0].isLast);

    auto variants = commandsOf(converter.convert({
        Action(ActionType::LEFT_DOUBLE, "(500, 300)"),
        Action(ActionType::LEFT_TRIPLE, "0, 0"),
        Action(ActionType::RIGHT_SINGLE, "1000, 1000")
    }));
    assert(variants[0] == "pyautogui.doubleClick(x=960, y=324)");
    assert(variants[1] == "pyautogui.tripleClick(x=0, y=0)");
    assert(variants[2] == "pyautogui.rightClick(x=1919, y=1079)");

    std::cout << "[PASS] click(500, 300) becomes pyautogui.click(x=960, y=324)\n";
}

void testRepeatExpansion() {
    std::cout << "\n[TEST] Repeat Expansion\n";

    NativeActionConverter converter;
    auto result = converter.convert({
        Action(ActionType::HOTKEY, "ctrl, c", 3),
        Action(ActionType::SCROLL, "500, 300, down", 2)
    });

    assert(result.size() == 3 + 2 * 2);
    for (size_t i = 0; i < 3; ++i) {
        assert(result[i].command == "pyautogui.hotkey('ctrl', 'c', interval=0.1)");
        assert(!result[i].isLast);
    }
    assert(result[3].command == "pyautogui.moveTo(960, 324)");
    assert(result[4].command == "pyautogui.scroll(-2)");
    assert(result[5].command == "pyautogui.moveTo(960, 324)");
    assert(result[6].command == "pyautogui.scroll(-2)");
    assert(result[6].isLast);

    std::cout << "[PASS] Commands repeat count times and only the final one is last\n";
}

void testDragAndMovement() {
    std::cout << "\n[TEST] Drag and Movement\n";

    NativeActionConverter converter;
    auto drag = commandsOf(converter.convert({Action(ActionType::DRAG, "100, 200, 300, 400")}));
    assert(drag.size() == 2);
    assert(drag[0] == "pyautogui.moveTo(192, 216)");
    assert(drag[1] == "pyautogui.dragTo(576, 432, duration=0.5)");

    converter.reset();
    auto fromCentre = commandsOf(converter.convert({Action(ActionType::LEFT_CLICK_DRAG, "100, 100")}));
    assert(fromCentre[0] == "pyautogui.moveTo(960, 540)");
    assert(fromCentre[1] == "pyautogui.dragTo(192, 108, duration=0.5)");

    auto moved = commandsOf(converter.convert({
        Action(ActionType::MOUSE_MOVE, "500, 500"),
        Action(ActionType::LEFT_CLICK_DRAG, "0, 0")
    }));
    assert(moved[0] == "pyautogui.moveTo(960, 540)");
    assert(moved[1] == "pyautogui.moveTo(960, 540)");
    assert(moved[2] == "pyautogui.dragTo(0, 0, duration=0.5)");
    assert(converter.session().cursor == std::make_pair(0, 0));

    std::cout << "[PASS] Drags start from explicit points or the tracked cursor\n";
}

void testMalformedArguments() {
    std::cout << "\n[TEST] Malformed Arguments\n";

    NativeActionConverter converter;

    auto failureFor = [&converter](const Action& action) {
        try {
            converter.convert({action});
        } catch (const AllConversionsFailedError& e) {
            assert(e.getFailures().size() == 1);
            return e.getFailures()[0];
        }
        assert(false);
        return std::string();
    };

    assert(failureFor(Action(ActionType::CLICK, "500")).find(
        "Invalid click coordinate format: '500'. Expected 'x, y'") != std::string::npos);
    assert(failureFor(Action(ActionType::CLICK, "500, 300 and 200, 100")).find(
        "Cannot combine multiple actions with 'and' or 'then'") != std::string::npos);
    assert(failureFor(Action(ActionType::CLICK, "left, 300")).find(
        "Failed to parse click coords 'left, 300'") != std::string::npos);
    assert(failureFor(Action(ActionType::DRAG, "1, 2, 3")).find(
        "Invalid drag coordinate format") != std::string::npos);
    assert(failureFor(Action(ActionType::SCROLL, "500, 300")).find(
        "got 2 parts") != std::string::npos);
    assert(failureFor(Action(ActionType::SCROLL, "a, b, up")).find(
        "Invalid scroll coordinates") != std::string::npos);
    assert(failureFor(Action(ActionType::SCROLL, "500, 300, sideways")).find(
        "Invalid scroll direction: 'sideways'") != std::string::npos);
    assert(failureFor(Action(ActionType::WAIT, "soon")).find(
        "Invalid wait duration: 'soon'") != std::string::npos);
    assert(failureFor(Action(ActionType::HOTKEY, "ctrl+ret")).find(
        "'ret' -> use 'enter'") != std::string::npos);
    assert(failureFor(Action(ActionType::HOTKEY, "()")).find(
        "Invalid hotkey format") != std::string::npos);

    std::cout << "[PASS] Each malformed form reports its own message\n";
}

void testFailureIsolation() {
    std::cout << "\n[TEST] Failure Isolation\n";

    NativeActionConverter converter;
    auto result = converter.convert({
        Action(ActionType::CLICK, "nowhere"),
        Action(ActionType::CLICK, "500, 300"),
        Action(ActionType::WAIT, "later")
    });
    assert(result.size() == 1);
    assert(result[0].command == "pyautogui.click(x=960, y=324)");
    assert(result[0].isLast);

    try {
        converter.convert({Action(ActionType::CLICK, "x"), Action(ActionType::WAIT, "y")});
        assert(false);
    } catch (const AllConversionsFailedError& e) {
        assert(e.getFailures().size() == 2);
        assert(e.getFailures()[0].find("0: click(x)") == 0);
        assert(e.getFailures()[1].find("1: wait(y)") == 0);
    }

    auto noop = converter.convert({Action(ActionType::CALL_USER, "")});
    assert(noop.empty());
    assert(converter.convert({}).empty());

    std::cout << "[PASS] Siblings convert when one action fails\n";
}

void testStrictCoordinates() {
    std::cout << "\n[TEST] Strict Coordinate Validation\n";

    ConverterConfig lenientConfig;
    NativeActionConverter lenient(lenientConfig);
    auto clamped = commandsOf(lenient.convert({Action(ActionType::CLICK, "1200, 500")}));
    assert(clamped[0] == "pyautogui.click(x=1919, y=540)");

    ConverterConfig strictConfig;
    strictConfig.strictCoordinateValidation = true;
    NativeActionConverter strict(strictConfig);

    auto result = commandsOf(strict.convert({
        Action(ActionType::CLICK, "1200, 500"),
        Action(ActionType::CLICK, "1000, 0")
    }));
    assert(result.size() == 1);
    assert(result[0] == "pyautogui.click(x=1919, y=0)");

    try {
        strict.convert({Action(ActionType::DRAG, "0, 0, 10, -5")});
        assert(false);
    } catch (const AllConversionsFailedError& e) {
        assert(e.getFailures()[0].find("y coordinate -5.0 out of valid range [0, 1000]") != std::string::npos);
    }

    std::cout << "[PASS] Strict mode rejects out-of-range actions without clamping\n";
}

void testTypeText() {
    std::cout << "\n[TEST] Type Text\n";

    NativeActionConverter converter;
    auto typed = commandsOf(converter.convert({
        Action(ActionType::TYPE, "'Hello, World'"),
        Action(ActionType::TYPE, "it's (fine)"),
        Action(ActionType::TYPE, "line one\nline two"),
        Action(ActionType::TYPE, std::string(201, 'x'))
    }));

    assert(typed[0] == "PynputController().type('Hello, World')");
    assert(typed[1] == "PynputController().type(\"it's (fine)\")");
    assert(typed[2] == "_smart_paste('line one\\nline two')");
    assert(typed[3] == "_smart_paste('" + std::string(201, 'x') + "')");

    std::cout << "[PASS] Short printable text is typed, the rest is pasted\n";
}

void testCapsLockSession() {
    std::cout << "\n[TEST] CapsLock Session Mode\n";

    NativeActionConverter converter;
    auto result = converter.convert({
        Action(ActionType::HOTKEY, "caps_lock"),
        Action(ActionType::TYPE, "abc")
    });
    assert(result.size() == 1);
    assert(result[0].command == "PynputController().type('ABC')");
    assert(converter.session().capslock.isEnabled());

    // A terminal action ends the session
    auto finished = commandsOf(converter.convert({Action(ActionType::FINISH, "")}));
    assert(finished.size() == 1 && finished[0] == "DONE");
    assert(!converter.session().capslock.isEnabled());

    auto after = commandsOf(converter.convert({Action(ActionType::TYPE, "abc")}));
    assert(after[0] == "PynputController().type('abc')");

    std::cout << "[PASS] Session capslock upper-cases text until reset\n";
}

void testCapsLockSystem() {
    std::cout << "\n[TEST] CapsLock System Mode\n";

    ConverterConfig config;
    config.capslockMode = CapsLockMode::SYSTEM;
    NativeActionConverter converter(config);

    auto result = commandsOf(converter.convert({
        Action(ActionType::HOTKEY, "capslock"),
        Action(ActionType::TYPE, "abc")
    }));
    assert(result.size() == 2);
    assert(result[0] == "pyautogui.hotkey('capslock', interval=0.1)");
    assert(result[1] == "PynputController().type('abc')");

    std::cout << "[PASS] System mode forwards the key and leaves text alone\n";
}

void testPressClick() {
    std::cout << "\n[TEST] Press Click\n";

    NativeActionConverter converter;
    auto result = commandsOf(converter.convert({Action(ActionType::PRESS_CLICK,
        "{\"keys\":[\"Control\",\"shift\"],\"click_type\":\"right_click\",\"coordinate\":[500,300]}")}));

    assert(result.size() == 5);
    assert(result[0] == "pyautogui.keyDown('ctrl')");
    assert(result[1] == "pyautogui.keyDown('shift')");
    assert(result[2] == "pyautogui.rightClick(x=960, y=324)");
    assert(result[3] == "pyautogui.keyUp('shift')");
    assert(result[4] == "pyautogui.keyUp('ctrl')");

    assert(expectThrows<AllConversionsFailedError>([&converter]() {
        converter.convert({Action(ActionType::PRESS_CLICK, "{\"keys\":[\"ctrl\"]}")});
    }));

    std::cout << "[PASS] Keys are held around the click and released in reverse\n";
}

void testTerminalActions() {
    std::cout << "\n[TEST] Terminal Actions\n";

    NativeActionConverter converter;
    converter.convert({Action(ActionType::CLICK, "10, 10")});
    assert(converter.session().cursor);

    bool threw = expectThrows<DuplicateTerminalActionError>([&converter]() {
        converter.convert({
            Action(ActionType::CLICK, "500, 300"),
            Action(ActionType::FINISH, ""),
            Action(ActionType::FAIL, "")
        });
    });
    assert(threw);
    // Nothing ran, the cursor still points at the earlier click
    assert(converter.session().cursor == std::make_pair(19, 11));

    auto failed = converter.convert({Action(ActionType::WAIT, ""), Action(ActionType::FAIL, "")});
    assert(failed.size() == 2);
    assert(failed[0].command == "WAIT(1.0)");
    assert(failed[1].command == "FAIL");
    assert(failed[1].isLast);
    assert(!converter.session().cursor);

    std::cout << "[PASS] One terminal per batch, and it resets the session\n";
}

void testExplicitSessionState() {
    std::cout << "\n[TEST] Explicit Session State\n";

    NativeActionConverter converter;
    SessionState external(CapsLockMode::SESSION);

    converter.convert({Action(ActionType::MOUSE_MOVE, "500, 500")}, external);
    assert(external.cursor == std::make_pair(960, 540));
    assert(!converter.session().cursor);

    assert(resetHandler(converter));
    int notAHandler = 0;
    assert(!resetHandler(notAHandler));

    Screen screen;
    screen.name = "secondary";
    screen.x = 1920;
    screen.y = 0;
    screen.width = 1280;
    screen.height = 720;
    assert(configureTargetScreen(converter, screen));
    auto moved = commandsOf(converter.convert({Action(ActionType::CLICK, "500, 500")}));
    assert(moved[0] == "pyautogui.click(x=2560, y=360)");

    std::cout << "[PASS] State can be supplied by the caller\n";
}

void testLoggingAndErrorReporting() {
    std::cout << "\n[TEST] Logging and Error Reporting\n";

    auto& logger = StructuredLogger::getInstance();
    auto sink = std::make_shared<MemoryLogSink>();
    logger.addSink(sink);
    logger.setLogLevel(LogLevel::DEBUG);

    auto& errors = ErrorHandler::getInstance();
    errors.clearErrorHistory();

    NativeActionConverter converter;
    converter.convert({
        Action(ActionType::CLICK, "bad"),
        Action(ActionType::CALL_USER, ""),
        Action(ActionType::FINISH, "")
    });

    assert(sink->count(LogLevel::ERROR_LEVEL) >= 1);
    assert(sink->contains("Failed to convert action"));
    assert(sink->contains("Skipped no-op actions"));
    assert(sink->contains("Task completion action -> DONE"));
    assert(errors.getErrorCount() == 1);
    assert(errors.getRecentErrors(1)[0].type == ErrorType::FORMAT_ERROR);
    assert(errors.getRecentErrors(1)[0].severity == ErrorSeverity::MEDIUM);

    auto serialized = converter.serializeActions({Action(ActionType::CLICK, "1, 2")});
    assert(serialized.size() == 1);
    assert(serialized[0]["type"] == "click");

    logger.removeSink(sink);
    logger.setLogLevel(LogLevel::INFO);

    std::cout << "[PASS] Failures are logged and recorded by the error handler\n";
}

void testExtremeCoordinates() {
    std::cout << "\n[TEST] Extreme Coordinates\n";

    NativeActionConverter converter;
    auto huge = commandsOf(converter.convert({Action(ActionType::CLICK, "1e12, 500")}));
    assert(huge.size() == 1);
    assert(huge[0] == "pyautogui.click(x=1919, y=540)");

    auto result = converter.convert({
        Action(ActionType::CLICK, "nan, 5"),
        Action(ActionType::CLICK, "500, inf"),
        Action(ActionType::CLICK, "500, 300")
    });
    assert(result.size() == 1);
    assert(result[0].command == "pyautogui.click(x=960, y=324)");

    try {
        converter.convert({Action(ActionType::CLICK, "nan, 5")});
        assert(false);
    } catch (const AllConversionsFailedError& e) {
        assert(e.getFailures()[0].find("Coordinates must be finite numbers") != std::string::npos);
    }

    std::cout << "[PASS] Huge coordinates clamp, non-finite ones fail alone\n";
}

void testInvalidUtf8Argument() {
    std::cout << "\n[TEST] Invalid UTF-8 Argument\n";

    auto& logger = StructuredLogger::getInstance();
    auto sink = std::make_shared<MemoryLogSink>();
    logger.addSink(sink);

    NativeActionConverter converter;
    auto result = converter.convert({
        Action(ActionType::CLICK, "\xff\xfe, 5"),
        Action(ActionType::CLICK, "500, 300")
    });
    assert(result.size() == 1);
    assert(result[0].command == "pyautogui.click(x=960, y=324)");

    bool formatted = false;
    JsonLogFormatter json;
    TextLogFormatter text;
    for (const auto& entry : sink->entries()) {
        if (entry.message == "Failed to convert action") {
            std::string line = json.format(entry);
            assert(line.find("\xEF\xBF\xBD") != std::string::npos);
            assert(!text.format(entry).empty());
            formatted = true;
        }
    }
    assert(formatted);

    logger.removeSink(sink);
    std::cout << "[PASS] Non-UTF-8 arguments are logged and skipped\n";
}

void testWaitDurations() {
    std::cout << "\n[TEST] Wait Durations\n";

    NativeActionConverter converter;
    auto waits = commandsOf(converter.convert({
        Action(ActionType::WAIT, "0"),
        Action(ActionType::WAIT, "2.5"),
        Action(ActionType::WAIT, "1e20")
    }));
    assert(waits.size() == 3);
    assert(waits[0] == "WAIT(0.0)");
    assert(waits[1] == "WAIT(2.5)");
    assert(waits[2] == "WAIT(100000000000000000000.0)");

    try {
        converter.convert({
            Action(ActionType::WAIT, "-2"),
            Action(ActionType::WAIT, "nan"),
            Action(ActionType::WAIT, "inf")
        });
        assert(false);
    } catch (const AllConversionsFailedError& e) {
        assert(e.getFailures().size() == 3);
        for (const auto& failure : e.getFailures()) {
            assert(failure.find("Duration must be a finite, non-negative number of seconds") != std::string::npos);
        }
    }

    assert(expectThrows<FormatError>([]() { CommandBuilder::wait(-1.0); }));

    std::cout << "[PASS] Only finite, non-negative waits become WAIT commands\n";
}

int main() {
    std::cout << "=== Marionette Native Converter Test ===\n";

    try {
        testClickEndToEnd();
        testRepeatExpansion();
        testDragAndMovement();
        testMalformedArguments();
        testFailureIsolation();
        testStrictCoordinates();
        testTypeText();
        testCapsLockSession();
        testCapsLockSystem();
        testPressClick();
        testTerminalActions();
        testExplicitSessionState();
        testLoggingAndErrorReporting();
        testExtremeCoordinates();
        testInvalidUtf8Argument();
        testWaitDurations();

        std::cout << "\n[SUCCESS] All native converter tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Test failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
