#include <iostream>
#include <cassert>
#include <string>
#include "executor/step_translator.h"
#include "converters/command_builder.h"
#include "common/error_handler.h"
#include "test_helpers.h"

using namespace marionette;
using marionette::test::expectThrows;

void testTerminalCommands() {
    std::cout << "\n[TEST] Terminal Commands\n";

    for (const std::string command : {"DONE", "FAIL", "done", " Fail "}) {
        ExecutionRequest request = StepTranslator::toStep(command);
        assert(request.type == ExecutionType::SLEEP);
        assert(request.parameters["seconds"] == 0);
    }

    std::cout << "[PASS] DONE and FAIL become zero-second sleeps\n";
}

void testWaitCommands() {
    std::cout << "\n[TEST] WAIT Commands\n";

    ExecutionRequest fractional = StepTranslator::toStep("WAIT(1.5)");
    assert(fractional.type == ExecutionType::SLEEP);
    assert(fractional.parameters["seconds"].get<double>() == 1.5);

    ExecutionRequest whole = StepTranslator::toStep("wait( 5 )");
    assert(whole.type == ExecutionType::SLEEP);
    assert(whole.parameters["seconds"].get<double>() == 5.0);

    ExecutionRequest leadingDot = StepTranslator::toStep("WAIT(.25)");
    assert(leadingDot.parameters["seconds"].get<double>() == 0.25);

    // Not a WAIT literal, so it falls through to the shell
    ExecutionRequest malformed = StepTranslator::toStep("WAIT(soon)");
    assert(malformed.type == ExecutionType::SHELL);

    ExecutionRequest large = StepTranslator::toStep(CommandBuilder::wait(1e20));
    assert(large.type == ExecutionType::SLEEP);
    assert(large.parameters["seconds"].get<double>() == 1e20);

    ExecutionRequest tiny = StepTranslator::toStep(CommandBuilder::wait(2.5e-5));
    assert(tiny.type == ExecutionType::SLEEP);

    std::cout << "[PASS] WAIT(n) becomes a sleep of n seconds\n";
}

void testAutomationCommands() {
    std::cout << "\n[TEST] Automation Commands\n";

    const std::string commands[] = {
        "pyautogui.click(x=960, y=324)",
        "PynputController().type('hello')",
        "_smart_paste('line one\\nline two')"
    };
    for (const auto& command : commands) {
        assert(StepTranslator::isAutomationCommand(command));
        ExecutionRequest request = StepTranslator::toStep(command);
        assert(request.type == ExecutionType::AUTOMATION);
        assert(request.parameters["code"] == command);
        assert(!request.parameters.contains("shell"));
    }

    assert(StepTranslator::automationPrefixes().size() == 3);
    assert(!StepTranslator::isAutomationCommand("echo pyautogui.click"));

    assert(StepTranslator::isAutomationCommand("PyAutoGUI.click(x=1, y=2)"));
    assert(StepTranslator::isAutomationCommand("  pynputcontroller().type('a')"));
    assert(StepTranslator::isAutomationCommand("_SMART_PASTE('a')"));
    ExecutionRequest mixedCase = StepTranslator::toStep("PyAutoGUI.press('enter')");
    assert(mixedCase.type == ExecutionType::AUTOMATION);
    assert(mixedCase.parameters["code"] == "PyAutoGUI.press('enter')");

    std::cout << "[PASS] Primitive calls are sent as automation code\n";
}

void testShellFallback() {
    std::cout << "\n[TEST] Shell Fallback\n";

    ExecutionRequest request = StepTranslator::toStep("  xdg-open https://example.com  ");
    assert(request.type == ExecutionType::SHELL);
    assert(request.parameters["command"] == "xdg-open https://example.com");
    assert(request.parameters["shell"] == true);

    auto json = request.toJson();
    assert(json["type"] == "shell");
    assert(json["parameters"]["shell"] == true);

    assert(expectThrows<FormatError>([]() { StepTranslator::toStep("   "); }));
    assert(expectThrows<FormatError>([]() { StepTranslator::toStep(""); }));

    std::cout << "[PASS] Anything else runs through the shell\n";
}

void testBatchTranslation() {
    std::cout << "\n[TEST] Batch Translation\n";

    auto steps = StepTranslator::toSteps({"pyautogui.press('enter')", "WAIT(1.0)", "DONE"});
    assert(steps.size() == 3);
    assert(steps[0].type == ExecutionType::AUTOMATION);
    assert(steps[1].type == ExecutionType::SLEEP);
    assert(steps[2].toJson()["type"] == "sleep");
    assert(executionTypeToString(ExecutionType::AUTOMATION) == "automation");

    assert(StepTranslator::toSteps({}).empty());

    std::cout << "[PASS] Order is preserved\n";
}

int main() {
    std::cout << "=== Marionette Step Translator Test ===\n";

    try {
        testTerminalCommands();
        testWaitCommands();
        testAutomationCommands();
        testShellFallback();
        testBatchTranslation();

        std::cout << "\n[SUCCESS] All step translator tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Test failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
