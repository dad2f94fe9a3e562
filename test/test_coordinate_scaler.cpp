#include <iostream>
#include <cassert>
#include <limits>
#include <string>
#include "coordinate/coordinate_scaler.h"
#include "common/error_handler.h"
#include "test_helpers.h"

using namespace marionette;
using marionette::test::expectThrows;

void testLinearScaling() {
    std::cout << "\n[TEST] Linear Scaling\n";

    CoordinateScaler scaler(1000, 1000, 1920, 1080);
    auto point = scaler.scale(500, 300);
    assert(point.first == 960);
    assert(point.second == 324);

    CoordinateScaler xga(1024, 768, 1920, 1080);
    auto centre = xga.scale(512, 384);
    assert(centre.first == 960);
    assert(centre.second == 540);

    std::cout << "[PASS] (500, 300) in 0-1000 maps to (960, 324) on 1920x1080\n";
}

void testClamping() {
    std::cout << "\n[TEST] Boundary Clamping\n";

    CoordinateScaler scaler(1000, 1000, 1920, 1080);

    auto far = scaler.scale(1000, 1000);
    assert(far.first == 1919);
    assert(far.second == 1079);

    auto negative = scaler.scale(-50, -1);
    assert(negative.first == 0);
    assert(negative.second == 0);

    auto unclamped = scaler.scale(1000, 1000, false);
    assert(unclamped.first == 1920);
    assert(unclamped.second == 1080);

    std::cout << "[PASS] Results stay within [0, target-1] unless clamping is off\n";
}

void testTiesToEven() {
    std::cout << "\n[TEST] Ties-to-even Rounding\n";

    CoordinateScaler scaler(4, 4, 2, 2);
    assert(scaler.scale(1, 1, false).first == 0);   // 0.5
    assert(scaler.scale(3, 3, false).first == 2);   // 1.5
    assert(scaler.scale(5, 5, false).first == 2);   // 2.5

    std::cout << "[PASS] Halfway values round to the even neighbour\n";
}

void testCornerLockPrevention() {
    std::cout << "\n[TEST] Corner Lock Prevention\n";

    CoordinateScaler scaler(1000, 1000, 1920, 1080);

    auto topLeft = scaler.scale(0, 0, true, true);
    assert(topLeft.first == 1);
    assert(topLeft.second == 1);

    auto bottomRight = scaler.scale(1000, 1000, true, true);
    assert(bottomRight.first == 1918);
    assert(bottomRight.second == 1078);

    auto inside = scaler.scale(500, 500, true, true);
    assert(inside.first == 960);
    assert(inside.second == 540);

    std::cout << "[PASS] Border pixels move one pixel inward\n";
}

void testStrictValidation() {
    std::cout << "\n[TEST] Strict Range Validation\n";

    CoordinateScaler scaler(1000, 1000, 1920, 1080);

    auto edge = scaler.scale(1000, 0, true, false, true);
    assert(edge.first == 1919);

    assert(expectThrows<CoordinateRangeError>([&]() { scaler.scale(1001, 10, true, false, true); }));
    assert(expectThrows<CoordinateRangeError>([&]() { scaler.scale(10, -0.5, true, false, true); }));

    try {
        scaler.scale(1500, 10, true, false, true);
        assert(false);
    } catch (const CoordinateRangeError& e) {
        std::string message = e.what();
        assert(message.find("x coordinate 1500.0 out of valid range [0, 1000]") != std::string::npos);
        assert(e.getType() == ErrorType::COORDINATE_RANGE_ERROR);
    }

    std::cout << "[PASS] Out-of-range inputs raise before scaling\n";
}

void testExtremeInputs() {
    std::cout << "\n[TEST] Extreme Inputs\n";

    CoordinateScaler scaler(1000, 1000, 1920, 1080);

    auto huge = scaler.scale(1e12, 500);
    assert(huge.first == 1919);
    assert(huge.second == 540);

    auto hugeNegative = scaler.scale(-1e12, -1e300);
    assert(hugeNegative.first == 0);
    assert(hugeNegative.second == 0);

    auto unclamped = scaler.scale(1e12, -1e12, false);
    assert(unclamped.first == std::numeric_limits<int>::max());
    assert(unclamped.second == std::numeric_limits<int>::min());

    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    assert(expectThrows<CoordinateRangeError>([&]() { scaler.scale(nan, 5); }));
    assert(expectThrows<CoordinateRangeError>([&]() { scaler.scale(5, inf); }));
    assert(expectThrows<CoordinateRangeError>([&]() { scaler.scale(-inf, 5, false); }));

    std::cout << "[PASS] Huge values clamp or saturate, non-finite values raise\n";
}

void testReconfiguration() {
    std::cout << "\n[TEST] Runtime Reconfiguration\n";

    CoordinateScaler scaler(1000, 1000, 1920, 1080);
    scaler.setOrigin(1920, 0);
    auto onSecond = scaler.scale(500, 300);
    assert(onSecond.first == 2880);
    assert(onSecond.second == 324);

    scaler.setTargetSize(1000, 500);
    assert(scaler.getScaleX() == 1.0);
    assert(scaler.getScaleY() == 0.5);

    Screen screen;
    screen.name = "left";
    screen.x = -1280;
    screen.y = 0;
    screen.width = 1280;
    screen.height = 1024;
    scaler.applyScreen(screen);
    auto onLeft = scaler.scale(500, 500);
    assert(onLeft.first == -640);
    assert(onLeft.second == 512);

    assert(expectThrows<MarionetteException>([&]() { scaler.setTargetSize(0, 100); }));
    assert(expectThrows<MarionetteException>([]() { CoordinateScaler bad(0, 1000, 1920, 1080); }));

    std::cout << "[PASS] Target size and origin change in place\n";
}

int main() {
    std::cout << "=== Marionette Coordinate Scaler Test ===\n";

    try {
        testLinearScaling();
        testClamping();
        testTiesToEven();
        testCornerLockPrevention();
        testStrictValidation();
        testExtremeInputs();
        testReconfiguration();

        std::cout << "\n[SUCCESS] All coordinate scaler tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Test failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
