#ifndef MARIONETTE_TEST_HELPERS_H
#define MARIONETTE_TEST_HELPERS_H

#include <string>
#include <vector>
#include "converters/action_converter.h"

namespace marionette {
namespace test {

// True when fn throws E; any other exception escapes to the test's main()
template <typename E, typename F>
bool expectThrows(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

inline std::vector<std::string> commandsOf(const std::vector<ConvertedCommand>& converted) {
    std::vector<std::string> commands;
    for (const auto& c : converted) {
        commands.push_back(c.command);
    }
    return commands;
}

} // namespace test
} // namespace marionette

#endif // MARIONETTE_TEST_HELPERS_H
