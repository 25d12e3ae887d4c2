#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "mockprom/ScenarioEngine.h"

using mockprom::format_duration;
using namespace std::chrono_literals;

int main() {
    std::vector<std::pair<std::chrono::nanoseconds, std::string>> cases = {
        {0s, "0s"},
        {5s, "5s"},
        {59s, "59s"},
        {65s, "1m 5s"},
        {120s, "2m 0s"},
        {3600s, "1h 0m 0s"},
        {3665s, "1h 1m 5s"},
        {26h + 3s, "26h 0m 3s"},
        {1499ms, "1s"},
        {1500ms, "2s"},
        {-3s, "0s"},
    };
    for (const auto& c : cases) {
        auto got = format_duration(c.first);
        if (got != c.second) {
            std::cerr << "format_duration(" << c.first.count() << "ns) expected '" << c.second << "' got '" << got << "'\n";
            return 1;
        }
    }
    std::cout << "duration_unit ok\n";
    return 0;
}
