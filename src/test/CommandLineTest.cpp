#include <cassert>
#include <iostream>

#include "app/CommandLine.hpp"

using namespace dealflow::domain;
using dealflow::app::ParseCommandLine;

int main() {
    std::cout << "[Test] Starting CommandLine Test..." << std::endl;

    {
        auto parsed = ParseCommandLine({"--config", "custom.json", "--ticks", "4", "state.json"});
        assert(IsOk(parsed));
        assert(Value(parsed).configPath == "custom.json");
        assert(Value(parsed).ticks == 4);
        assert(Value(parsed).statePath == "state.json");
        std::cout << "[PASS] Options are parsed." << std::endl;
    }

    // Bad tick counts are reported, never thrown.
    for (const char* ticks : {"abc", "0", "-2", "3x", "99999999999"}) {
        auto parsed = ParseCommandLine({"--ticks", ticks, "state.json"});
        assert(!IsOk(parsed));
        assert(Fault(parsed).kind == ErrorKind::ConfigurationError);
    }
    std::cout << "[PASS] Invalid tick counts are rejected." << std::endl;

    {
        assert(!IsOk(ParseCommandLine({})));
        assert(!IsOk(ParseCommandLine({"--ticks"})));
        assert(!IsOk(ParseCommandLine({"--verbose", "state.json"})));
        auto help = ParseCommandLine({"--help"});
        assert(IsOk(help) && Value(help).showHelp);
        std::cout << "[PASS] Missing values and unknown options are rejected." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
