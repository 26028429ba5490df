#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "app/CommandLine.hpp"
#include "application/Supervisor.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonSerialization.hpp"

using json = nlohmann::json;
using namespace dealflow;

// Runs supervisor ticks over a workflow state read from JSON and prints the result.
int main(int argc, char** argv) {
    auto parsed = app::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    if (!domain::IsOk(parsed)) {
        std::cerr << "[Supervisor] " << domain::Fault(parsed).message << std::endl;
        app::PrintUsage(argv[0]);
        return 2;
    }
    const app::CommandLineOptions& options = domain::Value(parsed);
    if (options.showHelp) {
        app::PrintUsage(argv[0]);
        return 0;
    }

    try {
        auto config = infrastructure::ConfigLoader::LoadSupervisorConfig(options.configPath);
        application::Supervisor supervisor(config);
        supervisor.initialize();

        std::ifstream in(options.statePath);
        if (!in) {
            std::cerr << "[Supervisor] Cannot open " << options.statePath << std::endl;
            return 1;
        }
        domain::AgentState state = json::parse(in).get<domain::AgentState>();

        for (int i = 0; i < options.ticks; ++i) {
            state = supervisor.processState(state);
            if (state.workflowStatus == domain::WorkflowStatus::Completed || supervisor.isAwaitingHuman()) break;
        }

        json out = {
            {"state", state},
            {"decisions", supervisor.decisionHistory()},
            {"performance", supervisor.performanceSummary()}
        };
        std::cout << out.dump(2) << std::endl;
        return supervisor.isAwaitingHuman() ? 3 : 0;
    } catch (const domain::SupervisorException& e) {
        std::cerr << "[Supervisor] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
