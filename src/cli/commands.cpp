#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "agent/agent_loop.hpp"
#include "agent/tools/default_tools.hpp"
#include "config/config_loader.hpp"
#include "providers/llm_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

struct CliOptions {
    std::optional<int> max_steps;
    std::string model;
    bool show_history = false;
    std::string query;
};

void PrintUsage() {
    std::cout << "Usage: reagent_cli [--max-steps N] [--model NAME] [--history] [\"question\"]\n"
              << "Without a question, reads one task per line. Commands: /new, /history, /quit"
              << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--max-steps" && i + 1 < argc) {
            try {
                options.max_steps = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cout << "Invalid value for --max-steps: " << argv[i] << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--model" && i + 1 < argc) {
            options.model = argv[++i];
        } else if (arg == "--history") {
            options.show_history = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cout << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else if (options.query.empty()) {
            options.query = arg;
        } else {
            options.query += " " + arg;
        }
    }
    return options;
}

int RunInteractive(reagent::agent::AgentLoop& agent, int max_steps) {
    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        const auto content = reagent::utils::Trim(line);
        if (content == "/quit" || content == "/exit") {
            break;
        }
        if (content == "/new") {
            agent.Reset();
            std::cout << "Started a new conversation." << std::endl;
        } else if (content == "/history") {
            std::cout << agent.MessageHistory() << std::endl;
        } else if (!content.empty()) {
            try {
                std::cout << agent.Task(content, max_steps) << std::endl;
            } catch (const reagent::providers::TransportError& ex) {
                std::cout << "Error: " << ex.what() << std::endl;
            }
        }
        std::cout << "> " << std::flush;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }

    auto config = reagent::config::LoadConfig();
    reagent::utils::LogConfig log_config{};
    log_config.min_level = reagent::utils::ParseLogLevel(config.logging.level, log_config.min_level);
    reagent::utils::SetLogConfig(log_config);

    if (!options->model.empty()) {
        config.agent.model = options->model;
    }
    const int max_steps = options->max_steps.value_or(config.agent.max_steps);

    auto provider = reagent::providers::CreateProvider(config);
    reagent::agent::AgentLoop agent(
        *provider,
        config.agent.model,
        reagent::agent::tools::CreateDefaultTools(config));

    if (options->query.empty()) {
        return RunInteractive(agent, max_steps);
    }

    try {
        std::cout << agent.Task(options->query, max_steps) << std::endl;
    } catch (const reagent::providers::TransportError& ex) {
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }
    if (options->show_history) {
        std::cout << "\n" << agent.MessageHistory() << std::endl;
    }
    return 0;
}
