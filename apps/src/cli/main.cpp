#include "EvolveRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/problems/ProblemRegistry.h"
#include "core/vm/ProgramText.h"
#include "core/vm/VirtualMachine.h"
#include <args.hxx>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

using namespace StackEvo;

// CLI commands.
struct CliCommandInfo {
    std::string name;
    std::string description;
};

static const std::vector<CliCommandInfo> CLI_COMMANDS = {
    { "evolve", "Evolve a program for a built-in problem" },
    { "problems", "List built-in problems" },
    { "run", "Execute one program on the VM and print the outcome" },
};

std::string buildCliCommandHelp()
{
    std::string help = "Commands:\n";
    for (const auto& cmd : CLI_COMMANDS) {
        help += "  " + cmd.name + " - " + cmd.description + "\n";
    }
    return help;
}

std::string getExamplesHelp()
{
    std::string help = buildCliCommandHelp();
    help += "\nExamples:\n";
    help += "  stackevo-cli problems\n";
    help += "  stackevo-cli evolve add --generations 50 --seed 7\n";
    help += "  stackevo-cli evolve fibonacci --config fib.json --workers 0\n";
    help += "  stackevo-cli run \"PUSH 2; PUSH 3; ADD\"\n";
    help += "  stackevo-cli run \"ADD; HALT\" --stack 2,3\n";
    return help;
}

// Parses "2,3,-1" into stack values, bottom first.
std::optional<std::vector<Value>> parseStackList(const std::string& text)
{
    std::vector<Value> values;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = text.find(',', begin);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string item = text.substr(begin, end - begin);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            Value value = 0;
            const auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), value);
            if (ec != std::errc() || ptr != item.data() + item.size()) {
                return std::nullopt;
            }
            values.push_back(value);
        }
        begin = end + 1;
    }
    return values;
}

Result<EvolutionConfig, std::string> loadConfig(const std::string& source)
{
    if (std::filesystem::exists(source)) {
        return ConfigLoader::loadFromPath<EvolutionConfig>(source);
    }
    return ConfigLoader::load<EvolutionConfig>(source);
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "StackEvo CLI", "Evolve and run stack machine programs.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Per-channel log levels, e.g. \"evolution:debug,vm:trace\"",
        { "log-channels" });
    args::ValueFlag<std::string> logFile(
        parser, "file", "Also write logs (debug and up) to this file", { "log-file" });

    // Evolve flags.
    args::ValueFlag<std::string> configFile(
        parser, "file", "Evolve: JSON config (path, or name in the config search path)", { "config" });
    args::ValueFlag<int> population(parser, "N", "Evolve: population size", { "population" });
    args::ValueFlag<int> generations(parser, "N", "Evolve: max generations", { "generations" });
    args::ValueFlag<uint64_t> seed(parser, "N", "Evolve: run seed", { "seed" });
    args::ValueFlag<double> mutationRate(
        parser, "R", "Evolve: per-offspring mutation probability", { "mutation-rate" });
    args::ValueFlag<double> crossoverRate(
        parser, "R", "Evolve: per-pair crossover probability", { "crossover-rate" });
    args::ValueFlag<int> elite(parser, "N", "Evolve: elites carried per generation", { "elite" });
    args::ValueFlag<int> immigrants(
        parser, "N", "Evolve: fresh random programs per generation", { "immigrants" });
    args::ValueFlag<int> tournament(parser, "N", "Evolve: tournament size", { "tournament" });
    args::ValueFlag<std::string> selection(
        parser, "strategy", "Evolve: 'tournament' or 'roulette'", { "selection" });
    args::ValueFlag<int> stagnation(
        parser, "N", "Evolve: stop after N generations without improvement", { "stagnation" });
    args::ValueFlag<double> threshold(
        parser, "F", "Evolve: stop once best fitness reaches F", { "threshold" });
    args::ValueFlag<int> workers(
        parser, "N", "Evolve: parallel evaluations (0 = all cores)", { "workers" });

    // Run flags.
    args::ValueFlag<std::string> stack(
        parser, "values", "Run: initial stack, bottom first (e.g. 2,3)", { "stack" });
    args::ValueFlag<int> steps(parser, "N", "Run: step limit (default: 1000)", { "steps" }, 1000);

    args::Positional<std::string> command(parser, "command", "evolve, run, or problems");
    args::Positional<std::string> argument(
        parser, "argument", "Problem name for evolve, program text for run");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Channel levels do the filtering; the console sink passes everything they let through.
    LoggingOptions loggingOptions;
    loggingOptions.consoleLevel = spdlog::level::trace;
    if (logFile) {
        loggingOptions.logFile = args::get(logFile);
    }
    LoggingChannels::initialize(loggingOptions);

    if (verbose) {
        for (const LogChannelInfo& info : kLogChannels) {
            LoggingChannels::setChannelLevel(info.channel, spdlog::level::debug);
        }
    }
    if (logChannels) {
        auto configured = LoggingChannels::configureFromString(args::get(logChannels));
        if (configured.isError()) {
            std::cerr << "Error: " << configured.errorValue() << std::endl;
            return 1;
        }
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);
    const ProblemRegistry registry = ProblemRegistry::createDefault();

    if (commandName == "problems") {
        for (const auto& name : registry.names()) {
            auto problem = registry.create(name);
            std::cout << name << " - " << problem->description() << " ("
                      << problem->testCases().size() << " cases)\n";
        }
        return 0;
    }

    if (commandName == "run") {
        if (!argument) {
            std::cerr << "Error: program text is required for run\n";
            return 1;
        }

        auto program = parseProgram(args::get(argument));
        if (program.isError()) {
            const auto& error = program.errorValue();
            std::cerr << "Error: " << error.message;
            if (error.instructionIndex >= 0) {
                std::cerr << " (instruction " << error.instructionIndex << ")";
            }
            std::cerr << std::endl;
            return 1;
        }

        std::vector<Value> initialStack;
        if (stack) {
            auto parsed = parseStackList(args::get(stack));
            if (!parsed.has_value()) {
                std::cerr << "Error: --stack expects comma-separated integers" << std::endl;
                return 1;
            }
            initialStack = parsed.value();
        }

        VirtualMachine vm(VmLimits{ .stepLimit = args::get(steps) });
        const ExecutionResult result =
            vm.execute(program.value(), MachineState::withStack(initialStack));

        nlohmann::json output;
        output["outcome"] = toString(result.outcome);
        if (result.fault.has_value()) {
            output["fault"] = toString(result.fault.value());
            output["faultIndex"] = result.faultIndex;
        }
        if (auto top = result.topOfStack()) {
            output["topOfStack"] = top.value();
        }
        else {
            output["topOfStack"] = nullptr;
        }
        output["stack"] = result.finalState.stack;
        output["steps"] = result.steps();
        std::cout << output.dump(2) << std::endl;
        return 0;
    }

    if (commandName == "evolve") {
        if (!argument) {
            std::cerr << "Error: problem name is required for evolve\n";
            return 1;
        }

        auto problem = registry.create(args::get(argument));
        if (!problem) {
            std::cerr << "Error: unknown problem '" << args::get(argument) << "'\n";
            return 1;
        }

        EvolutionConfig config;
        if (configFile) {
            auto loaded = loadConfig(args::get(configFile));
            if (loaded.isError()) {
                std::cerr << "Error: " << loaded.errorValue() << std::endl;
                return 1;
            }
            config = loaded.value();
        }

        if (population) config.populationSize = args::get(population);
        if (generations) config.maxGenerations = args::get(generations);
        if (seed) config.seed = args::get(seed);
        if (mutationRate) config.mutationRate = args::get(mutationRate);
        if (crossoverRate) config.crossoverRate = args::get(crossoverRate);
        if (elite) config.eliteCount = args::get(elite);
        if (immigrants) config.immigrantCount = args::get(immigrants);
        if (tournament) config.tournamentSize = args::get(tournament);
        if (stagnation) config.stagnationWindow = args::get(stagnation);
        if (threshold) config.fitnessThreshold = args::get(threshold);
        if (workers) config.maxParallelEvaluations = args::get(workers);
        if (selection) {
            auto strategy = selectionStrategyFromString(args::get(selection));
            if (!strategy.has_value()) {
                std::cerr << "Error: unknown selection strategy '" << args::get(selection)
                          << "'\n";
                return 1;
            }
            config.selectionStrategy = strategy.value();
        }

        LOG_DEBUG(Cli, "Config: {}", ReflectSerializer::to_json(config).dump());

        Client::EvolveRunner runner;

        // Install SIGINT handler for graceful shutdown.
        // Note: Must use C-style function pointer, not lambda.
        static Client::EvolveRunner* g_runner = nullptr;
        static auto sigintHandler = +[](int) -> void {
            if (g_runner) {
                g_runner->requestStop();
            }
        };

        g_runner = &runner;
        auto oldHandler = std::signal(SIGINT, sigintHandler);

        auto results = runner.run(config, *problem);

        std::signal(SIGINT, oldHandler);
        g_runner = nullptr;

        if (!results.completed) {
            std::cerr << "Error: " << results.errorMessage << std::endl;
            return 1;
        }

        nlohmann::json output = ReflectSerializer::to_json(results);
        std::cout << output.dump(2) << std::endl;
        return 0;
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << parser;
    return 1;
}
