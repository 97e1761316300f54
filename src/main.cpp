#include "core/AutoGardener.h"
#include "core/Errors.h"
#include "core/GameSettings.h"
#include "core/GardenWorld.h"
#include "core/LoggingChannels.h"
#include "core/plants/Catalog.h"
#include <args.hxx>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

using namespace GardenSim;

int main(int argc, char** argv)
{
    // Parse command line arguments.
    args::ArgumentParser parser(
        "Garden Sim", "Headless garden simulation: plant, grow, harvest and sell.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<int> stepsArg(
        parser, "steps", "Number of simulation steps to run (default: 3600)", { 's', "steps" });
    args::ValueFlag<double> dtArg(
        parser, "dt", "Seconds of simulated time per step (default: 0.1)", { "dt" });
    args::ValueFlag<std::string> settingsArg(
        parser, "settings", "Path to a game settings JSON override", { "settings" });
    args::ValueFlag<std::string> catalogArg(
        parser, "catalog", "Path to a catalog JSON file (default: built-in)", { "catalog" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., field:trace,economy:debug,*:off)",
        { 'C', "channels" });
    args::ValueFlag<uint32_t> seedArg(
        parser, "seed", "RNG seed (overrides settings; 0 = random)", { "seed" });
    args::Flag autoplay(
        parser, "autoplay", "Let a scripted gardener play the game", { "autoplay" });
    args::Flag printStatus(
        parser, "print-status", "Print the world status as JSON on exit", { "print-status" });
    args::Flag dumpCatalog(
        parser, "dump-catalog", "Print the catalog as JSON and exit", { "dump-catalog" });

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

    const int maxSteps = stepsArg ? args::get(stepsArg) : 3600;
    const double dt = dtArg ? args::get(dtArg) : 0.1;

    // Initialize logging from config file (supports .local override).
    std::string configPath = logConfig ? args::get(logConfig) : "logging-config.json";
    LoggingChannels::initializeFromConfig(configPath);

    // Apply command line channel overrides if provided.
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        spdlog::info("Applied channel overrides: {}", args::get(logChannels));
    }

    if (dt <= 0.0 || maxSteps < 0) {
        spdlog::critical("--dt must be positive and --steps must not be negative");
        return 1;
    }

    std::optional<Catalog> catalog;
    std::unique_ptr<GardenWorld> world;
    try {
        GameSettings settings =
            settingsArg ? loadGameSettings(args::get(settingsArg)) : getDefaultGameSettings();
        if (seedArg) {
            settings.rng_seed = args::get(seedArg);
        }

        catalog.emplace(
            catalogArg ? Catalog::loadFromFile(args::get(catalogArg)) : Catalog::createDefault());

        if (dumpCatalog) {
            std::cout << catalog->toJson().dump(2) << std::endl;
            return 0;
        }

        world = std::make_unique<GardenWorld>(settings, *catalog);
    }
    catch (const ConfigError& e) {
        LoggingChannels::config()->critical("Configuration error: {}", e.what());
        return 1;
    }

    std::unique_ptr<AutoGardener> gardener;
    if (autoplay) {
        gardener = std::make_unique<AutoGardener>(*world);
    }

    spdlog::info("Running {} steps of {}s", maxSteps, dt);
    for (int step = 0; step < maxSteps; ++step) {
        if (gardener) {
            gardener->tick();
        }
        world->step(dt);
    }

    spdlog::info(
        "Finished after {:.1f}s: wallet ${:.2f}, {} cultivars in the field",
        world->getElapsedSeconds(),
        world->getProgression().getMoney(),
        world->getField().count());
    if (gardener) {
        spdlog::info(
            "Autoplay harvested {} and earned ${:.2f}",
            gardener->getHarvestedCount(),
            gardener->getEarned());
    }

    if (printStatus) {
        std::cout << world->statusJson().dump(2) << std::endl;
    }

    return 0;
}
