#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "config/config_loader.hpp"
#include "config/exception.hpp"
#include "io/item_catalog.hpp"
#include "io/movielens_reader.hpp"
#include "io/recommendation_printer.hpp"
#include "logging/log_config.hpp"
#include "similarity/exception.hpp"
#include "similarity/similarity_engine.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

constexpr int NO_ITEM = -1;

/**
 * @brief Fold command line values into the loaded configuration
 *
 * Only values that differ from the argument defaults override the file.
 */
void applyCommandLine(atom::utils::ArgumentParser& program,
                      itemsim::config::AppConfig& config) {
    const itemsim::config::AppConfig defaults;

    auto cmdRatings = program.get<std::string>("ratings");
    auto cmdItems = program.get<std::string>("items");
    auto cmdMinRating = program.get<int>("min-rating");
    auto cmdWorkers = program.get<int>("workers");
    auto cmdTop = program.get<int>("top");
    auto cmdLogLevel = program.get<std::string>("log-level");

    if (cmdRatings && !cmdRatings->empty() &&
        *cmdRatings != defaults.data.ratingsPath) {
        config.data.ratingsPath = *cmdRatings;
        spdlog::debug("CLI override: ratings path = {}", *cmdRatings);
    }
    if (cmdItems && !cmdItems->empty() &&
        *cmdItems != defaults.data.itemsPath) {
        config.data.itemsPath = *cmdItems;
        spdlog::debug("CLI override: items path = {}", *cmdItems);
    }
    if (cmdMinRating && *cmdMinRating != defaults.similarity.minRating) {
        config.similarity.minRating = *cmdMinRating;
        spdlog::debug("CLI override: min rating = {}", *cmdMinRating);
    }
    if (cmdWorkers && *cmdWorkers != defaults.similarity.workerCount) {
        config.similarity.workerCount = *cmdWorkers;
        spdlog::debug("CLI override: workers = {}", *cmdWorkers);
    }
    if (cmdTop && *cmdTop != defaults.query.topN) {
        config.query.topN = *cmdTop;
        spdlog::debug("CLI override: top = {}", *cmdTop);
    }
    if (cmdLogLevel && !cmdLogLevel->empty() &&
        *cmdLogLevel != defaults.logging.consoleLevel) {
        config.logging.consoleLevel = *cmdLogLevel;
        spdlog::debug("CLI override: log level = {}", *cmdLogLevel);
    }
}

auto loadConfiguration(atom::utils::ArgumentParser& program)
    -> itemsim::config::AppConfig {
    auto cmdConfigPath = program.get<std::string>("config");
    if (cmdConfigPath && !cmdConfigPath->empty()) {
        return itemsim::config::loadConfigFile(*cmdConfigPath);
    }

    for (const fs::path path : {"itemsim.json"s, "config/itemsim.json"s}) {
        if (fs::exists(path)) {
            spdlog::info("Loading configuration from: {}", path.string());
            return itemsim::config::loadConfigFile(path);
        }
    }

    spdlog::debug("No configuration file found, using defaults");
    return {};
}

int run(const itemsim::config::AppConfig& config, int itemId) {
    auto catalog = itemsim::io::loadItemCatalog(
        config.data.itemsPath, config.data.itemsDelimiter.front());
    if (!catalog) {
        spdlog::error("{}", catalog.error());
        return 1;
    }

    itemsim::io::RatingFileFormat format;
    format.delimiter = config.data.ratingsDelimiter.front();
    auto source =
        itemsim::io::MovieLensRatingSource::open(config.data.ratingsPath, format);
    if (!source) {
        spdlog::error("{}", source.error());
        return 1;
    }

    itemsim::similarity::ItemSimilarityEngine engine(
        config.similarity.toOptions());
    engine.build(**source);
    spdlog::info("{}", engine.getStats());

    if (!catalog->contains(itemId)) {
        spdlog::warn("Item {} is not in the catalog", itemId);
    }

    auto result = engine.recommend(itemId, config.query.toOptions());
    itemsim::io::RecommendationPrinter printer(*catalog);
    printer.print(std::cout, itemId, result);
    return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    atom::utils::ArgumentParser program("ItemSim"s);

    // NOTE: The command arguments' priority is higher than the config file
    program.addArgument("item", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, NO_ITEM, "Item to find similar items for",
                        {"i"});
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to the JSON config file", {"c"});
    program.addArgument("ratings",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        "data/ml-100k/u.data"s, "Path to the ratings file",
                        {"r"});
    program.addArgument("items", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "data/ml-100k/u.item"s,
                        "Path to the item catalog", {"n"});
    program.addArgument("min-rating",
                        atom::utils::ArgumentParser::ArgType::INTEGER, false, 3,
                        "Lowest rating that counts as a positive signal");
    program.addArgument("workers",
                        atom::utils::ArgumentParser::ArgType::INTEGER, false, 0,
                        "Aggregation workers (0 = hardware concurrency)",
                        {"w"});
    program.addArgument("top", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, 10, "Results per list", {"t"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        "info"s, "Log level (trace/debug/info/warn/error)",
                        {"l"});

    program.addDescription("ItemSim item-item similarity:");
    program.addEpilog("End.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    auto itemId = program.get<int>("item").value_or(NO_ITEM);
    if (itemId == NO_ITEM) {
        std::cout << "Item ID not provided!\n"
                  << "Please enter a valid item ID with --item and run the "
                     "program again.\n";
        return 1;
    }

    try {
        auto config = loadConfiguration(program);
        applyCommandLine(program, config);
        if (auto result = config.validate(); !result) {
            throw itemsim::config::ConfigValidationException(
                "Invalid command line value: " + result.toString());
        }

        itemsim::logging::LogConfig::initialize(
            itemsim::logging::LoggerConfig::fromSection(config.logging));

        return run(config, itemId);
    } catch (const itemsim::config::BadConfigException& e) {
        spdlog::error("Configuration error: {}", e.what());
    } catch (const itemsim::similarity::MalformedInputException& e) {
        spdlog::error("Malformed input: {}", e.what());
    } catch (const itemsim::similarity::AggregationOverflowException& e) {
        spdlog::error("Aggregation overflow: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
    }
    itemsim::logging::LogConfig::flushAll();
    return 1;
}
