/// @file main.cpp
/// @brief Headless runner entry point.
///
/// Loads configuration and content, plays one seeded run to completion
/// picking options with the run's random source, and prints the ending.

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "nsim/content/content_loader.hpp"
#include "nsim/director/game_director.hpp"
#include "nsim/foundation/config_manager.hpp"
#include "nsim/foundation/game_logger.hpp"
#include "nsim/foundation/random_source.hpp"
#include "nsim/game/game_config.hpp"
#include "nsim/game/game_session.hpp"
#include "nsim/persistence/save_slot_store.hpp"

namespace {

std::string_view argValue(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

nsim::content::ContentPaths buildContentPaths(const nsim::foundation::ConfigManager& config) {
    nsim::content::ContentPaths paths;
    paths.events = config.getOr<std::string>("content.events", "data/content/events.yaml");
    paths.endings = config.getOr<std::string>("content.endings", "data/content/endings.yaml");
    paths.characters =
        config.getOr<std::string>("content.characters", "data/content/characters.yaml");
    return paths;
}

nsim::persistence::SaveSlotConfig buildSaveConfig(const nsim::foundation::ConfigManager& config) {
    nsim::persistence::SaveSlotConfig cfg;

    auto directory = config.get<std::string>("saves.directory");
    if (directory) {
        cfg.directory = directory.value();
    }

    auto slots = config.get<std::size_t>("saves.slots");
    if (slots) {
        cfg.slotCount = slots.value();
    }

    return cfg;
}

/// Uniform pick among the options that can be chosen.
std::optional<std::size_t> pickOption(const std::vector<nsim::game::OptionView>& views,
                                      nsim::foundation::RandomSource& random) {
    std::vector<std::size_t> choosable;
    for (const auto& view : views) {
        if (view.available) {
            choosable.push_back(view.index);
        }
    }
    if (choosable.empty()) {
        return std::nullopt;
    }
    auto pick = random.uniformInt(0, static_cast<int64_t>(choosable.size()) - 1);
    return choosable[static_cast<std::size_t>(pick)];
}

}  // namespace

int main(int argc, char* argv[]) {
    using nsim::foundation::LogCategory;

    std::string configPath(argValue(argc, argv, "--config"));
    if (configPath.empty()) {
        configPath = "config/nsim.yaml";
    }

    nsim::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto gameCfg = nsim::game::GameConfig::fromConfig(config);
    auto seedArg = argValue(argc, argv, "--seed");
    if (!seedArg.empty()) {
        uint64_t seed = 0;
        auto [end, ec] = std::from_chars(seedArg.data(), seedArg.data() + seedArg.size(), seed);
        if (ec != std::errc() || end != seedArg.data() + seedArg.size()) {
            std::cerr << "Invalid seed: " << seedArg << "\n";
            return EXIT_FAILURE;
        }
        gameCfg.seed = seed;
    }

    nsim::content::LoaderOptions loaderOptions;
    loaderOptions.defaultEventWeight =
        config.getOr<int>("game.default_event_weight", loaderOptions.defaultEventWeight);
    nsim::content::ContentLoader loader(loaderOptions);
    auto content = loader.loadCatalog(buildContentPaths(config));
    if (!content) {
        std::cerr << "Failed to load content: " << content.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& catalog = content.value();

    nsim::foundation::SeededRandomSource random =
        gameCfg.seed ? nsim::foundation::SeededRandomSource(*gameCfg.seed)
                     : nsim::foundation::SeededRandomSource();

    nsim::game::GameSession session(gameCfg, catalog, random);

    std::string characterId(argValue(argc, argv, "--character"));
    if (characterId.empty() && !catalog.characters.empty()) {
        const auto& roster = catalog.characters.entries();
        characterId = roster[static_cast<std::size_t>(
                                 random.uniformInt(0, static_cast<int64_t>(roster.size()) - 1))]
                          .id;
    }
    if (characterId.empty()) {
        session.startNewRun(std::nullopt);
    } else {
        auto started = session.startNewRunAs(characterId);
        if (!started) {
            std::cerr << "Failed to start run: " << started.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    std::optional<nsim::persistence::SaveSlotStore> saves;
    if (config.hasKey("saves.directory")) {
        saves.emplace(buildSaveConfig(config));
    }
    nsim::director::DirectorOptions directorOptions;
    directorOptions.autoSave = config.getOr<bool>("saves.auto_save", directorOptions.autoSave);
    nsim::director::GameDirector director(session, saves ? &*saves : nullptr, directorOptions);

    std::cout << "Run started (seed: " << random.seed()
              << ", character: " << (characterId.empty() ? "none" : characterId) << ")\n";

    auto event = director.begin();
    while (event && !director.finished()) {
        auto views = director.options();
        if (!views) {
            std::cerr << "No options: " << views.error().message() << "\n";
            return EXIT_FAILURE;
        }
        auto pick = pickOption(views.value(), random);
        if (!pick) {
            NSIM_LOG_ERROR(LogCategory::Director,
                           "Event " + director.currentEvent()->id + " has no choosable option");
            std::cerr << "Event " << director.currentEvent()->id
                      << " has no choosable option\n";
            return EXIT_FAILURE;
        }

        std::cout << session.clock().describe() << ": " << director.currentEvent()->title
                  << " -> " << director.currentEvent()->options[*pick].text << "\n";

        auto turn = director.choose(*pick);
        if (!turn) {
            std::cerr << "Turn failed: " << turn.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    const auto& ending = director.ending();
    if (!ending) {
        std::cerr << "Run ended without an ending\n";
        return EXIT_FAILURE;
    }

    std::cout << "\nEnding: " << ending->title << " ["
              << nsim::game::endingCategoryName(ending->category) << "]\n"
              << "Score: " << ending->score << "\n";
    for (const auto& line : ending->summary) {
        std::cout << "  " << line << "\n";
    }

    auto flushed = nsim::foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
