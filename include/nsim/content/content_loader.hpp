#pragma once

/// @file content_loader.hpp
/// @brief Reads event, ending and character definitions from YAML.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "nsim/foundation/game_result.hpp"
#include "nsim/game/content_catalog.hpp"
#include "nsim/game/event_types.hpp"

namespace nsim::content {

/// Paths of the three content documents.
struct ContentPaths {
    std::filesystem::path events;
    std::filesystem::path endings;
    std::filesystem::path characters;
};

struct LoaderOptions {
    int32_t defaultEventWeight = game::kDefaultEventWeight;
};

/// Converts YAML content documents into catalog entries.
///
/// Each document is a mapping with one top-level list (`events`,
/// `endings` or `characters`). Missing ids are generated and logged;
/// anything the simulation cannot interpret is rejected with
/// ContentInvalid and the offending path, e.g. `events[3].options[1]`.
///
/// Example:
/// @code
///   ContentLoader loader;
///   auto catalog = loader.loadCatalog({"data/content/events.yaml",
///                                      "data/content/endings.yaml",
///                                      "data/content/characters.yaml"});
///   if (!catalog) {
///       NSIM_LOG_ERROR(LogCategory::Content, catalog.error().message());
///   }
/// @endcode
class ContentLoader {
public:
    explicit ContentLoader(LoaderOptions options = {});

    foundation::GameResult<void> loadEvents(std::string_view yaml,
                                            game::EventCatalog& into) const;
    foundation::GameResult<void> loadEndings(std::string_view yaml,
                                             game::EndingCatalog& into) const;
    foundation::GameResult<void> loadCharacters(std::string_view yaml,
                                                game::CharacterRoster& into) const;

    foundation::GameResult<void> loadEventsFile(const std::filesystem::path& path,
                                                game::EventCatalog& into) const;
    foundation::GameResult<void> loadEndingsFile(const std::filesystem::path& path,
                                                 game::EndingCatalog& into) const;
    foundation::GameResult<void> loadCharactersFile(const std::filesystem::path& path,
                                                    game::CharacterRoster& into) const;

    /// Load all three documents. An empty path leaves that catalog empty.
    foundation::GameResult<game::ContentCatalog> loadCatalog(const ContentPaths& paths) const;

    /// Parse one condition node (`type:` plus kind-specific keys).
    static foundation::GameResult<game::Condition> parseCondition(const YAML::Node& node,
                                                                  const std::string& path);

private:
    foundation::GameResult<void> readEvents(const YAML::Node& root,
                                            game::EventCatalog& into) const;
    foundation::GameResult<void> readEndings(const YAML::Node& root,
                                             game::EndingCatalog& into) const;
    foundation::GameResult<void> readCharacters(const YAML::Node& root,
                                                game::CharacterRoster& into) const;

    LoaderOptions options_;
};

}  // namespace nsim::content
