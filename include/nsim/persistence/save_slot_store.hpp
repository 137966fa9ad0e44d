#pragma once

/// @file save_slot_store.hpp
/// @brief Fixed number of named save slots stored as YAML files.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nsim/foundation/game_result.hpp"
#include "nsim/game/session_state.hpp"

namespace nsim::persistence {

struct SaveSlotConfig {
    std::filesystem::path directory = "saves";
    std::size_t slotCount = 5;
};

/// Header of one slot. Empty slots only carry their index.
struct SlotInfo {
    std::size_t index = 0;
    bool occupied = false;
    std::string name;
    std::string saveDate;  ///< ISO-8601, UTC.
    int64_t savedAtMs = 0;
    int day = 0;
    int period = 0;
    std::string characterName;
};

struct SaveRecord {
    SlotInfo info;
    game::SessionState state;
};

/// Slot-indexed save files (`slot_<n>.yaml`) under one directory.
///
/// Usage:
/// @code
///   SaveSlotStore saves({.directory = "saves", .slotCount = 5});
///   auto slot = saves.autoSaveSlot();
///   if (auto saved = saves.save(slot, "Auto Save", session.serialize()); !saved) {
///       NSIM_LOG_WARN(LogCategory::Persistence, saved.error().message());
///   }
///   auto record = saves.load(slot);
///   if (record) {
///       session.deserialize(record.value().state);
///   }
/// @endcode
///
/// Thread-safe: all operations use internal synchronization.
class SaveSlotStore {
public:
    explicit SaveSlotStore(SaveSlotConfig config);
    ~SaveSlotStore();

    SaveSlotStore(const SaveSlotStore&) = delete;
    SaveSlotStore& operator=(const SaveSlotStore&) = delete;

    /// Write @p state into @p slot. An empty @p name becomes "Save <slot+1>".
    [[nodiscard]] foundation::GameResult<void> save(std::size_t slot, std::string_view name,
                                                    const game::SessionState& state);

    /// @return SlotOutOfRange, SlotEmpty, LoadFailed or SnapshotInvalid on failure.
    [[nodiscard]] foundation::GameResult<SaveRecord> load(std::size_t slot) const;

    [[nodiscard]] foundation::GameResult<void> remove(std::size_t slot);

    /// One entry per slot, in slot order.
    [[nodiscard]] std::vector<SlotInfo> list() const;

    [[nodiscard]] std::optional<std::size_t> findEmptySlot() const;

    /// First empty slot, otherwise the slot with the oldest save.
    [[nodiscard]] std::size_t autoSaveSlot() const;

    /// Empty every slot.
    [[nodiscard]] foundation::GameResult<void> clear();

    [[nodiscard]] std::size_t slotCount() const noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept;

    /// Standalone snapshot text for sharing or backup.
    [[nodiscard]] static std::string exportState(const game::SessionState& state);

    [[nodiscard]] static foundation::GameResult<game::SessionState> importState(
        std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace nsim::persistence
