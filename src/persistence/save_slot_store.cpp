/// @file save_slot_store.cpp
/// @brief SaveSlotStore implementation: one YAML file per slot.

#include "nsim/persistence/save_slot_store.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "nsim/foundation/game_logger.hpp"
#include "nsim/persistence/snapshot_codec.hpp"

namespace nsim::persistence {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// ISO 8601 with millisecond precision (UTC).
std::string formatTimestamp(int64_t epochMs) {
    std::time_t tt = static_cast<std::time_t>(epochMs / 1000);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    char buf[96];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                  utc.tm_sec, static_cast<int>(epochMs % 1000));
    return buf;
}

/// Slot file layout: {name, save_date, saved_at_ms, state}.
std::string encodeSlot(const SlotInfo& info, const game::SessionState& state) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << info.name;
    out << YAML::Key << "save_date" << YAML::Value << YAML::DoubleQuoted << info.saveDate;
    out << YAML::Key << "saved_at_ms" << YAML::Value << info.savedAtMs;
    out << YAML::Key << "state" << YAML::Value;
    emitSnapshot(out, state);
    out << YAML::EndMap;
    return out.c_str();
}

void fillSummary(SlotInfo& info, const game::SessionState& state) {
    info.day = state.progress.day;
    info.period = state.progress.period;
    info.characterName = state.character ? state.character->name : std::string();
}

}  // namespace

// -- Impl -------------------------------------------------------------------

struct SaveSlotStore::Impl {
    SaveSlotConfig config;
    mutable std::mutex mutex;

    explicit Impl(SaveSlotConfig cfg) : config(std::move(cfg)) {}

    std::filesystem::path slotPath(std::size_t slot) const {
        return config.directory / ("slot_" + std::to_string(slot) + ".yaml");
    }

    GameResult<void> checkRange(std::size_t slot) const {
        if (slot >= config.slotCount) {
            return GameResult<void>::err(GameError(
                ErrorCode::SlotOutOfRange,
                "slot " + std::to_string(slot) + " out of range (" +
                    std::to_string(config.slotCount) + " slots)"));
        }
        return GameResult<void>::ok();
    }

    /// Parse a slot file. The caller holds the lock.
    GameResult<SaveRecord> read(std::size_t slot) const {
        const auto path = slotPath(slot);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return GameResult<SaveRecord>::err(
                GameError(ErrorCode::SlotEmpty, "slot " + std::to_string(slot) + " is empty"));
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::Exception& e) {
            return GameResult<SaveRecord>::err(GameError(
                ErrorCode::LoadFailed, "cannot read save file " + path.string() + ": " + e.what()));
        }
        if (!root.IsMap()) {
            return GameResult<SaveRecord>::err(
                GameError(ErrorCode::LoadFailed, "save file is not a mapping: " + path.string()));
        }

        auto state = readSnapshot(root["state"]);
        if (!state) {
            return GameResult<SaveRecord>::err(state.error());
        }

        SaveRecord record;
        record.info.index = slot;
        record.info.occupied = true;
        const YAML::Node name = root["name"];
        const YAML::Node date = root["save_date"];
        const YAML::Node savedAt = root["saved_at_ms"];
        if (name && name.IsScalar()) {
            record.info.name = name.Scalar();
        }
        if (date && date.IsScalar()) {
            record.info.saveDate = date.Scalar();
        }
        if (savedAt && savedAt.IsScalar() &&
            !YAML::convert<int64_t>::decode(savedAt, record.info.savedAtMs)) {
            record.info.savedAtMs = 0;
        }
        record.state = std::move(state).value();
        fillSummary(record.info, record.state);
        return GameResult<SaveRecord>::ok(std::move(record));
    }

    /// Header for every slot; unreadable files are reported and listed empty.
    std::vector<SlotInfo> scan() const {
        std::vector<SlotInfo> slots;
        slots.reserve(config.slotCount);
        for (std::size_t i = 0; i < config.slotCount; ++i) {
            auto record = read(i);
            if (record) {
                slots.push_back(std::move(record.value().info));
                continue;
            }
            if (record.error().code() != ErrorCode::SlotEmpty) {
                NSIM_LOG_WARN(LogCategory::Persistence,
                              "Ignoring unreadable slot " + std::to_string(i) + ": " +
                                  std::string(record.error().message()));
            }
            SlotInfo empty;
            empty.index = i;
            slots.push_back(std::move(empty));
        }
        return slots;
    }
};

// -- Construction / destruction ----------------------------------------------

SaveSlotStore::SaveSlotStore(SaveSlotConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

SaveSlotStore::~SaveSlotStore() = default;

// -- Save / Load -------------------------------------------------------------

GameResult<void> SaveSlotStore::save(std::size_t slot, std::string_view name,
                                     const game::SessionState& state) {
    std::lock_guard lock(impl_->mutex);

    auto inRange = impl_->checkRange(slot);
    if (!inRange) {
        return inRange;
    }

    std::error_code ec;
    std::filesystem::create_directories(impl_->config.directory, ec);
    if (ec) {
        return GameResult<void>::err(GameError(
            ErrorCode::SaveFailed, "failed to create save directory: " + ec.message()));
    }

    SlotInfo info;
    info.index = slot;
    info.occupied = true;
    info.name = name.empty() ? "Save " + std::to_string(slot + 1) : std::string(name);
    info.savedAtMs = nowMillis();
    info.saveDate = formatTimestamp(info.savedAtMs);

    const auto path = impl_->slotPath(slot);
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return GameResult<void>::err(
            GameError(ErrorCode::SaveFailed, "cannot open save file for writing: " + path.string()));
    }
    file << encodeSlot(info, state) << '\n';
    file.flush();
    if (!file) {
        return GameResult<void>::err(
            GameError(ErrorCode::SaveFailed, "failed to write save file: " + path.string()));
    }

    NSIM_LOG_INFO(LogCategory::Persistence,
                  "Saved slot " + std::to_string(slot) + " (" + info.name + ")");
    return GameResult<void>::ok();
}

GameResult<SaveRecord> SaveSlotStore::load(std::size_t slot) const {
    std::lock_guard lock(impl_->mutex);

    auto inRange = impl_->checkRange(slot);
    if (!inRange) {
        return GameResult<SaveRecord>::err(inRange.error());
    }
    return impl_->read(slot);
}

GameResult<void> SaveSlotStore::remove(std::size_t slot) {
    std::lock_guard lock(impl_->mutex);

    auto inRange = impl_->checkRange(slot);
    if (!inRange) {
        return inRange;
    }

    std::error_code ec;
    std::filesystem::remove(impl_->slotPath(slot), ec);
    if (ec) {
        return GameResult<void>::err(
            GameError(ErrorCode::SaveFailed, "failed to delete save: " + ec.message()));
    }
    return GameResult<void>::ok();
}

// -- Queries -----------------------------------------------------------------

std::vector<SlotInfo> SaveSlotStore::list() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->scan();
}

std::optional<std::size_t> SaveSlotStore::findEmptySlot() const {
    std::lock_guard lock(impl_->mutex);
    for (const auto& info : impl_->scan()) {
        if (!info.occupied) {
            return info.index;
        }
    }
    return std::nullopt;
}

std::size_t SaveSlotStore::autoSaveSlot() const {
    std::lock_guard lock(impl_->mutex);
    const auto slots = impl_->scan();

    std::optional<std::size_t> oldest;
    for (const auto& info : slots) {
        if (!info.occupied) {
            return info.index;
        }
        if (!oldest || info.savedAtMs < slots[*oldest].savedAtMs) {
            oldest = info.index;
        }
    }
    return oldest.value_or(0);
}

GameResult<void> SaveSlotStore::clear() {
    std::lock_guard lock(impl_->mutex);

    for (std::size_t i = 0; i < impl_->config.slotCount; ++i) {
        std::error_code ec;
        std::filesystem::remove(impl_->slotPath(i), ec);
        if (ec) {
            return GameResult<void>::err(
                GameError(ErrorCode::SaveFailed, "failed to clear saves: " + ec.message()));
        }
    }
    return GameResult<void>::ok();
}

std::size_t SaveSlotStore::slotCount() const noexcept {
    return impl_->config.slotCount;
}

const std::filesystem::path& SaveSlotStore::directory() const noexcept {
    return impl_->config.directory;
}

std::string SaveSlotStore::exportState(const game::SessionState& state) {
    return encodeSnapshot(state);
}

GameResult<game::SessionState> SaveSlotStore::importState(std::string_view text) {
    return decodeSnapshot(text);
}

}  // namespace nsim::persistence
