#pragma once

#include <eavdb/core/types.h>
#include <eavdb/dao/entity_store.h>

#include <array>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace eavdb::actions {

/**
 * @brief One recorded store operation: {"type": ..., "params": {...}}
 */
using Action = nlohmann::json;

inline constexpr std::array<std::string_view, 2> kActionTypes = {"update_ent", "upsert_ent"};

/**
 * @brief InvalidAction unless action is an object whose type is recognized
 */
Result<void> validateAction(const Action& action);

/**
 * @brief Writes actions as newline-delimited JSON
 */
class ActionWriter {
public:
    explicit ActionWriter(std::ostream& out) : out_(out) {}

    /**
     * @brief Validate then append each action; stops at the first invalid one
     */
    Result<void> writeActions(const std::vector<Action>& actions);

private:
    std::ostream& out_;
};

Result<void> writeActionFile(const std::vector<Action>& actions, const std::filesystem::path& dest);

/**
 * @brief Outcome of one replayed action: the entity when an upsert created it
 */
using ActionResult = std::optional<dao::Entity>;

/**
 * @brief Replays recorded actions against an EntityStore
 *
 * update_ent params: ent_key, attr_patches, attr_deletions, ent_modified.
 * upsert_ent params: ent_key, attr_patches, attr_deletions.
 * Any other param name fails with InvalidArgument.
 */
class ActionProcessor {
public:
    explicit ActionProcessor(dao::EntityStore& store) : store_(store) {}

    Result<std::vector<std::vector<ActionResult>>>
    processActionFiles(const std::vector<std::filesystem::path>& actionFiles);

    Result<std::vector<ActionResult>> processActionFile(const std::filesystem::path& actionFile);

    Result<std::vector<Action>> parseActionFile(const std::filesystem::path& actionFile) const;

    /**
     * @brief Execute in order; stops at the first failing action
     */
    Result<std::vector<ActionResult>> processActions(const std::vector<Action>& actions);

    Result<ActionResult> executeAction(const Action& action);

private:
    dao::EntityStore& store_;
};

} // namespace eavdb::actions
