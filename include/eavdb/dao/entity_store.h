#pragma once

#include <eavdb/codec/value_codec.h>
#include <eavdb/config/store_config.h>
#include <eavdb/core/types.h>
#include <eavdb/query/ents_query.h>
#include <eavdb/schema/schema.h>
#include <eavdb/storage/database.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace eavdb::dao {

/**
 * @brief Entity as reconstructed from the store
 */
struct Entity {
    EntKey key;
    Millis created = 0;
    Millis modified = 0;
    codec::AttrMap attrs;
};

using EntityMap = std::map<EntKey, Entity>;

/**
 * @brief Explicit entity column values for createEnt
 *
 * Unset columns default to the insert time; modified defaults to created.
 */
struct EntPatch {
    std::optional<Millis> created;
    std::optional<Millis> modified;
};

/**
 * @brief Raw SQL result row, column name to value
 */
using Row = std::map<std::string, codec::Value>;

/**
 * @brief Named parameters for executeSql (":name" placeholders)
 */
using SqlParams = std::map<std::string, codec::Value>;

/**
 * @brief Whether executeSql commits
 */
enum class SqlMode { Read, Write };

/**
 * @brief Fold (attr, value, type, ent_key, ent_created, ent_modified) rows into entities
 *
 * The first row of a key sets its timestamps; rows with a NULL attr only
 * make the entity visible.
 */
class EntityRowFolder {
public:
    Result<void> add(const storage::Statement& row);

    [[nodiscard]] const EntityMap& entities() const& { return entities_; }
    EntityMap&& entities() && { return std::move(entities_); }

private:
    EntityMap entities_;
};

/**
 * @brief EAV data access over a SQLite database
 *
 * Stateless between calls; each mutation runs in its own transaction on the
 * borrowed connection. Concurrent writers on the same entity are ordered
 * only by the optimistic check in updateEnt().
 */
class EntityStore {
public:
    /**
     * @param db open connection, must outlive the store
     * @param schema table definitions
     * @param logger optional; a null-sink logger is used when absent
     */
    EntityStore(storage::Database& db, schema::Schema schema,
                std::shared_ptr<spdlog::logger> logger = nullptr);

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    [[nodiscard]] const schema::Schema& schema() const { return schema_; }

    Result<void> ensureTables();
    Result<void> createTables();
    Result<void> dropTables();

    /**
     * @brief Insert an entity with its attributes and return it as re-read from the store
     *
     * Fails with UniqueViolation when the key exists.
     */
    Result<Entity> createEnt(const std::optional<EntKey>& key = std::nullopt,
                             const codec::AttrMap& attrs = {}, const EntPatch& entPatch = {});

    /**
     * @brief Replace and delete attributes atomically
     *
     * With expectedModified the update only proceeds if the entity's modified
     * marker still equals it (StaleEntity otherwise). Names in both patches
     * and deletions are deleted. The entity's modified marker always advances.
     */
    Result<void> updateEnt(const EntKey& key, const codec::AttrMap& patches = {},
                           const std::vector<std::string>& deletions = {},
                           std::optional<Millis> expectedModified = std::nullopt);

    /**
     * @brief createEnt, or updateEnt when the key already exists
     *
     * Returns the created entity, or nullopt when an update was applied.
     */
    Result<std::optional<Entity>> upsertEnt(const EntKey& key, const codec::AttrMap& patches = {},
                                            const std::vector<std::string>& deletions = {});

    Result<EntityMap> queryEnts(const query::Query& query = {});

    Result<query::sql::CompiledStatement> compileQuery(const query::Query& query) const;

    /**
     * @brief Run arbitrary SQL in its own transaction
     *
     * Only SqlMode::Write commits; reads and mutations in Read mode are rolled
     * back. Returns rows when the statement has result columns.
     */
    Result<std::optional<std::vector<Row>>> executeSql(const std::string& sqlText,
                                                       const SqlParams& params = {},
                                                       SqlMode mode = SqlMode::Read);

private:
    storage::Database& db_;
    schema::Schema schema_;
    std::shared_ptr<spdlog::logger> logger_;

    Result<void> createAttrs(const EntKey& key, const codec::AttrMap& attrs, Millis now);
    Result<void> deleteAttrs(const EntKey& key, const std::vector<std::string>& names);
    Result<void> updateEntAttrs(const EntKey& key, const codec::AttrMap& patches,
                                const std::vector<std::string>& deletions, Millis now);
    Result<void> validateAndUpdateEntModified(const EntKey& key, Millis expectedModified,
                                              Millis now);
    Result<void> touchEnt(const EntKey& key, Millis now);
};

/**
 * @brief Open db as cfg describes and build a store over it
 *
 * Tables are named with cfg.tablePrefix and created when missing. The
 * logger (a null-sink logger when absent) is set to cfg.logLevel.
 */
Result<std::unique_ptr<EntityStore>> openEntityStore(storage::Database& db,
                                                     const config::StoreConfig& cfg,
                                                     std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace eavdb::dao
