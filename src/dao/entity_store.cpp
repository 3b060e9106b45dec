#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <set>
#include <eavdb/core/result_helpers.h>
#include <eavdb/dao/entity_store.h>

namespace eavdb::dao {

namespace cols = schema::cols;
using query::EntsQueryColumn;

namespace {

int colIndex(EntsQueryColumn column) {
    return static_cast<int>(column);
}

std::string placeholders(size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += i == 0 ? "?" : ", ?";
    }
    return out;
}

// Containers travel as JSON text
Result<storage::SqlValue> toSqlValue(const codec::Value& value) {
    switch (value.type()) {
        case codec::Value::value_t::null:
            return storage::SqlValue{nullptr};
        case codec::Value::value_t::boolean:
            return storage::SqlValue{static_cast<int64_t>(value.get<bool>() ? 1 : 0)};
        case codec::Value::value_t::number_unsigned:
            if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Error{ErrorCode::InvalidArgument, "integer out of range: " + value.dump()};
            }
            return storage::SqlValue{value.get<int64_t>()};
        case codec::Value::value_t::number_integer:
            return storage::SqlValue{value.get<int64_t>()};
        case codec::Value::value_t::number_float:
            return storage::SqlValue{value.get<double>()};
        case codec::Value::value_t::string:
            return storage::SqlValue{value.get<std::string>()};
        default: {
            EAVDB_TRY_UNWRAP(serialized, codec::serialize(value));
            return storage::SqlValue{std::move(serialized.text)};
        }
    }
}

std::shared_ptr<spdlog::logger> makeNullLogger() {
    return std::make_shared<spdlog::logger>("eavdb",
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

codec::Value fromSqlValue(const storage::SqlValue& value) {
    if (std::holds_alternative<int64_t>(value)) {
        return codec::Value(std::get<int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return codec::Value(std::get<double>(value));
    }
    if (std::holds_alternative<std::string>(value)) {
        return codec::Value(std::get<std::string>(value));
    }
    return codec::Value(nullptr);
}

} // namespace

Result<void> EntityRowFolder::add(const storage::Statement& row) {
    const std::string key = row.getString(colIndex(EntsQueryColumn::EntKey));

    auto it = entities_.find(key);
    if (it == entities_.end()) {
        Entity entity;
        entity.key = key;
        entity.created = row.getInt64(colIndex(EntsQueryColumn::EntCreated));
        entity.modified = row.getInt64(colIndex(EntsQueryColumn::EntModified));
        it = entities_.emplace(key, std::move(entity)).first;
    }

    // Outer join row of an entity without attributes
    if (row.isNull(colIndex(EntsQueryColumn::Attr))) {
        return {};
    }

    const std::string attr = row.getString(colIndex(EntsQueryColumn::Attr));
    if (row.isNull(colIndex(EntsQueryColumn::Value))) {
        it->second.attrs[attr] = codec::Value(nullptr);
        return {};
    }

    std::optional<std::string> typeTag;
    if (!row.isNull(colIndex(EntsQueryColumn::Type))) {
        typeTag = row.getString(colIndex(EntsQueryColumn::Type));
    }
    EAVDB_TRY_UNWRAP(value,
                     codec::deserialize(row.getString(colIndex(EntsQueryColumn::Value)), typeTag));
    it->second.attrs[attr] = std::move(value);
    return {};
}

EntityStore::EntityStore(storage::Database& db, schema::Schema schema,
                         std::shared_ptr<spdlog::logger> logger)
    : db_(db), schema_(std::move(schema)), logger_(std::move(logger)) {
    if (!logger_) {
        logger_ = makeNullLogger();
    }
}

Result<void> EntityStore::ensureTables() {
    return createTables();
}

Result<void> EntityStore::createTables() {
    return schema_.lifecycle().createAll(db_);
}

Result<void> EntityStore::dropTables() {
    return schema_.lifecycle().dropAll(db_);
}

Result<Entity> EntityStore::createEnt(const std::optional<EntKey>& key,
                                      const codec::AttrMap& attrs, const EntPatch& entPatch) {
    const EntKey entKey = key ? *key : schema::generateKey();
    const Millis now = schema::nowMillis();
    const Millis created = entPatch.created.value_or(now);
    const Millis modified = entPatch.modified.value_or(created);
    if (modified < created) {
        return Error{ErrorCode::InvalidArgument, "modified must not precede created"};
    }

    std::optional<Entity> stored;
    auto result = db_.transaction([&]() -> Result<void> {
        EAVDB_TRY_UNWRAP(stmt, db_.prepare("INSERT INTO " + schema_.ents().name + " (" +
                                           cols::kKey + ", " + cols::kCreated + ", " +
                                           cols::kModified + ") VALUES (?, ?, ?)"));
        EAVDB_TRY(stmt.bindAll(entKey, created, modified));
        EAVDB_TRY(stmt.execute());

        if (!attrs.empty()) {
            EAVDB_TRY(createAttrs(entKey, attrs, modified));
        }

        query::Query byKey;
        byKey.entFilters.push_back(query::EntFilter{cols::kKey, "=", codec::Value(entKey)});
        EAVDB_TRY_UNWRAP(ents, queryEnts(byKey));
        auto it = ents.find(entKey);
        if (it == ents.end()) {
            return Error{ErrorCode::InvalidState, "created entity not readable: " + entKey};
        }
        stored = std::move(it->second);
        return {};
    });

    if (!result) {
        if (result.error().code == ErrorCode::UniqueViolation) {
            logger_->debug("createEnt: key {} already exists", entKey);
        } else {
            logger_->warn("createEnt {} rolled back: {}", entKey, result.error().message);
        }
        return result.error();
    }
    logger_->debug("createEnt: {} with {} attrs", entKey, stored->attrs.size());
    return std::move(*stored);
}

Result<void> EntityStore::createAttrs(const EntKey& key, const codec::AttrMap& attrs, Millis now) {
    EAVDB_TRY_UNWRAP(stmt,
                     db_.prepare("INSERT INTO " + schema_.attrs().name + " (" + cols::kKey + ", " +
                                 cols::kEntKey + ", " + cols::kAttr + ", " + cols::kValue + ", " +
                                 cols::kType + ", " + cols::kModified +
                                 ") VALUES (?, ?, ?, ?, ?, ?)"));

    for (const auto& [name, value] : attrs) {
        EAVDB_TRY_UNWRAP(serialized, codec::serialize(value));
        EAVDB_TRY(stmt.reset());
        EAVDB_TRY(stmt.clearBindings());
        EAVDB_TRY(stmt.bindAll(schema::generateKey(), key, name, serialized.text));
        if (serialized.typeTag) {
            EAVDB_TRY(stmt.bind(5, *serialized.typeTag));
        } else {
            EAVDB_TRY(stmt.bind(5, nullptr));
        }
        EAVDB_TRY(stmt.bind(6, now));
        EAVDB_TRY(stmt.execute());
    }
    return {};
}

Result<void> EntityStore::deleteAttrs(const EntKey& key, const std::vector<std::string>& names) {
    if (names.empty()) {
        return {};
    }
    EAVDB_TRY_UNWRAP(stmt, db_.prepare("DELETE FROM " + schema_.attrs().name + " WHERE " +
                                       cols::kEntKey + " = ? AND " + cols::kAttr + " IN (" +
                                       placeholders(names.size()) + ")"));
    EAVDB_TRY(stmt.bind(1, key));
    int index = 2;
    for (const auto& name : names) {
        EAVDB_TRY(stmt.bind(index++, name));
    }
    return stmt.execute();
}

Result<void> EntityStore::updateEntAttrs(const EntKey& key, const codec::AttrMap& patches,
                                         const std::vector<std::string>& deletions, Millis now) {
    const std::set<std::string> deleted(deletions.begin(), deletions.end());

    std::set<std::string> toDelete = deleted;
    codec::AttrMap toInsert;
    for (const auto& [name, value] : patches) {
        toDelete.insert(name);
        if (deleted.count(name) == 0) {
            toInsert.emplace(name, value);
        }
    }

    EAVDB_TRY(deleteAttrs(key, std::vector<std::string>(toDelete.begin(), toDelete.end())));
    if (!toInsert.empty()) {
        EAVDB_TRY(createAttrs(key, toInsert, now));
    }
    return {};
}

Result<void> EntityStore::validateAndUpdateEntModified(const EntKey& key,
                                                       Millis expectedModified, Millis now) {
    EAVDB_TRY_UNWRAP(stmt, db_.prepare("UPDATE " + schema_.ents().name + " SET " +
                                       cols::kModified + " = MAX(?, " + cols::kModified +
                                       " + 1) WHERE " + cols::kKey + " = ? AND " +
                                       cols::kModified + " = ?"));
    EAVDB_TRY(stmt.bindAll(now, key, expectedModified));
    EAVDB_TRY(stmt.execute());
    if (db_.changes() != 1) {
        return Error{ErrorCode::StaleEntity,
                     "entity " + key + " changed since modified=" + std::to_string(expectedModified)};
    }
    return {};
}

Result<void> EntityStore::touchEnt(const EntKey& key, Millis now) {
    // Strictly advance so that an optimistic marker is never reused
    EAVDB_TRY_UNWRAP(stmt, db_.prepare("UPDATE " + schema_.ents().name + " SET " +
                                       cols::kModified + " = MAX(?, " + cols::kModified +
                                       " + 1) WHERE " + cols::kKey + " = ?"));
    EAVDB_TRY(stmt.bindAll(now, key));
    EAVDB_TRY(stmt.execute());
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "no entity with key " + key};
    }
    return {};
}

Result<void> EntityStore::updateEnt(const EntKey& key, const codec::AttrMap& patches,
                                    const std::vector<std::string>& deletions,
                                    std::optional<Millis> expectedModified) {
    const Millis now = schema::nowMillis();

    auto result = db_.transaction([&]() -> Result<void> {
        if (expectedModified) {
            EAVDB_TRY(validateAndUpdateEntModified(key, *expectedModified, now));
        }
        if (!patches.empty() || !deletions.empty()) {
            EAVDB_TRY(updateEntAttrs(key, patches, deletions, now));
        }
        return touchEnt(key, now);
    });

    if (!result) {
        if (result.error().code == ErrorCode::StaleEntity) {
            logger_->debug("updateEnt: {}", result.error().message);
        } else {
            logger_->warn("updateEnt {} rolled back: {}", key, result.error().message);
        }
        return result;
    }
    logger_->debug("updateEnt: {} ({} patches, {} deletions)", key, patches.size(),
                   deletions.size());
    return {};
}

Result<std::optional<Entity>> EntityStore::upsertEnt(const EntKey& key,
                                                     const codec::AttrMap& patches,
                                                     const std::vector<std::string>& deletions) {
    codec::AttrMap initial = patches;
    for (const auto& name : deletions) {
        initial.erase(name);
    }

    auto created = createEnt(key, initial);
    if (created) {
        return std::optional<Entity>{std::move(created).value()};
    }
    if (created.error().code != ErrorCode::UniqueViolation) {
        return created.error();
    }

    logger_->debug("upsertEnt: {} exists, updating", key);
    auto updated = updateEnt(key, patches, deletions);
    if (!updated) {
        return updated.error();
    }
    return std::optional<Entity>{};
}

Result<query::sql::CompiledStatement> EntityStore::compileQuery(const query::Query& query) const {
    return query::compileEntsQuery(schema_, query);
}

Result<EntityMap> EntityStore::queryEnts(const query::Query& query) {
    EAVDB_TRY_UNWRAP(compiled, compileQuery(query));
    logger_->trace("queryEnts: {}", compiled.sql);

    EAVDB_TRY_UNWRAP(stmt, db_.prepare(compiled.sql));
    EAVDB_TRY(stmt.bindValues(compiled.params));

    EntityRowFolder folder;
    while (true) {
        EAVDB_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            break;
        }
        EAVDB_TRY(folder.add(stmt));
    }
    return std::move(folder).entities();
}

Result<std::optional<std::vector<Row>>>
EntityStore::executeSql(const std::string& sqlText, const SqlParams& params, SqlMode mode) {
    using Rows = std::optional<std::vector<Row>>;

    auto run = [&]() -> Result<Rows> {
        EAVDB_TRY_UNWRAP(stmt, db_.prepare(sqlText));
        for (const auto& [name, value] : params) {
            EAVDB_TRY_UNWRAP(bound, toSqlValue(value));
            EAVDB_TRY(stmt.bindNamed(name, bound));
        }

        const int columns = stmt.columnCount();
        if (columns == 0) {
            EAVDB_TRY(stmt.execute());
            return Rows{};
        }

        std::vector<Row> rows;
        while (true) {
            EAVDB_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow) {
                break;
            }
            Row row;
            for (int i = 0; i < columns; ++i) {
                row[stmt.columnName(i)] = fromSqlValue(stmt.getValue(i));
            }
            rows.push_back(std::move(row));
        }
        return Rows{std::move(rows)};
    };

    EAVDB_TRY(db_.beginTransaction());
    auto outcome = run();

    if (outcome && mode == SqlMode::Write) {
        auto commitResult = db_.commit();
        if (commitResult) {
            return outcome;
        }
        logger_->warn("executeSql commit failed: {}", commitResult.error().message);
        auto rollbackResult = db_.rollback();
        if (!rollbackResult) {
            logger_->error("executeSql rollback failed: {}", rollbackResult.error().message);
        }
        return commitResult.error();
    }

    auto rollbackResult = db_.rollback();
    if (!outcome) {
        logger_->warn("executeSql rolled back: {}", outcome.error().message);
        if (!rollbackResult) {
            logger_->error("executeSql rollback failed: {}", rollbackResult.error().message);
        }
        return outcome;
    }
    if (!rollbackResult) {
        return rollbackResult.error();
    }
    return outcome;
}

Result<std::unique_ptr<EntityStore>> openEntityStore(storage::Database& db,
                                                     const config::StoreConfig& cfg,
                                                     std::shared_ptr<spdlog::logger> logger) {
    EAVDB_TRY(storage::openDatabase(db, cfg));

    if (!logger) {
        logger = makeNullLogger();
    }
    logger->set_level(cfg.logLevel);

    auto store = std::make_unique<EntityStore>(db, schema::generateSchema(cfg.tablePrefix), logger);
    EAVDB_TRY(store->ensureTables());
    logger->debug("Entity store ready on {} (tables {}, {})", db.path(),
                  store->schema().ents().name, store->schema().attrs().name);
    return store;
}

} // namespace eavdb::dao
