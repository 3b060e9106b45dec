#pragma once

#include <eavdb/core/types.h>
#include <eavdb/storage/database.h>

#include <optional>
#include <string>
#include <vector>

namespace eavdb::schema {

/**
 * @brief SQL storage class of a column
 */
enum class ColumnType { Text, Integer };

/**
 * @brief Column definition
 */
struct ColumnDef {
    std::string name;
    ColumnType type = ColumnType::Text;
    std::optional<int> length;               ///< Declared length for text columns
    bool primaryKey = false;
    bool nullable = true;
    bool indexed = false;
    std::optional<std::string> references;   ///< "table(column)" foreign key target
};

/**
 * @brief Table definition: a name and an ordered column list
 */
struct TableDef {
    std::string name;
    std::vector<ColumnDef> columns;

    [[nodiscard]] bool hasColumn(const std::string& column) const;
    [[nodiscard]] std::string createSql() const;
    [[nodiscard]] std::vector<std::string> createIndexSql() const;
    [[nodiscard]] std::string dropSql() const;
};

/**
 * @brief Column names shared by the engine and the schema
 */
namespace cols {
inline constexpr const char* kKey = "key";
inline constexpr const char* kCreated = "created";
inline constexpr const char* kModified = "modified";
inline constexpr const char* kEntKey = "ent_key";
inline constexpr const char* kAttr = "attr";
inline constexpr const char* kValue = "value";
inline constexpr const char* kType = "type";
} // namespace cols

class Schema;

/**
 * @brief Creates and drops the schema's tables against a database
 */
class SchemaLifecycle {
public:
    explicit SchemaLifecycle(const Schema& schema) : schema_(&schema) {}

    /**
     * @brief Create tables and indexes that do not exist yet
     */
    Result<void> createAll(storage::Database& db) const;

    /**
     * @brief Drop tables (attribute table first) if they exist
     */
    Result<void> dropAll(storage::Database& db) const;

private:
    const Schema* schema_;
};

/**
 * @brief Handle bundling the entity and attribute table definitions
 *
 * Built once per store and injected into the engine.
 */
class Schema {
public:
    Schema(TableDef ents, TableDef attrs);

    Schema(const Schema& other);
    Schema& operator=(const Schema& other);

    [[nodiscard]] const TableDef& ents() const { return ents_; }
    [[nodiscard]] const TableDef& attrs() const { return attrs_; }
    [[nodiscard]] const SchemaLifecycle& lifecycle() const { return lifecycle_; }

private:
    TableDef ents_;
    TableDef attrs_;
    SchemaLifecycle lifecycle_;
};

/**
 * @brief Build the default EAV schema; table names get the optional prefix
 */
Schema generateSchema(const std::string& tablePrefix = "");

/**
 * @brief New globally unique entity/attribute key (UUID v4)
 */
std::string generateKey();

/**
 * @brief Current time in milliseconds since the epoch
 */
Millis nowMillis();

} // namespace eavdb::schema
