#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <eavdb/core/uuid.h>
#include <eavdb/schema/schema.h>

namespace eavdb::schema {

namespace {

ColumnDef keyColumn() {
    return ColumnDef{cols::kKey, ColumnType::Text, 255, true, false, false, std::nullopt};
}

ColumnDef integerColumn(const char* name) {
    return ColumnDef{name, ColumnType::Integer, std::nullopt, false, true, false, std::nullopt};
}

} // namespace

bool TableDef::hasColumn(const std::string& column) const {
    return std::any_of(columns.begin(), columns.end(),
                       [&](const ColumnDef& c) { return c.name == column; });
}

std::string TableDef::createSql() const {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << name << " (";

    bool first = true;
    for (const auto& col : columns) {
        if (!first) sql << ", ";
        first = false;

        sql << col.name << " ";
        switch (col.type) {
            case ColumnType::Text:
                if (col.length) {
                    sql << "VARCHAR(" << *col.length << ")";
                } else {
                    sql << "TEXT";
                }
                break;
            case ColumnType::Integer:
                sql << "INTEGER";
                break;
        }

        if (col.primaryKey) {
            sql << " PRIMARY KEY";
        }
        if (!col.nullable) {
            sql << " NOT NULL";
        }
        if (col.references) {
            sql << " REFERENCES " << *col.references;
        }
    }
    sql << ")";
    return sql.str();
}

std::vector<std::string> TableDef::createIndexSql() const {
    std::vector<std::string> statements;
    for (const auto& col : columns) {
        if (!col.indexed) {
            continue;
        }
        statements.push_back("CREATE INDEX IF NOT EXISTS ix_" + name + "_" + col.name + " ON " +
                             name + " (" + col.name + ")");
    }
    return statements;
}

std::string TableDef::dropSql() const {
    return "DROP TABLE IF EXISTS " + name;
}

Result<void> SchemaLifecycle::createAll(storage::Database& db) const {
    for (const TableDef* table : {&schema_->ents(), &schema_->attrs()}) {
        auto result = db.execute(table->createSql());
        if (!result) {
            return result;
        }
        for (const auto& indexSql : table->createIndexSql()) {
            auto indexResult = db.execute(indexSql);
            if (!indexResult) {
                return indexResult;
            }
        }
    }
    spdlog::debug("Ensured tables {} and {}", schema_->ents().name, schema_->attrs().name);
    return {};
}

Result<void> SchemaLifecycle::dropAll(storage::Database& db) const {
    // Attribute rows reference entities
    for (const TableDef* table : {&schema_->attrs(), &schema_->ents()}) {
        auto result = db.execute(table->dropSql());
        if (!result) {
            return result;
        }
    }
    return {};
}

Schema::Schema(TableDef ents, TableDef attrs)
    : ents_(std::move(ents)), attrs_(std::move(attrs)), lifecycle_(*this) {}

Schema::Schema(const Schema& other)
    : ents_(other.ents_), attrs_(other.attrs_), lifecycle_(*this) {}

Schema& Schema::operator=(const Schema& other) {
    if (this != &other) {
        ents_ = other.ents_;
        attrs_ = other.attrs_;
        lifecycle_ = SchemaLifecycle(*this);
    }
    return *this;
}

Schema generateSchema(const std::string& tablePrefix) {
    TableDef ents;
    ents.name = tablePrefix + "ents";
    ents.columns = {keyColumn(), integerColumn(cols::kCreated), integerColumn(cols::kModified)};

    TableDef attrs;
    attrs.name = tablePrefix + "attrs";
    attrs.columns = {
        keyColumn(),
        ColumnDef{cols::kEntKey, ColumnType::Text, 255, false, true, true,
                  ents.name + "(" + cols::kKey + ")"},
        ColumnDef{cols::kAttr, ColumnType::Text, 1024, false, true, true, std::nullopt},
        ColumnDef{cols::kValue, ColumnType::Text, std::nullopt, false, true, false, std::nullopt},
        ColumnDef{cols::kType, ColumnType::Text, 16, false, true, false, std::nullopt},
        integerColumn(cols::kModified),
    };

    return Schema(std::move(ents), std::move(attrs));
}

std::string generateKey() {
    return core::generateUUID();
}

Millis nowMillis() {
    return core::currentMillis();
}

} // namespace eavdb::schema
