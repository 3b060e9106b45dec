#pragma once

#include <eavdb/core/types.h>
#include <eavdb/query/filter.h>
#include <eavdb/query/sql_builder.h>
#include <eavdb/schema/schema.h>

#include <string>
#include <vector>

namespace eavdb::query {

/**
 * @brief Positions of the columns every entity query projects
 */
enum class EntsQueryColumn : int {
    Attr = 0,
    Value,
    Type,
    EntKey,
    EntCreated,
    EntModified,
};

/**
 * @brief Partially built entity query
 *
 * A value type: every with*() step takes the current state and returns a new
 * one, so a state can be shared and extended along different paths.
 *
 * The base join from outer_ents to outer_attrs is a LEFT OUTER JOIN so that
 * entities without attributes are returned; the first attribute filter
 * turns it into an inner join.
 */
struct EntsQueryComponents {
    sql::TableRef ents;        ///< Unaliased entity table, for fresh aliases
    sql::TableRef attrs;       ///< Unaliased attribute table, for fresh aliases
    sql::TableRef outerEnts;
    sql::TableRef outerAttrs;
    std::vector<std::string> entColumns;
    std::vector<sql::SelectColumn> columns;
    sql::FromClause from;
    std::vector<sql::Expr> wheres;
    int aliasCounter = 0;
};

EntsQueryComponents baseComponents(const schema::Schema& schema);

EntsQueryComponents withAttrsToSelect(const EntsQueryComponents& components,
                                      const std::vector<std::string>& attrsToSelect);

/**
 * @brief Apply an attribute filter after classifying its operator
 */
Result<EntsQueryComponents> withAttrFilter(const EntsQueryComponents& components,
                                           const AttrFilter& filter);

/**
 * @brief Join a sub-select of attribute rows named filter.attr that pass the comparison
 */
Result<EntsQueryComponents> withAttrBinaryFilter(const EntsQueryComponents& components,
                                                 const AttrFilter& filter);

/**
 * @brief Add a correlated [NOT] EXISTS predicate on filter.attr
 */
EntsQueryComponents withAttrExistenceFilter(const EntsQueryComponents& components,
                                            const AttrFilter& filter);

/**
 * @brief Compare an outer entity column directly
 */
Result<EntsQueryComponents> withEntFilter(const EntsQueryComponents& components,
                                          const EntFilter& filter);

/**
 * @brief Run all build steps for a query, in order
 */
Result<EntsQueryComponents> buildEntsQueryComponents(const schema::Schema& schema,
                                                     const Query& query);

sql::SelectStmt toSelect(const EntsQueryComponents& components);

/**
 * @brief Build and compile; fails before any store access on invalid filters
 */
Result<sql::CompiledStatement> compileEntsQuery(const schema::Schema& schema, const Query& query);

/**
 * @brief (Possibly negated) comparison of column against arg
 */
Result<sql::Expr> binaryFilterClause(const sql::Expr& column, const std::string& op,
                                     sql::SqlValue arg);

} // namespace eavdb::query
