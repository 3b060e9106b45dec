#include <algorithm>
#include <limits>
#include <eavdb/core/result_helpers.h>
#include <eavdb/query/ents_query.h>

namespace eavdb::query {

namespace cols = schema::cols;

namespace {

constexpr const char* kOuterEnts = "outer_ents";
constexpr const char* kOuterAttrs = "outer_attrs";

// Attribute filter args are compared against the stored text of the value
Result<sql::SqlValue> attrFilterArg(const codec::Value& arg) {
    auto serialized = codec::serialize(arg);
    if (!serialized) {
        return serialized.error();
    }
    return sql::SqlValue{std::move(serialized).value().text};
}

// Entity filter args are compared against native column values
Result<sql::SqlValue> entFilterArg(const codec::Value& arg) {
    switch (arg.type()) {
        case codec::Value::value_t::null:
            return sql::SqlValue{nullptr};
        case codec::Value::value_t::string:
            return sql::SqlValue{arg.get<std::string>()};
        case codec::Value::value_t::boolean:
            return sql::SqlValue{static_cast<int64_t>(arg.get<bool>() ? 1 : 0)};
        case codec::Value::value_t::number_unsigned:
            if (arg.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Error{ErrorCode::InvalidArgument,
                             "entity filter argument out of range: " + arg.dump()};
            }
            return sql::SqlValue{arg.get<int64_t>()};
        case codec::Value::value_t::number_integer:
            return sql::SqlValue{arg.get<int64_t>()};
        case codec::Value::value_t::number_float:
            return sql::SqlValue{arg.get<double>()};
        default:
            return Error{ErrorCode::InvalidArgument,
                         "entity filter argument must be a scalar, got " +
                             std::string(arg.type_name())};
    }
}

std::string nextAlias(EntsQueryComponents& components, const char* stem) {
    return std::string(stem) + "_" + std::to_string(++components.aliasCounter);
}

} // namespace

EntsQueryComponents baseComponents(const schema::Schema& schema) {
    EntsQueryComponents components;
    components.ents = sql::TableRef{schema.ents().name, ""};
    components.attrs = sql::TableRef{schema.attrs().name, ""};
    components.outerEnts = sql::TableRef{schema.ents().name, kOuterEnts};
    components.outerAttrs = sql::TableRef{schema.attrs().name, kOuterAttrs};
    for (const auto& col : schema.ents().columns) {
        components.entColumns.push_back(col.name);
    }

    const auto& oe = components.outerEnts;
    const auto& oa = components.outerAttrs;
    components.columns = {
        {sql::column(oa, cols::kAttr), "attr"},
        {sql::column(oa, cols::kValue), "value"},
        {sql::column(oa, cols::kType), "type"},
        {sql::column(oe, cols::kKey), "ent_key"},
        {sql::column(oe, cols::kCreated), "ent_created"},
        {sql::column(oe, cols::kModified), "ent_modified"},
    };

    components.from.base = sql::FromSource::fromTable(oe);
    components.from.joins.push_back(
        sql::Join{sql::JoinKind::LeftOuter, sql::FromSource::fromTable(oa),
                  sql::compare(sql::column(oe, cols::kKey), "=", sql::column(oa, cols::kEntKey))});
    return components;
}

EntsQueryComponents withAttrsToSelect(const EntsQueryComponents& components,
                                      const std::vector<std::string>& attrsToSelect) {
    EntsQueryComponents next = components;
    std::vector<sql::SqlValue> names(attrsToSelect.begin(), attrsToSelect.end());
    next.wheres.push_back(
        sql::in(sql::column(next.outerAttrs, cols::kAttr), std::move(names)));
    return next;
}

Result<sql::Expr> binaryFilterClause(const sql::Expr& column, const std::string& op,
                                     sql::SqlValue arg) {
    auto parsed = parseOp(op);
    if (!sql::isComparisonOperator(parsed.op)) {
        return Error{ErrorCode::UnknownFilterType, "unknown filter type '" + op + "'"};
    }
    sql::Expr clause = sql::compare(column, parsed.op, sql::param(std::move(arg)));
    if (parsed.negated) {
        clause = sql::negate(clause);
    }
    return clause;
}

Result<EntsQueryComponents> withAttrFilter(const EntsQueryComponents& components,
                                           const AttrFilter& filter) {
    EAVDB_TRY_UNWRAP(filterType, getFilterType(filter.op));
    if (filter.attr.empty()) {
        return Error{ErrorCode::InvalidArgument, "attribute filter requires an attr name"};
    }

    EntsQueryComponents next = components;
    next.from.joins.front().kind = sql::JoinKind::Inner;

    switch (filterType) {
        case FilterType::Binary:
            return withAttrBinaryFilter(next, filter);
        case FilterType::Existence:
            return withAttrExistenceFilter(next, filter);
    }
    return Error{ErrorCode::UnknownFilterType, "unknown filter type '" + filter.op + "'"};
}

Result<EntsQueryComponents> withAttrBinaryFilter(const EntsQueryComponents& components,
                                                 const AttrFilter& filter) {
    EAVDB_TRY_UNWRAP(arg, attrFilterArg(filter.arg));

    EntsQueryComponents next = components;
    const sql::TableRef filterAttrs{next.attrs.table, nextAlias(next, "filter_attrs")};
    const std::string subqueryAlias = nextAlias(next, "attr_filter");

    EAVDB_TRY_UNWRAP(valueClause,
                     binaryFilterClause(sql::column(filterAttrs, cols::kValue), filter.op,
                                        std::move(arg)));

    sql::SelectStmt subquery;
    subquery.from.base = sql::FromSource::fromTable(filterAttrs);
    subquery.wheres = {
        sql::compare(sql::column(filterAttrs, cols::kAttr), "=", sql::param(filter.attr)),
        valueClause,
    };

    next.from.joins.push_back(sql::Join{
        sql::JoinKind::Inner, sql::FromSource::fromSubquery(std::move(subquery), subqueryAlias),
        sql::compare(sql::column(next.outerEnts, cols::kKey), "=",
                     sql::column(subqueryAlias, cols::kEntKey))});
    return next;
}

EntsQueryComponents withAttrExistenceFilter(const EntsQueryComponents& components,
                                            const AttrFilter& filter) {
    EntsQueryComponents next = components;
    const sql::TableRef existsAttrs{next.attrs.table, nextAlias(next, "exists_attrs")};

    sql::SelectStmt subquery;
    subquery.columns = {{sql::column(existsAttrs, cols::kEntKey), ""}};
    subquery.from.base = sql::FromSource::fromTable(existsAttrs);
    subquery.wheres = {
        sql::compare(sql::column(existsAttrs, cols::kAttr), "=", sql::param(filter.attr)),
        sql::compare(sql::column(existsAttrs, cols::kEntKey), "=",
                     sql::column(next.outerEnts, cols::kKey)),
    };

    sql::Expr clause = sql::exists(std::move(subquery));
    if (parseOp(filter.op).negated) {
        clause = sql::negate(clause);
    }
    next.wheres.push_back(std::move(clause));
    return next;
}

Result<EntsQueryComponents> withEntFilter(const EntsQueryComponents& components,
                                          const EntFilter& filter) {
    EAVDB_TRY_UNWRAP(filterType, getFilterType(filter.op));
    if (filterType != FilterType::Binary) {
        return Error{ErrorCode::UnknownFilterType,
                     "unknown filter type '" + filter.op + "' for entity column"};
    }
    if (std::find(components.entColumns.begin(), components.entColumns.end(), filter.col) ==
        components.entColumns.end()) {
        return Error{ErrorCode::InvalidArgument, "unknown entity column '" + filter.col + "'"};
    }
    EAVDB_TRY_UNWRAP(arg, entFilterArg(filter.arg));
    EAVDB_TRY_UNWRAP(clause, binaryFilterClause(sql::column(components.outerEnts, filter.col),
                                                filter.op, std::move(arg)));

    EntsQueryComponents next = components;
    next.wheres.push_back(std::move(clause));
    return next;
}

Result<EntsQueryComponents> buildEntsQueryComponents(const schema::Schema& schema,
                                                     const Query& query) {
    EntsQueryComponents components = baseComponents(schema);

    if (query.attrsToSelect && !query.attrsToSelect->empty()) {
        components = withAttrsToSelect(components, *query.attrsToSelect);
    }

    for (const auto& filter : query.attrFilters) {
        EAVDB_TRY_UNWRAP(next, withAttrFilter(components, filter));
        components = std::move(next);
    }

    for (const auto& filter : query.entFilters) {
        EAVDB_TRY_UNWRAP(next, withEntFilter(components, filter));
        components = std::move(next);
    }

    return components;
}

sql::SelectStmt toSelect(const EntsQueryComponents& components) {
    sql::SelectStmt stmt;
    stmt.columns = components.columns;
    stmt.from = components.from;
    stmt.wheres = components.wheres;
    return stmt;
}

Result<sql::CompiledStatement> compileEntsQuery(const schema::Schema& schema, const Query& query) {
    EAVDB_TRY_UNWRAP(components, buildEntsQueryComponents(schema, query));
    return sql::compile(toSelect(components));
}

} // namespace eavdb::query
