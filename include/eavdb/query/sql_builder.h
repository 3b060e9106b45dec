#pragma once

#include <eavdb/storage/database.h>

#include <memory>
#include <string>
#include <vector>

namespace eavdb::query::sql {

using storage::SqlValue;

struct SelectStmt;
struct ExprNode;

/**
 * @brief Immutable expression tree node handle
 */
using Expr = std::shared_ptr<const ExprNode>;

enum class ExprKind { Column, Param, Compare, Not, And, In, Exists };

struct ExprNode {
    ExprKind kind;
    std::string text;                          ///< Qualified column or comparison operator
    SqlValue param;                            ///< Param literal
    std::vector<Expr> children;                ///< Compare: lhs, rhs; Not: operand; And: terms
    std::vector<SqlValue> list;                ///< In: candidate values
    std::shared_ptr<const SelectStmt> subquery; ///< Exists
};

/**
 * @brief A table under an alias ("attrs AS outer_attrs")
 */
struct TableRef {
    std::string table;
    std::string alias;

    [[nodiscard]] const std::string& name() const { return alias.empty() ? table : alias; }
};

// Expression constructors
Expr column(const TableRef& table, const std::string& name);
Expr column(const std::string& qualifier, const std::string& name);
Expr param(SqlValue value);
Expr compare(Expr lhs, std::string op, Expr rhs);
Expr negate(Expr operand);
Expr allOf(std::vector<Expr> terms);
Expr in(Expr lhs, std::vector<SqlValue> values);
Expr exists(SelectStmt subquery);

/**
 * @brief Whether op is a comparison operator the compiler emits
 */
bool isComparisonOperator(const std::string& op);

/**
 * @brief Output column with an optional label
 */
struct SelectColumn {
    Expr expr;
    std::string label;
};

/**
 * @brief FROM item: a table or an aliased sub-select
 */
struct FromSource {
    TableRef table;
    std::shared_ptr<const SelectStmt> subquery;

    static FromSource fromTable(TableRef table);
    static FromSource fromSubquery(SelectStmt subquery, std::string alias);

    [[nodiscard]] const std::string& name() const { return table.name(); }
};

enum class JoinKind { Inner, LeftOuter };

struct Join {
    JoinKind kind = JoinKind::Inner;
    FromSource source;
    Expr on;
};

/**
 * @brief Join graph: a base source followed by ordered joins
 */
struct FromClause {
    FromSource base;
    std::vector<Join> joins;
};

/**
 * @brief SELECT statement; no columns means "*"
 */
struct SelectStmt {
    std::vector<SelectColumn> columns;
    FromClause from;
    std::vector<Expr> wheres;  ///< Combined with AND
};

/**
 * @brief SQL text with positional '?' parameters in textual order
 */
struct CompiledStatement {
    std::string sql;
    std::vector<SqlValue> params;
};

CompiledStatement compile(const SelectStmt& stmt);

} // namespace eavdb::query::sql
