#include <algorithm>
#include <array>
#include <string_view>
#include <eavdb/query/sql_builder.h>

namespace eavdb::query::sql {

namespace {

constexpr std::array<std::string_view, 6> kComparisonOperators = {"=", "<", ">", "<=", ">=",
                                                                   "LIKE"};

std::shared_ptr<ExprNode> makeNode(ExprKind kind) {
    auto node = std::make_shared<ExprNode>();
    node->kind = kind;
    return node;
}

/**
 * Writes SQL text and collects bound parameters in the order their
 * placeholders appear.
 */
class Writer {
public:
    void writeSelect(const SelectStmt& stmt) {
        sql_ += "SELECT ";
        if (stmt.columns.empty()) {
            sql_ += "*";
        } else {
            for (size_t i = 0; i < stmt.columns.size(); ++i) {
                if (i > 0) sql_ += ", ";
                writeExpr(stmt.columns[i].expr);
                if (!stmt.columns[i].label.empty()) {
                    sql_ += " AS ";
                    sql_ += stmt.columns[i].label;
                }
            }
        }

        sql_ += " FROM ";
        writeSource(stmt.from.base);
        for (const auto& join : stmt.from.joins) {
            sql_ += join.kind == JoinKind::LeftOuter ? " LEFT OUTER JOIN " : " JOIN ";
            writeSource(join.source);
            sql_ += " ON ";
            writeExpr(join.on);
        }

        if (!stmt.wheres.empty()) {
            sql_ += " WHERE ";
            writeConjunction(stmt.wheres);
        }
    }

    CompiledStatement finish() && { return CompiledStatement{std::move(sql_), std::move(params_)}; }

private:
    std::string sql_;
    std::vector<SqlValue> params_;

    void writeSource(const FromSource& source) {
        if (source.subquery) {
            sql_ += "(";
            writeSelect(*source.subquery);
            sql_ += ") AS ";
            sql_ += source.table.alias;
            return;
        }
        sql_ += source.table.table;
        if (!source.table.alias.empty()) {
            sql_ += " AS ";
            sql_ += source.table.alias;
        }
    }

    void writeConjunction(const std::vector<Expr>& terms) {
        for (size_t i = 0; i < terms.size(); ++i) {
            if (i > 0) sql_ += " AND ";
            // Nested conjunctions keep their grouping
            bool group = terms[i]->kind == ExprKind::And && terms.size() > 1;
            if (group) sql_ += "(";
            writeExpr(terms[i]);
            if (group) sql_ += ")";
        }
    }

    void writeExpr(const Expr& expr) {
        switch (expr->kind) {
            case ExprKind::Column:
                sql_ += expr->text;
                break;
            case ExprKind::Param:
                sql_ += "?";
                params_.push_back(expr->param);
                break;
            case ExprKind::Compare:
                writeExpr(expr->children[0]);
                sql_ += " ";
                sql_ += expr->text;
                sql_ += " ";
                writeExpr(expr->children[1]);
                break;
            case ExprKind::Not:
                sql_ += "NOT (";
                writeExpr(expr->children[0]);
                sql_ += ")";
                break;
            case ExprKind::And:
                if (expr->children.empty()) {
                    sql_ += "1 = 1";
                } else {
                    writeConjunction(expr->children);
                }
                break;
            case ExprKind::In:
                if (expr->list.empty()) {
                    sql_ += "1 = 0";
                    break;
                }
                writeExpr(expr->children[0]);
                sql_ += " IN (";
                for (size_t i = 0; i < expr->list.size(); ++i) {
                    if (i > 0) sql_ += ", ";
                    sql_ += "?";
                    params_.push_back(expr->list[i]);
                }
                sql_ += ")";
                break;
            case ExprKind::Exists:
                sql_ += "EXISTS (";
                writeSelect(*expr->subquery);
                sql_ += ")";
                break;
        }
    }
};

} // namespace

Expr column(const TableRef& table, const std::string& name) {
    return column(table.name(), name);
}

Expr column(const std::string& qualifier, const std::string& name) {
    auto node = makeNode(ExprKind::Column);
    node->text = qualifier.empty() ? name : qualifier + "." + name;
    return node;
}

Expr param(SqlValue value) {
    auto node = makeNode(ExprKind::Param);
    node->param = std::move(value);
    return node;
}

Expr compare(Expr lhs, std::string op, Expr rhs) {
    auto node = makeNode(ExprKind::Compare);
    node->text = std::move(op);
    node->children = {std::move(lhs), std::move(rhs)};
    return node;
}

Expr negate(Expr operand) {
    auto node = makeNode(ExprKind::Not);
    node->children = {std::move(operand)};
    return node;
}

Expr allOf(std::vector<Expr> terms) {
    auto node = makeNode(ExprKind::And);
    node->children = std::move(terms);
    return node;
}

Expr in(Expr lhs, std::vector<SqlValue> values) {
    auto node = makeNode(ExprKind::In);
    node->children = {std::move(lhs)};
    node->list = std::move(values);
    return node;
}

Expr exists(SelectStmt subquery) {
    auto node = makeNode(ExprKind::Exists);
    node->subquery = std::make_shared<const SelectStmt>(std::move(subquery));
    return node;
}

bool isComparisonOperator(const std::string& op) {
    return std::find(kComparisonOperators.begin(), kComparisonOperators.end(), op) !=
           kComparisonOperators.end();
}

FromSource FromSource::fromTable(TableRef table) {
    return FromSource{std::move(table), nullptr};
}

FromSource FromSource::fromSubquery(SelectStmt subquery, std::string alias) {
    return FromSource{TableRef{"", std::move(alias)},
                      std::make_shared<const SelectStmt>(std::move(subquery))};
}

CompiledStatement compile(const SelectStmt& stmt) {
    Writer writer;
    writer.writeSelect(stmt);
    return std::move(writer).finish();
}

} // namespace eavdb::query::sql
