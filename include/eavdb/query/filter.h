#pragma once

#include <eavdb/codec/value_codec.h>
#include <eavdb/core/types.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eavdb::query {

inline constexpr std::string_view kNegationPrefix = "! ";
inline constexpr std::string_view kExistenceOp = "EXISTS";
inline constexpr std::array<std::string_view, 6> kBinaryOps = {"=", "<", ">", "<=", ">=", "LIKE"};

/**
 * @brief Predicate over one attribute name
 *
 * op is a binary operator or EXISTS, optionally prefixed by "! ".
 * arg is ignored for existence filters.
 */
struct AttrFilter {
    std::string attr;
    std::string op;
    codec::Value arg;
};

/**
 * @brief Binary predicate over an entity column (key, created, modified)
 */
struct EntFilter {
    std::string col;
    std::string op;
    codec::Value arg;
};

/**
 * @brief Declarative entity query; every part is optional
 */
struct Query {
    std::optional<std::vector<std::string>> attrsToSelect;
    std::vector<AttrFilter> attrFilters;
    std::vector<EntFilter> entFilters;
};

enum class FilterType { Binary, Existence };

/**
 * @brief Operator split into its negation marker and base operator
 */
struct ParsedOp {
    bool negated = false;
    std::string op;
};

/**
 * @brief Strip exactly one leading "! " marker
 */
ParsedOp parseOp(std::string_view op);

/**
 * @brief Classify an operator; UnknownFilterType when it is neither binary nor EXISTS
 */
Result<FilterType> getFilterType(std::string_view op);

} // namespace eavdb::query
