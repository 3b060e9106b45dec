#pragma once

/**
 * @file result_helpers.h
 * @brief Early-return macros for Result<T>
 *
 * Similar to Rust's ? operator: evaluate, and on error return the error
 * from the enclosing function.
 */

#include <eavdb/core/types.h>

#include <utility>

/**
 * @def EAVDB_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * Example:
 * @code
 * Result<void> doWork() {
 *     EAVDB_TRY(step1());
 *     EAVDB_TRY(step2());
 *     return {};
 * }
 * @endcode
 */
#define EAVDB_TRY(expr)                                                                            \
    do {                                                                                           \
        auto _eavdb_try_result = (expr);                                                           \
        if (!_eavdb_try_result.has_value()) {                                                      \
            return _eavdb_try_result.error();                                                      \
        }                                                                                          \
    } while (0)

/**
 * @def EAVDB_TRY_UNWRAP(var, expr)
 * @brief Declare and initialize variable from Result, returning error if failed
 *
 * Example:
 * @code
 * Result<int> count(Database& db) {
 *     EAVDB_TRY_UNWRAP(stmt, db.prepare(sql));
 *     EAVDB_TRY_UNWRAP(hasRow, stmt.step());
 *     return hasRow ? stmt.getInt(0) : 0;
 * }
 * @endcode
 */
#define EAVDB_TRY_UNWRAP(var, expr)                                                                \
    auto _eavdb_res_##var = (expr);                                                                \
    if (!_eavdb_res_##var.has_value()) {                                                           \
        return _eavdb_res_##var.error();                                                           \
    }                                                                                              \
    auto var = std::move(_eavdb_res_##var).value()
