#pragma once

#include <eavdb/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace eavdb::config {
struct StoreConfig;
}

namespace eavdb::storage {

/**
 * @brief Scalar value exchanged with SQLite (bind parameter or column value)
 */
using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite,      ///< Read-write mode (default)
    ReadOnly,       ///< Read-only mode
    Memory,         ///< In-memory database
    Create          ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const SqlValue& value);
    Result<void> bind(int index, const char* value) {
        return bind(index, std::string_view(value));
    }

    /**
     * @brief Bind to a named parameter (":name", "@name" or "$name")
     */
    Result<void> bindNamed(const std::string& name, const SqlValue& value);

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template<typename... Args>
    Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Bind a positional parameter list
     */
    Result<void> bindValues(const std::vector<SqlValue>& values);

    /**
     * @brief Execute statement (for non-SELECT queries)
     *
     * Primary key and UNIQUE failures are reported as ErrorCode::UniqueViolation.
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    /**
     * @brief Get column values
     */
    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    /**
     * @brief Column value converted by its storage class
     */
    SqlValue getValue(int column) const;

    int columnCount() const;
    std::string columnName(int column) const;

    Result<void> reset();
    Result<void> clearBindings();

private:
    sqlite3_stmt* stmt_ = nullptr;

    Error stepError(int rc) const;

    template<typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result) return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    /**
     * @brief Close database connection
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction
     *
     * Commits when func succeeds; rolls back and returns func's error otherwise.
     */
    template<typename Func>
    Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult) return beginResult;

        try {
            Result<void> result = func();
            if (!result) {
                rollbackQuietly(result.error());
                return result;
            }
            auto commitResult = commit();
            if (!commitResult) {
                rollbackQuietly(commitResult.error());
            }
            return commitResult;
        } catch (...) {
            rollbackQuietly(Error{ErrorCode::Unknown, "exception in transaction body"});
            throw;
        }
    }

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    Result<void> enableWAL();

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;

    void rollbackQuietly(const Error& cause);
};

/**
 * @brief Open and tune a database according to a store configuration
 */
Result<void> openDatabase(Database& db, const config::StoreConfig& cfg);

} // namespace eavdb::storage
