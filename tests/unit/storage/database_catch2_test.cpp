// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 eavdb Contributors

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

#include <eavdb/config/store_config.h>
#include <eavdb/storage/database.h>

#include "../../common/test_helpers_catch2.h"

using namespace eavdb;
using namespace eavdb::storage;

namespace {
struct DatabaseFixture {
    DatabaseFixture() : file_(test::unique_test_path("database_catch2_test_", ".db")) {}

    [[nodiscard]] std::string dbPath() const { return file_.path().string(); }

    test::ScopedTestFile file_;
};

Result<Database> openWithTable(const std::string& path) {
    Database db;
    auto opened = db.open(path, ConnectionMode::Create);
    if (!opened) {
        return opened.error();
    }
    auto created = db.execute("CREATE TABLE IF NOT EXISTS test_table ("
                              "id INTEGER PRIMARY KEY, name TEXT UNIQUE, value REAL)");
    if (!created) {
        return created.error();
    }
    return db;
}
} // namespace

TEST_CASE("Database: open and close", "[unit][storage][database]") {
    DatabaseFixture fix;
    Database db;

    REQUIRE_FALSE(db.isOpen());

    SECTION("Open creates database file") {
        auto result = db.open(fix.dbPath(), ConnectionMode::Create);
        REQUIRE(result.has_value());
        REQUIRE(db.isOpen());
        CHECK(std::filesystem::exists(fix.dbPath()));
        CHECK(db.path() == fix.dbPath());

        SECTION("Second open is rejected") {
            auto again = db.open(fix.dbPath(), ConnectionMode::Create);
            REQUIRE_FALSE(again.has_value());
            CHECK(again.error().code == ErrorCode::InvalidState);
        }

        SECTION("Close marks database as closed") {
            db.close();
            CHECK_FALSE(db.isOpen());
        }
    }

    SECTION("ReadWrite does not create a missing file") {
        auto result = db.open(fix.dbPath(), ConnectionMode::ReadWrite);
        CHECK_FALSE(result.has_value());
    }
}

TEST_CASE("Database: prepare on closed database fails", "[unit][storage][database]") {
    Database db;
    auto stmt = db.prepare("SELECT 1");
    REQUIRE_FALSE(stmt.has_value());
    CHECK(stmt.error().code == ErrorCode::InvalidState);
}

TEST_CASE("Database: invalid SQL reports DatabaseError", "[unit][storage][database]") {
    Database db;
    REQUIRE(db.open(":memory:", ConnectionMode::Memory).has_value());

    auto stmt = db.prepare("SELEC nothing");
    REQUIRE_FALSE(stmt.has_value());
    CHECK(stmt.error().code == ErrorCode::DatabaseError);

    auto exec = db.execute("CREATE TABLEX t (a)");
    REQUIRE_FALSE(exec.has_value());
    CHECK(exec.error().code == ErrorCode::DatabaseError);
}

TEST_CASE("Database: insert and select", "[unit][storage][database]") {
    DatabaseFixture fix;
    auto dbResult = openWithTable(fix.dbPath());
    REQUIRE(dbResult.has_value());
    Database db = std::move(dbResult).value();

    {
        auto stmtResult = db.prepare("INSERT INTO test_table (name, value) VALUES (?, ?)");
        REQUIRE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        REQUIRE(stmt.bindAll("alpha", 1.5).has_value());
        REQUIRE(stmt.execute().has_value());
        CHECK(db.changes() == 1);
    }

    auto stmtResult = db.prepare("SELECT id, name, value FROM test_table WHERE name = ?");
    REQUIRE(stmtResult.has_value());
    Statement stmt = std::move(stmtResult).value();
    REQUIRE(stmt.bind(1, std::string("alpha")).has_value());

    auto step = stmt.step();
    REQUIRE(step.has_value());
    REQUIRE(step.value());
    CHECK(stmt.columnCount() == 3);
    CHECK(stmt.columnName(1) == "name");
    CHECK(stmt.getInt64(0) == 1);
    CHECK(stmt.getString(1) == "alpha");
    CHECK(stmt.getDouble(2) == 1.5);

    auto done = stmt.step();
    REQUIRE(done.has_value());
    CHECK_FALSE(done.value());
}

TEST_CASE("Database: getValue follows the storage class", "[unit][storage][database]") {
    Database db;
    REQUIRE(db.open(":memory:", ConnectionMode::Memory).has_value());

    auto stmtResult = db.prepare("SELECT NULL, 7, 2.25, 'txt'");
    REQUIRE(stmtResult.has_value());
    Statement stmt = std::move(stmtResult).value();
    REQUIRE(stmt.step().value());

    CHECK(std::holds_alternative<std::nullptr_t>(stmt.getValue(0)));
    CHECK(std::get<int64_t>(stmt.getValue(1)) == 7);
    CHECK(std::get<double>(stmt.getValue(2)) == 2.25);
    CHECK(std::get<std::string>(stmt.getValue(3)) == "txt");
    CHECK(stmt.isNull(0));
    CHECK_FALSE(stmt.isNull(1));
}

TEST_CASE("Database: bindValues and bindNamed", "[unit][storage][database]") {
    Database db;
    REQUIRE(db.open(":memory:", ConnectionMode::Memory).has_value());

    SECTION("positional list") {
        auto stmtResult = db.prepare("SELECT ? || ?, ? + 1");
        REQUIRE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        REQUIRE(stmt.bindValues({SqlValue{std::string("a")}, SqlValue{std::string("b")},
                                 SqlValue{int64_t{41}}})
                    .has_value());
        REQUIRE(stmt.step().value());
        CHECK(stmt.getString(0) == "ab");
        CHECK(stmt.getInt64(1) == 42);
    }

    SECTION("named with and without prefix") {
        auto stmtResult = db.prepare("SELECT :first, :second");
        REQUIRE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        REQUIRE(stmt.bindNamed("first", SqlValue{int64_t{1}}).has_value());
        REQUIRE(stmt.bindNamed(":second", SqlValue{std::string("two")}).has_value());
        REQUIRE(stmt.step().value());
        CHECK(stmt.getInt64(0) == 1);
        CHECK(stmt.getString(1) == "two");
    }

    SECTION("unknown name") {
        auto stmtResult = db.prepare("SELECT :first");
        REQUIRE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        auto bound = stmt.bindNamed("missing", SqlValue{nullptr});
        REQUIRE_FALSE(bound.has_value());
        CHECK(bound.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Database: unique constraint maps to UniqueViolation", "[unit][storage][database]") {
    DatabaseFixture fix;
    auto dbResult = openWithTable(fix.dbPath());
    REQUIRE(dbResult.has_value());
    Database db = std::move(dbResult).value();

    auto insert = [&](int64_t id, const std::string& name) {
        auto stmtResult = db.prepare("INSERT INTO test_table (id, name) VALUES (?, ?)");
        REQUIRE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        REQUIRE(stmt.bindAll(id, name).has_value());
        return stmt.execute();
    };

    REQUIRE(insert(1, "a").has_value());

    SECTION("primary key") {
        auto dup = insert(1, "b");
        REQUIRE_FALSE(dup.has_value());
        CHECK(dup.error().code == ErrorCode::UniqueViolation);
    }

    SECTION("unique column") {
        auto dup = insert(2, "a");
        REQUIRE_FALSE(dup.has_value());
        CHECK(dup.error().code == ErrorCode::UniqueViolation);
    }
}

TEST_CASE("Database: transactions", "[unit][storage][database]") {
    DatabaseFixture fix;
    auto dbResult = openWithTable(fix.dbPath());
    REQUIRE(dbResult.has_value());
    Database db = std::move(dbResult).value();

    auto count = [&]() {
        auto stmt = db.prepare("SELECT COUNT(*) FROM test_table");
        REQUIRE(stmt.has_value());
        Statement s = std::move(stmt).value();
        REQUIRE(s.step().value());
        return s.getInt(0);
    };

    SECTION("commit on success") {
        auto result = db.transaction([&]() -> Result<void> {
            return db.execute("INSERT INTO test_table (name) VALUES ('kept')");
        });
        REQUIRE(result.has_value());
        CHECK_FALSE(db.inTransaction());
        CHECK(count() == 1);
    }

    SECTION("rollback on error result") {
        auto result = db.transaction([&]() -> Result<void> {
            auto inserted = db.execute("INSERT INTO test_table (name) VALUES ('dropped')");
            if (!inserted) {
                return inserted;
            }
            return Error{ErrorCode::InvalidState, "abort"};
        });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message == "abort");
        CHECK_FALSE(db.inTransaction());
        CHECK(count() == 0);
    }

    SECTION("rollback and rethrow on exception") {
        CHECK_THROWS_AS(db.transaction([&]() -> Result<void> {
            auto inserted = db.execute("INSERT INTO test_table (name) VALUES ('thrown')");
            if (!inserted) {
                return inserted;
            }
            throw std::runtime_error("boom");
        }),
                        std::runtime_error);
        CHECK_FALSE(db.inTransaction());
        CHECK(count() == 0);
    }

    SECTION("nested begin is rejected") {
        REQUIRE(db.beginTransaction().has_value());
        auto nested = db.beginTransaction();
        REQUIRE_FALSE(nested.has_value());
        CHECK(nested.error().code == ErrorCode::InvalidState);
        REQUIRE(db.rollback().has_value());
    }
}

TEST_CASE("Database: openDatabase applies a store config", "[unit][storage][database]") {
    SECTION("in-memory default") {
        Database db;
        config::StoreConfig cfg;
        REQUIRE(openDatabase(db, cfg).has_value());
        CHECK(db.isOpen());
    }

    SECTION("file with WAL") {
        DatabaseFixture fix;
        Database db;
        config::StoreConfig cfg;
        cfg.dbPath = fix.dbPath();
        cfg.enableWAL = true;
        cfg.busyTimeout = std::chrono::milliseconds(250);
        REQUIRE(openDatabase(db, cfg).has_value());

        auto stmt = db.prepare("PRAGMA journal_mode");
        REQUIRE(stmt.has_value());
        Statement s = std::move(stmt).value();
        REQUIRE(s.step().value());
        CHECK(s.getString(0) == "wal");
    }
}
