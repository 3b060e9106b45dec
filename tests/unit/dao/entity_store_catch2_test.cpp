// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright 2025 eavdb Contributors

#include <limits>
#include <set>
#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <eavdb/dao/entity_store.h>

#include "../../common/test_helpers_catch2.h"

using namespace eavdb;
using namespace eavdb::dao;
using codec::AttrMap;
using codec::Value;
using query::AttrFilter;
using query::EntFilter;
using query::Query;

namespace {

struct EntityStoreFixture {
    EntityStoreFixture() {
        auto opened = db.open(":memory:", storage::ConnectionMode::Memory);
        REQUIRE(opened.has_value());
        store = std::make_unique<EntityStore>(db, schema::generateSchema());
        REQUIRE(store->ensureTables().has_value());
    }

    Entity create(const EntKey& key, const AttrMap& attrs = {}) {
        auto created = store->createEnt(key, attrs);
        REQUIRE(created.has_value());
        return created.value();
    }

    Entity fetch(const EntKey& key) {
        auto ents = store->queryEnts();
        REQUIRE(ents.has_value());
        auto it = ents.value().find(key);
        REQUIRE(it != ents.value().end());
        return it->second;
    }

    std::set<EntKey> keysMatching(const Query& q) {
        auto ents = store->queryEnts(q);
        REQUIRE(ents.has_value());
        std::set<EntKey> keys;
        for (const auto& [key, ent] : ents.value()) {
            keys.insert(key);
        }
        return keys;
    }

    int64_t countRows(const std::string& table) {
        auto rows = store->executeSql("SELECT COUNT(*) AS n FROM " + table);
        REQUIRE(rows.has_value());
        REQUIRE(rows.value().has_value());
        return rows.value()->front().at("n").get<int64_t>();
    }

    storage::Database db;
    std::unique_ptr<EntityStore> store;
};

} // namespace

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: create then fetch",
                 "[unit][dao][entity_store]") {
    AttrMap attrs = {
        {"name", Value("Ada")},
        {"age", Value(36)},
        {"ratio", Value(0.5)},
        {"active", Value(true)},
        {"nothing", Value(nullptr)},
        {"tags", Value::array({"x", 1})},
        {"address", Value::object({{"city", "London"}})},
        {"numeric_text", Value("12")},
    };

    auto created = store->createEnt(std::string("ada"), attrs);
    REQUIRE(created.has_value());
    CHECK(created.value().key == "ada");
    CHECK(created.value().attrs == attrs);
    CHECK(created.value().modified == created.value().created);

    auto fetched = fetch("ada");
    CHECK(fetched.attrs == attrs);
    CHECK(fetched.modified == created.value().modified);
    CHECK(fetched.created == created.value().created);
    CHECK(fetched.attrs.at("numeric_text").is_string());
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: generated keys and explicit timestamps",
                 "[unit][dao][entity_store]") {
    SECTION("key is generated when absent") {
        auto created = store->createEnt();
        REQUIRE(created.has_value());
        CHECK(created.value().key.size() == 36);
        CHECK(created.value().attrs.empty());
    }

    SECTION("entity patch sets created and modified") {
        auto created = store->createEnt(std::string("k"), {}, EntPatch{100, 200});
        REQUIRE(created.has_value());
        CHECK(created.value().created == 100);
        CHECK(created.value().modified == 200);
    }

    SECTION("modified before created is rejected") {
        auto created = store->createEnt(std::string("k"), {}, EntPatch{200, 100});
        REQUIRE_FALSE(created.has_value());
        CHECK(created.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: duplicate key rolls back",
                 "[unit][dao][entity_store]") {
    create("dup", {{"a", Value(1)}});

    auto again = store->createEnt(std::string("dup"), {{"b", Value(2)}});
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == ErrorCode::UniqueViolation);
    CHECK_FALSE(db.inTransaction());

    auto ent = fetch("dup");
    CHECK(ent.attrs == AttrMap{{"a", Value(1)}});
    CHECK(countRows("attrs") == 1);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: unsupported value leaves no partial entity",
                 "[unit][dao][entity_store]") {
    auto created = store->createEnt(
        std::string("bad"), {{"a", Value("ok")}, {"b", Value::binary({0x01})}});
    REQUIRE_FALSE(created.has_value());
    CHECK(created.error().code == ErrorCode::SerializationError);
    CHECK(countRows("ents") == 0);
    CHECK(countRows("attrs") == 0);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: update replaces and deletes attributes",
                 "[unit][dao][entity_store]") {
    auto ent = create("e", {{"keep", Value("k")},
                            {"replace", Value(1)},
                            {"drop", Value(true)},
                            {"both", Value("b")}});

    auto updated = store->updateEnt("e",
                                    {{"replace", Value(2)}, {"added", Value("new")},
                                     {"both", Value("patched")}},
                                    {"drop", "both", "never_existed"});
    REQUIRE(updated.has_value());

    auto after = fetch("e");
    CHECK(after.attrs == AttrMap{{"keep", Value("k")},
                                 {"replace", Value(2)},
                                 {"added", Value("new")}});
    CHECK(after.modified > ent.modified);
    CHECK(after.created == ent.created);
    CHECK(countRows("attrs") == 3);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: every update advances modified",
                 "[unit][dao][entity_store]") {
    auto ent = create("e");
    Millis last = ent.modified;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(store->updateEnt("e", {{"n", Value(i)}}).has_value());
        auto now = fetch("e").modified;
        CHECK(now > last);
        last = now;
    }

    // An empty update still advances the marker
    REQUIRE(store->updateEnt("e").has_value());
    CHECK(fetch("e").modified > last);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: optimistic concurrency",
                 "[unit][dao][entity_store]") {
    auto ent = create("e", {{"v", Value(1)}});

    SECTION("matching marker succeeds") {
        auto updated = store->updateEnt("e", {{"v", Value(2)}}, {}, ent.modified);
        REQUIRE(updated.has_value());
        CHECK(fetch("e").attrs.at("v") == Value(2));
    }

    SECTION("stale marker fails without side effects") {
        REQUIRE(store->updateEnt("e", {{"v", Value(2)}}).has_value());
        auto current = fetch("e");

        auto stale = store->updateEnt("e", {{"v", Value(3)}}, {"v"}, ent.modified);
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().code == ErrorCode::StaleEntity);
        CHECK_FALSE(db.inTransaction());

        auto after = fetch("e");
        CHECK(after.attrs == current.attrs);
        CHECK(after.modified == current.modified);
    }

    SECTION("the same marker only wins once") {
        REQUIRE(store->updateEnt("e", {{"v", Value(2)}}, {}, ent.modified).has_value());
        auto second = store->updateEnt("e", {{"v", Value(3)}}, {}, ent.modified);
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error().code == ErrorCode::StaleEntity);
    }
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: failure after deletions rolls back the update",
                 "[unit][dao][entity_store]") {
    auto ent = create("e", {{"keep", Value("k")}, {"drop", Value(1)}, {"swap", Value("old")}});

    // Attribute rows are deleted before the patch values are encoded
    auto updated = store->updateEnt("e", {{"swap", Value::binary({0x01})}}, {"drop"},
                                    ent.modified);
    REQUIRE_FALSE(updated.has_value());
    CHECK(updated.error().code == ErrorCode::SerializationError);
    CHECK_FALSE(db.inTransaction());

    auto after = fetch("e");
    CHECK(after.attrs == ent.attrs);
    CHECK(after.modified == ent.modified);
    CHECK(countRows("attrs") == 3);

    // The marker is still current, so a valid retry goes through
    REQUIRE(store->updateEnt("e", {{"swap", Value("new")}}, {"drop"}, ent.modified).has_value());
    CHECK(fetch("e").attrs == AttrMap{{"keep", Value("k")}, {"swap", Value("new")}});
}

TEST_CASE("EntityStore: staleness is detected across connections",
          "[unit][dao][entity_store]") {
    test::ScopedTestFile file(test::unique_test_path("entity_store_shared_", ".db"));

    storage::Database dbA;
    storage::Database dbB;
    REQUIRE(dbA.open(file.path().string(), storage::ConnectionMode::Create).has_value());
    REQUIRE(dbB.open(file.path().string(), storage::ConnectionMode::Create).has_value());

    EntityStore storeA(dbA, schema::generateSchema());
    EntityStore storeB(dbB, schema::generateSchema());
    REQUIRE(storeA.ensureTables().has_value());

    auto created = storeA.createEnt(std::string("shared"), {{"owner", Value("a")}});
    REQUIRE(created.has_value());
    const Millis seenByB = created.value().modified;

    REQUIRE(storeA.updateEnt("shared", {{"owner", Value("a2")}}, {}, seenByB).has_value());

    auto late = storeB.updateEnt("shared", {{"owner", Value("b")}}, {}, seenByB);
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == ErrorCode::StaleEntity);

    auto ents = storeB.queryEnts();
    REQUIRE(ents.has_value());
    CHECK(ents.value().at("shared").attrs.at("owner") == Value("a2"));
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: update of a missing entity",
                 "[unit][dao][entity_store]") {
    SECTION("without a marker") {
        auto updated = store->updateEnt("ghost", {{"a", Value(1)}});
        REQUIRE_FALSE(updated.has_value());
        CHECK(updated.error().code == ErrorCode::NotFound);
    }

    SECTION("with a marker") {
        auto updated = store->updateEnt("ghost", {{"a", Value(1)}}, {}, Millis{1});
        REQUIRE_FALSE(updated.has_value());
        CHECK(updated.error().code == ErrorCode::StaleEntity);
    }

    CHECK(countRows("attrs") == 0);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: upsert creates then updates",
                 "[unit][dao][entity_store]") {
    auto first = store->upsertEnt("u", {{"a", Value(1)}, {"gone", Value(0)}}, {"gone"});
    REQUIRE(first.has_value());
    REQUIRE(first.value().has_value());
    CHECK(first.value()->attrs == AttrMap{{"a", Value(1)}});

    auto second = store->upsertEnt("u", {{"b", Value(2)}}, {"a"});
    REQUIRE(second.has_value());
    CHECK_FALSE(second.value().has_value());
    CHECK(fetch("u").attrs == AttrMap{{"b", Value(2)}});
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: querying without filters",
                 "[unit][dao][entity_store]") {
    create("with_attrs", {{"a", Value(1)}, {"b", Value(2)}});
    create("bare");

    auto ents = store->queryEnts();
    REQUIRE(ents.has_value());
    REQUIRE(ents.value().size() == 2);
    CHECK(ents.value().at("with_attrs").attrs.size() == 2);
    CHECK(ents.value().at("bare").attrs.empty());
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: existence filters",
                 "[unit][dao][entity_store]") {
    create("e1", {{"tag", Value("t")}, {"name", Value("one")}});
    create("e2", {{"name", Value("two")}});
    create("e3");

    Query has;
    has.attrFilters.push_back(AttrFilter{"tag", "EXISTS", Value()});
    CHECK(keysMatching(has) == std::set<EntKey>{"e1"});

    Query lacks;
    lacks.attrFilters.push_back(AttrFilter{"tag", "! EXISTS", Value()});
    CHECK(keysMatching(lacks) == std::set<EntKey>{"e2"});

    // Existence filters do not restrict which attributes come back
    auto ents = store->queryEnts(has);
    REQUIRE(ents.has_value());
    CHECK(ents.value().at("e1").attrs.size() == 2);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: binary filters compose with AND",
                 "[unit][dao][entity_store]") {
    create("red_big", {{"color", Value("red")}, {"size", Value("big")}});
    create("red_small", {{"color", Value("red")}, {"size", Value("small")}});
    create("blue_big", {{"color", Value("blue")}, {"size", Value("big")}});

    Query red;
    red.attrFilters.push_back(AttrFilter{"color", "=", Value("red")});
    CHECK(keysMatching(red) == std::set<EntKey>{"red_big", "red_small"});

    Query redBig = red;
    redBig.attrFilters.push_back(AttrFilter{"size", "=", Value("big")});
    CHECK(keysMatching(redBig) == std::set<EntKey>{"red_big"});

    Query notRed;
    notRed.attrFilters.push_back(AttrFilter{"color", "! =", Value("red")});
    CHECK(keysMatching(notRed) == std::set<EntKey>{"blue_big"});

    Query like;
    like.attrFilters.push_back(AttrFilter{"size", "LIKE", Value("sm%")});
    CHECK(keysMatching(like) == std::set<EntKey>{"red_small"});

    // Matching entities come back with all their attributes
    auto ents = store->queryEnts(redBig);
    REQUIRE(ents.has_value());
    CHECK(ents.value().at("red_big").attrs.size() == 2);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: non-string filter arguments",
                 "[unit][dao][entity_store]") {
    create("n1", {{"n", Value(7)}, {"flag", Value(true)}});
    create("n2", {{"n", Value("7")}, {"flag", Value(false)}});

    Query num;
    num.attrFilters.push_back(AttrFilter{"n", "=", Value(7)});
    // Stored text is compared, so the number and the string both match
    CHECK(keysMatching(num) == std::set<EntKey>{"n1", "n2"});

    Query flag;
    flag.attrFilters.push_back(AttrFilter{"flag", "=", Value(true)});
    CHECK(keysMatching(flag) == std::set<EntKey>{"n1"});
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: entity column filters",
                 "[unit][dao][entity_store]") {
    REQUIRE(store->createEnt(std::string("old"), {}, EntPatch{100, 100}).has_value());
    REQUIRE(store->createEnt(std::string("new"), {{"a", Value(1)}}, EntPatch{500, 500})
                .has_value());

    Query recent;
    recent.entFilters.push_back(EntFilter{"modified", ">", Value(200)});
    CHECK(keysMatching(recent) == std::set<EntKey>{"new"});

    Query byKey;
    byKey.entFilters.push_back(EntFilter{"key", "=", Value("old")});
    CHECK(keysMatching(byKey) == std::set<EntKey>{"old"});

    Query unknownCol;
    unknownCol.entFilters.push_back(EntFilter{"value", "=", Value(1)});
    auto bad = store->queryEnts(unknownCol);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: attrsToSelect limits returned attributes",
                 "[unit][dao][entity_store]") {
    create("e", {{"a", Value(1)}, {"b", Value(2)}, {"c", Value(3)}});

    Query q;
    q.attrsToSelect = std::vector<std::string>{"a", "c"};
    auto ents = store->queryEnts(q);
    REQUIRE(ents.has_value());
    CHECK(ents.value().at("e").attrs == AttrMap{{"a", Value(1)}, {"c", Value(3)}});
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: unknown filter type is reported",
                 "[unit][dao][entity_store]") {
    Query q;
    q.attrFilters.push_back(AttrFilter{"a", "~", Value(1)});
    auto ents = store->queryEnts(q);
    REQUIRE_FALSE(ents.has_value());
    CHECK(ents.error().code == ErrorCode::UnknownFilterType);
    CHECK(ents.error().message == "unknown filter type '~'");
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: raw SQL",
                 "[unit][dao][entity_store]") {
    create("e", {{"a", Value(1)}});

    SECTION("select returns rows") {
        auto rows = store->executeSql("SELECT key, created FROM ents WHERE key = :key",
                                      {{"key", Value("e")}});
        REQUIRE(rows.has_value());
        REQUIRE(rows.value().has_value());
        REQUIRE(rows.value()->size() == 1);
        CHECK(rows.value()->front().at("key") == Value("e"));
        CHECK(rows.value()->front().at("created").is_number_integer());
    }

    SECTION("read mode rolls back mutations") {
        auto result = store->executeSql("DELETE FROM attrs");
        REQUIRE(result.has_value());
        CHECK_FALSE(result.value().has_value());
        CHECK(countRows("attrs") == 1);
    }

    SECTION("write mode commits") {
        auto result = store->executeSql("DELETE FROM attrs WHERE ent_key = :k",
                                        {{"k", Value("e")}}, SqlMode::Write);
        REQUIRE(result.has_value());
        CHECK(countRows("attrs") == 0);
    }

    SECTION("errors leave no open transaction") {
        auto result = store->executeSql("SELECT * FROM missing_table");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::DatabaseError);
        CHECK_FALSE(db.inTransaction());
    }
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: table lifecycle",
                 "[unit][dao][entity_store]") {
    create("e", {{"a", Value(1)}});

    REQUIRE(store->dropTables().has_value());
    CHECK_FALSE(db.tableExists("ents").value());

    auto ents = store->queryEnts();
    CHECK_FALSE(ents.has_value());

    REQUIRE(store->createTables().has_value());
    auto empty = store->queryEnts();
    REQUIRE(empty.has_value());
    CHECK(empty.value().empty());
}

TEST_CASE("EntityStore: table prefix isolates stores", "[unit][dao][entity_store]") {
    storage::Database db;
    REQUIRE(db.open(":memory:", storage::ConnectionMode::Memory).has_value());

    EntityStore left(db, schema::generateSchema("left_"));
    EntityStore right(db, schema::generateSchema("right_"));
    REQUIRE(left.ensureTables().has_value());
    REQUIRE(right.ensureTables().has_value());

    REQUIRE(left.createEnt(std::string("only_left")).has_value());

    auto leftEnts = left.queryEnts();
    auto rightEnts = right.queryEnts();
    REQUIRE(leftEnts.has_value());
    REQUIRE(rightEnts.has_value());
    CHECK(leftEnts.value().size() == 1);
    CHECK(rightEnts.value().empty());
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: unencodable values surface as errors",
                 "[unit][dao][entity_store]") {
    const Value bad = Value::array({std::string("\xff\xfe")});

    SECTION("createEnt") {
        auto created = store->createEnt(std::string("k"), {{"a", bad}});
        REQUIRE_FALSE(created.has_value());
        CHECK(created.error().code == ErrorCode::SerializationError);
        CHECK(countRows("ents") == 0);
    }

    SECTION("upsertEnt on an existing entity") {
        create("k", {{"a", Value(1)}});
        auto upserted = store->upsertEnt("k", {{"a", bad}});
        REQUIRE_FALSE(upserted.has_value());
        CHECK(upserted.error().code == ErrorCode::SerializationError);
        CHECK(fetch("k").attrs.at("a") == Value(1));
    }

    SECTION("queryEnts filter argument") {
        Query q;
        q.attrFilters.push_back(AttrFilter{"a", "=", bad});
        auto ents = store->queryEnts(q);
        REQUIRE_FALSE(ents.has_value());
        CHECK(ents.error().code == ErrorCode::SerializationError);
    }

    SECTION("executeSql parameter") {
        auto rows = store->executeSql("SELECT :v AS v", {{"v", bad}});
        REQUIRE_FALSE(rows.has_value());
        CHECK(rows.error().code == ErrorCode::SerializationError);
        CHECK_FALSE(db.inTransaction());
    }
}

TEST_CASE_METHOD(EntityStoreFixture, "EntityStore: raw SQL integer parameters",
                 "[unit][dao][entity_store]") {
    SECTION("in range") {
        const auto largest = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        auto rows = store->executeSql("SELECT :v AS v", {{"v", Value(largest)}});
        REQUIRE(rows.has_value());
        REQUIRE(rows.value().has_value());
        CHECK(rows.value()->front().at("v").get<int64_t>() == std::numeric_limits<int64_t>::max());
    }

    SECTION("beyond int64") {
        auto rows = store->executeSql("SELECT :v AS v",
                                      {{"v", Value(std::numeric_limits<uint64_t>::max())}});
        REQUIRE_FALSE(rows.has_value());
        CHECK(rows.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("EntityStore: openEntityStore applies the store config", "[unit][dao][entity_store]") {
    std::ostringstream logs;
    auto logger = std::make_shared<spdlog::logger>(
        "entity_store_test", std::make_shared<spdlog::sinks::ostream_sink_mt>(logs));
    logger->set_level(spdlog::level::off);

    config::StoreConfig cfg;
    cfg.tablePrefix = "cfg_";

    SECTION("table prefix and debug level") {
        cfg.logLevel = spdlog::level::debug;
        storage::Database db;
        auto store = openEntityStore(db, cfg, logger);
        REQUIRE(store.has_value());
        CHECK(logger->level() == spdlog::level::debug);
        CHECK(store.value()->schema().ents().name == "cfg_ents");
        CHECK(db.tableExists("cfg_ents").value());
        CHECK(db.tableExists("cfg_attrs").value());
        CHECK_FALSE(db.tableExists("ents").value());

        REQUIRE(store.value()->createEnt(std::string("k")).has_value());
        CHECK(logs.str().find("createEnt: k") != std::string::npos);
    }

    SECTION("warn level hides debug output") {
        cfg.logLevel = spdlog::level::warn;
        storage::Database db;
        auto store = openEntityStore(db, cfg, logger);
        REQUIRE(store.has_value());
        CHECK(logger->level() == spdlog::level::warn);

        REQUIRE(store.value()->createEnt(std::string("k")).has_value());
        CHECK(logs.str().empty());
    }

    SECTION("without a logger") {
        storage::Database db;
        auto store = openEntityStore(db, cfg);
        REQUIRE(store.has_value());
        REQUIRE(store.value()->createEnt(std::string("k")).has_value());
        CHECK(logs.str().empty());
    }
}

TEST_CASE("EntityStore: store opened from a config file", "[unit][dao][entity_store]") {
    test::ScopedTestFile dbFile(test::unique_test_path("entity_store_cfg_", ".db"));
    test::ScopedTestFile cfgFile(test::unique_test_path("entity_store_cfg_", ".toml"));
    test::write_file(cfgFile.path(), "[store]\n"
                                     "path = \"" + dbFile.path().string() + "\"\n"
                                     "table_prefix = \"app_\"\n"
                                     "log_level = \"error\"\n");

    auto cfg = config::loadStoreConfig(cfgFile.path());
    REQUIRE(cfg.has_value());

    {
        storage::Database db;
        auto store = openEntityStore(db, cfg.value());
        REQUIRE(store.has_value());
        REQUIRE(store.value()->createEnt(std::string("persisted"), {{"a", Value(1)}}).has_value());
    }

    storage::Database reopened;
    auto store = openEntityStore(reopened, cfg.value());
    REQUIRE(store.has_value());
    CHECK(reopened.tableExists("app_ents").value());
    auto ents = store.value()->queryEnts();
    REQUIRE(ents.has_value());
    CHECK(ents.value().at("persisted").attrs.at("a") == Value(1));
}
