#pragma once

#include <localdoc/replicating.hpp>
#include <localdoc/utils.hpp>
#include <localdoc/local_db.hpp>
#include <cassert>
#include <iostream>

namespace replicating_tests {

using localdoc::json;
using localdoc::document;
using localdoc::entry_state;

// ============================================================================
// test_replicating_writes
// ============================================================================

void test_replicating_writes() {
    std::cout << "  test_replicating_writes..." << std::flush;

    localdoc::local_db master(localdoc::memory_storage_factory());
    localdoc::local_db replica(localdoc::memory_storage_factory());
    localdoc::replicating_db db(master, replica);

    auto& things = db.add_collection("things");
    assert(master.has_collection("things") && replica.has_collection("things"));

    // Generated ids are shared by both sides
    auto created = things.upsert_one({{"kind", "new"}});
    auto id = localdoc::doc_id(created);
    assert(master.get_collection("things").find_one(id));
    assert(replica.get_collection("things").find_one(id));

    things.cache_list({json{{"_id", "c1"}, {"v", 1}}, json{{"_id", "c2"}, {"v", 2}}});
    things.upsert_one({{"_id", "c1"}, {"v", 10}});
    auto master_rec = master.get_collection("things").record("c1");
    auto replica_rec = replica.get_collection("things").record("c1");
    assert(master_rec->state == entry_state::upserted && replica_rec->state == entry_state::upserted);
    assert(master_rec->base == replica_rec->base);

    things.remove("c2");
    assert(replica.get_collection("things").record("c2")->state == entry_state::removed);

    // Reads and pending lists come from master only
    replica.get_collection("things").uncache_list({"c1"});
    replica.get_collection("things").resolve_remove("c2");
    assert(things.find_one("c1"));
    assert(things.pending_removes() == std::vector<std::string>{"c2"});

    things.resolve_remove("c2");
    assert(!master.get_collection("things").record("c2"));

    // Counts are reported from master even when the replica disagrees
    things.cache_list({json{{"_id", "m1"}, {"k", 1}}, json{{"_id", "m2"}, {"k", 1}}});
    replica.get_collection("things").uncache_list({"m2"});
    assert(things.remove_matching({{"k", 1}}) == 2);
    assert(replica.get_collection("things").pending_removes().size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_replicating_db
// ============================================================================

void test_replicating_db() {
    std::cout << "  test_replicating_db..." << std::flush;

    localdoc::local_db master(localdoc::memory_storage_factory(), {"existing"});
    localdoc::local_db replica(localdoc::memory_storage_factory());
    localdoc::replicating_db db(master, replica);

    assert((db.collection_names() == std::vector<std::string>{"existing"}));
    assert(replica.has_collection("existing"));
    assert(&db.add_collection("existing") == &db.get_collection("existing"));
    assert(&db["existing"] == &db.get_collection("existing"));

    db.add_collection("other");
    db.remove_collection("other");
    assert(!db.has_collection("other"));
    assert(!master.has_collection("other") && !replica.has_collection("other"));

    bool threw = false;
    try {
        db.remove_collection("other");
    } catch (const localdoc::collection_not_found&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_replicating_under_hybrid - uploads resolve on both sides
// ============================================================================

void test_replicating_under_hybrid() {
    std::cout << "  test_replicating_under_hybrid..." << std::flush;

    localdoc::local_db master(localdoc::memory_storage_factory());
    localdoc::local_db replica(localdoc::memory_storage_factory());
    localdoc::local_db server(localdoc::memory_storage_factory(), {"things"});
    localdoc::replicating_db mirror(master, replica);

    localdoc::hybrid_db db(mirror, [&server](const std::string& name) -> std::unique_ptr<localdoc::remote_endpoint> {
        return std::make_unique<localdoc::local_remote>(server.get_collection(name));
    });
    auto& things = db.add_collection("things");
    things.upsert_one({{"_id", "1"}, {"v", 1}});

    auto report = things.upload().get();
    assert(report.upserted == 1);
    assert(master.get_collection("things").record("1")->state == entry_state::cached);
    assert(replica.get_collection("things").record("1")->state == entry_state::cached);
    assert(server.get_collection("things").find_one("1"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Clone and migrate
// ============================================================================

/// Collection holding one plain cached doc, one edited doc and one tombstone.
void fill_source(localdoc::local_collection& col) {
    col.cache_list({json{{"_id", "a"}, {"v", 1}}, json{{"_id", "b"}, {"v", 1}}, json{{"_id", "c"}, {"v", 1}}});
    col.upsert_one({{"_id", "b"}, {"v", 2}});
    col.remove("c");
}

void test_clone() {
    std::cout << "  test_clone..." << std::flush;

    localdoc::local_db from(localdoc::memory_storage_factory(), {"things", "others"});
    localdoc::local_db to(localdoc::memory_storage_factory());
    fill_source(from.get_collection("things"));
    from.get_collection("others").cache_one({{"_id", "o"}});

    localdoc::clone_local_db(from, to);
    assert((to.collection_names() == std::vector<std::string>{"others", "things"}));

    auto& copy = to.get_collection("things");
    assert(copy.record("a")->state == entry_state::cached);
    auto b = copy.record("b");
    assert(b->state == entry_state::upserted);
    assert(b->doc->at("v") == 2);
    assert((b->base == json{{"_id", "b"}, {"v", 1}}));
    assert(copy.record("c")->state == entry_state::removed);
    assert(to.get_collection("others").find_one("o"));

    // The source is untouched
    assert(from.get_collection("things").pending_upserts().size() == 1);

    std::cout << " OK" << std::endl;
}

void test_migrate() {
    std::cout << "  test_migrate..." << std::flush;

    localdoc::local_db from(localdoc::memory_storage_factory(), {"things", "only_here"});
    localdoc::local_db to(localdoc::memory_storage_factory(), {"things"});
    fill_source(from.get_collection("things"));
    from.get_collection("only_here").upsert_one({{"_id", "x"}});

    auto report = localdoc::migrate_local_db(from, to);
    assert(report.upserted == 1);
    assert(report.removed == 1);
    assert(report.failed == 0);

    // Pending work moved across, with its base
    auto& target = to.get_collection("things");
    auto pending = target.pending_upserts();
    assert(pending.size() == 1);
    assert(pending[0].doc["v"] == 2);
    assert((pending[0].base == json{{"_id", "b"}, {"v", 1}}));
    assert(target.pending_removes() == std::vector<std::string>{"c"});

    // and is no longer pending in the source
    auto& source = from.get_collection("things");
    assert(source.pending_upserts().empty());
    assert(source.pending_removes().empty());

    // Collections the target lacks are left alone
    assert(!to.has_collection("only_here"));
    assert(from.get_collection("only_here").pending_upserts().size() == 1);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Replicating & utility tests" << std::endl;
    test_replicating_writes();
    test_replicating_db();
    test_replicating_under_hybrid();
    test_clone();
    test_migrate();
}

} // namespace replicating_tests
