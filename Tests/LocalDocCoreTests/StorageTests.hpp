#pragma once

#include <localdoc/storage.hpp>
#include <localdoc/db.hpp>
#include <localdoc/errors.hpp>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace storage_tests {

using localdoc::json;
using localdoc::stored_record;
using localdoc::entry_state;

/// Fresh scratch directory under the system temp dir.
std::filesystem::path scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("localdoc_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::vector<stored_record> sample_records() {
    return {
        stored_record{"a", entry_state::cached, json{{"_id", "a"}, {"n", 1}}, std::nullopt},
        stored_record{"b", entry_state::upserted, json{{"_id", "b"}, {"n", 2}}, json{{"_id", "b"}, {"n", 1}}},
        stored_record{"c", entry_state::removed, std::nullopt, std::nullopt},
    };
}

/// Contract every adapter must meet: load reflects all prior persists.
void check_adapter_contract(localdoc::storage_adapter& adapter) {
    assert(adapter.load_all().empty());

    auto records = sample_records();
    adapter.persist(records, {});
    auto loaded = adapter.load_all();
    assert(loaded.size() == 3);
    for (const auto& rec : records) {
        assert(std::find(loaded.begin(), loaded.end(), rec) != loaded.end());
    }

    // Replacement and removal in one batch
    stored_record updated{"a", entry_state::upserted, json{{"_id", "a"}, {"n", 5}}, json{{"_id", "a"}, {"n", 1}}};
    adapter.persist({updated}, {"c"});
    loaded = adapter.load_all();
    assert(loaded.size() == 2);
    assert(std::find(loaded.begin(), loaded.end(), updated) != loaded.end());
    for (const auto& rec : loaded) assert(rec.id != "c");

    // Empty batches are harmless
    adapter.persist({}, {});
    assert(adapter.load_all().size() == 2);

    adapter.destroy();
    assert(adapter.load_all().empty());
}

// ============================================================================
// test_stored_record_json
// ============================================================================

void test_stored_record_json() {
    std::cout << "  test_stored_record_json..." << std::flush;

    for (const auto& rec : sample_records()) {
        assert(stored_record::from_json(rec.to_json()) == rec);
    }
    assert(!sample_records()[2].to_json().contains("doc"));

    bool threw = false;
    try {
        stored_record::from_json({{"id", "x"}, {"state", "zombie"}});
    } catch (const localdoc::corrupt_storage&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Adapters
// ============================================================================

void test_memory_storage() {
    std::cout << "  test_memory_storage..." << std::flush;

    localdoc::memory_storage adapter;
    check_adapter_contract(adapter);

    std::cout << " OK" << std::endl;
}

void test_log_file_storage() {
    std::cout << "  test_log_file_storage..." << std::flush;

    auto dir = scratch_dir("log_file");
    auto path = (dir / "things.jsonl").string();

    {
        localdoc::log_file_storage adapter(path);
        check_adapter_contract(adapter);
        adapter.persist(sample_records(), {"b"});
    }

    // Replayed by a new instance
    localdoc::log_file_storage reopened(path);
    auto loaded = reopened.load_all();
    assert(loaded.size() == 2);

    // Compaction keeps the same records in fewer lines
    reopened.compact();
    assert(reopened.load_all() == loaded);
    size_t lines = 0;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) ++lines;
    assert(lines == 2);

    std::filesystem::remove_all(dir);
    std::cout << " OK" << std::endl;
}

void test_log_file_corruption() {
    std::cout << "  test_log_file_corruption..." << std::flush;

    auto dir = scratch_dir("corrupt");
    auto path = (dir / "bad.jsonl").string();
    {
        std::ofstream out(path);
        out << json{{"op", "put"}, {"rec", sample_records()[0].to_json()}}.dump() << "\n";
        out << "{not json\n";
    }

    localdoc::log_file_storage adapter(path);
    bool threw = false;
    try {
        adapter.load_all();
    } catch (const localdoc::corrupt_storage& e) {
        threw = true;
        assert(std::string(e.what()).find(":2") != std::string::npos);
    }
    assert(threw);

    std::filesystem::remove_all(dir);
    std::cout << " OK" << std::endl;
}

void test_sqlite_storage() {
    std::cout << "  test_sqlite_storage..." << std::flush;

    auto dir = scratch_dir("sqlite");
    auto path = (dir / "store.sqlite").string();

    {
        auto db = std::make_shared<localdoc::sqlite_database>(path);
        localdoc::sqlite_storage adapter(db, "things");
        check_adapter_contract(adapter);
        adapter.persist(sample_records(), {});

        // Collections share the file but not the table
        localdoc::sqlite_storage other(db, "others");
        assert(other.load_all().empty());
        assert(db->table_exists("docs_things"));
    }

    auto db = std::make_shared<localdoc::sqlite_database>(path);
    localdoc::sqlite_storage reopened(db, "things");
    assert(reopened.load_all().size() == 3);

    std::filesystem::remove_all(dir);
    std::cout << " OK" << std::endl;
}

void test_sqlite_transaction_rollback() {
    std::cout << "  test_sqlite_transaction_rollback..." << std::flush;

    localdoc::sqlite_database db(":memory:");
    db.execute("CREATE TABLE t (id TEXT PRIMARY KEY)");
    {
        localdoc::transaction txn(db);
        db.execute("INSERT INTO t (id) VALUES (?)", {std::string("x")});
        // No commit: the guard rolls back
    }
    assert(db.query("SELECT id FROM t").empty());
    assert(!db.is_in_transaction());

    bool threw = false;
    try {
        db.execute("INSERT INTO missing_table VALUES (1)");
    } catch (const localdoc::sqlite_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_sqlite_shared_connection_threads() {
    std::cout << "  test_sqlite_shared_connection_threads..." << std::flush;

    auto dir = scratch_dir("sqlite_threads");
    auto db = std::make_shared<localdoc::sqlite_database>((dir / "shared.db").string());
    localdoc::sqlite_storage left(db, "left");
    localdoc::sqlite_storage right(db, "right");

    constexpr int batches = 200;
    std::atomic<int> failures{0};
    auto writer = [&](localdoc::sqlite_storage& storage, const std::string& prefix) {
        for (int i = 0; i < batches; ++i) {
            std::string id = prefix + std::to_string(i);
            try {
                storage.persist({stored_record{id, entry_state::cached, json{{"_id", id}}, std::nullopt}}, {});
            } catch (const localdoc::localdoc_error& e) {
                std::cerr << e.what() << std::endl;
                failures++;
            }
        }
    };

    std::thread a(writer, std::ref(left), "l");
    std::thread b(writer, std::ref(right), "r");
    a.join();
    b.join();

    assert(failures == 0);
    assert(left.load_all().size() == static_cast<size_t>(batches));
    assert(right.load_all().size() == static_cast<size_t>(batches));
    assert(!db->is_in_transaction());

    std::filesystem::remove_all(dir);
    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_choose_storage - pure decision function
// ============================================================================

void test_choose_storage() {
    std::cout << "  test_choose_storage..." << std::flush;

    using localdoc::storage_kind;
    using localdoc::storage_probe;

    assert(localdoc::choose_storage(storage_probe{true, true, std::nullopt}) == storage_kind::sqlite);
    assert(localdoc::choose_storage(storage_probe{false, true, std::nullopt}) == storage_kind::log_file);
    assert(localdoc::choose_storage(storage_probe{true, false, std::nullopt}) == storage_kind::memory);
    assert(localdoc::choose_storage(storage_probe{false, false, std::nullopt}) == storage_kind::memory);

    // A viable preference wins; an unviable one is ignored
    assert(localdoc::choose_storage(storage_probe{true, true, storage_kind::log_file}) == storage_kind::log_file);
    assert(localdoc::choose_storage(storage_probe{true, true, storage_kind::memory}) == storage_kind::memory);
    assert(localdoc::choose_storage(storage_probe{false, true, storage_kind::sqlite}) == storage_kind::log_file);

    std::cout << " OK" << std::endl;
}

void test_storage_factory() {
    std::cout << "  test_storage_factory..." << std::flush;

    auto dir = scratch_dir("factory");

    localdoc::storage_config config;
    config.directory = dir.string();
    config.kind_preference = localdoc::storage_kind::log_file;
    assert(localdoc::probe_storage(config).directory_writable);

    auto factory = localdoc::make_storage_factory(config);
    auto adapter = factory("things");
    assert(dynamic_cast<localdoc::log_file_storage*>(adapter.get()) != nullptr);
    assert(std::filesystem::exists(dir / "things.jsonl"));

    // No directory means memory
    auto memory = localdoc::make_storage_factory(localdoc::storage_config{})("things");
    assert(dynamic_cast<localdoc::memory_storage*>(memory.get()) != nullptr);

    std::filesystem::remove_all(dir);
    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Storage tests" << std::endl;
    test_stored_record_json();
    test_memory_storage();
    test_log_file_storage();
    test_log_file_corruption();
    test_sqlite_storage();
    test_sqlite_transaction_rollback();
    test_sqlite_shared_connection_threads();
    test_choose_storage();
    test_storage_factory();
}

} // namespace storage_tests
