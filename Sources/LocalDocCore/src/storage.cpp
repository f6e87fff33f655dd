#include "localdoc/storage.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace localdoc {

// ============================================================================
// stored_record
// ============================================================================

const char* to_string(entry_state state) {
    switch (state) {
        case entry_state::cached: return "cached";
        case entry_state::upserted: return "upserted";
        case entry_state::removed: return "removed";
    }
    return "cached";
}

entry_state parse_entry_state(const std::string& name) {
    if (name == "cached") return entry_state::cached;
    if (name == "upserted") return entry_state::upserted;
    if (name == "removed") return entry_state::removed;
    throw corrupt_storage("Unknown entry state: " + name);
}

json stored_record::to_json() const {
    json out = {{"id", id}, {"state", to_string(state)}};
    if (doc) out["doc"] = *doc;
    if (base) out["base"] = *base;
    return out;
}

stored_record stored_record::from_json(const json& value) {
    if (!value.is_object() || !value.contains("id") || !value["id"].is_string() ||
        !value.contains("state") || !value["state"].is_string()) {
        throw corrupt_storage("Malformed stored record: " + value.dump());
    }
    stored_record rec;
    rec.id = value["id"].get<std::string>();
    rec.state = parse_entry_state(value["state"].get<std::string>());
    if (auto it = value.find("doc"); it != value.end() && !it->is_null()) rec.doc = *it;
    if (auto it = value.find("base"); it != value.end() && !it->is_null()) rec.base = *it;
    return rec;
}

// ============================================================================
// memory_storage
// ============================================================================

std::vector<stored_record> memory_storage::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<stored_record> out;
    out.reserve(records_.size());
    for (const auto& [_, rec] : records_) {
        out.push_back(rec);
    }
    return out;
}

void memory_storage::persist(const std::vector<stored_record>& upserts,
                             const std::vector<doc_id_t>& removals) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& rec : upserts) {
        records_[rec.id] = rec;
    }
    for (const auto& id : removals) {
        records_.erase(id);
    }
}

void memory_storage::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ============================================================================
// log_file_storage
// ============================================================================

log_file_storage::log_file_storage(std::string path) : path_(std::move(path)) {
    std::ofstream touch(path_, std::ios::app);
    if (!touch) {
        throw adapter_io_error("Cannot open log file: " + path_);
    }
}

std::map<doc_id_t, stored_record> log_file_storage::replay() {
    std::map<doc_id_t, stored_record> records;
    std::ifstream in(path_);
    if (!in) {
        throw adapter_io_error("Cannot read log file: " + path_);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        json entry = json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object() || !entry.contains("op")) {
            throw corrupt_storage(path_ + ":" + std::to_string(line_no) + ": malformed entry");
        }

        const auto& op = entry["op"];
        if (op == "put") {
            auto rec = stored_record::from_json(entry.value("rec", json()));
            records[rec.id] = std::move(rec);
        } else if (op == "del" && entry.contains("id") && entry["id"].is_string()) {
            records.erase(entry["id"].get<std::string>());
        } else {
            throw corrupt_storage(path_ + ":" + std::to_string(line_no) + ": unknown entry");
        }
    }
    if (in.bad()) {
        throw adapter_io_error("Failed reading log file: " + path_);
    }
    return records;
}

std::vector<stored_record> log_file_storage::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<stored_record> out;
    for (auto& [_, rec] : replay()) {
        out.push_back(std::move(rec));
    }
    return out;
}

void log_file_storage::persist(const std::vector<stored_record>& upserts,
                               const std::vector<doc_id_t>& removals) {
    if (upserts.empty() && removals.empty()) return;

    // Build the whole batch first so a single write carries it
    std::ostringstream batch;
    for (const auto& rec : upserts) {
        batch << json{{"op", "put"}, {"rec", rec.to_json()}}.dump() << '\n';
    }
    for (const auto& id : removals) {
        batch << json{{"op", "del"}, {"id", id}}.dump() << '\n';
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app | std::ios::binary);
    out << batch.str();
    out.flush();
    if (!out) {
        LOG_ERROR("storage", "Append to %s failed", path_.c_str());
        throw adapter_io_error("Failed writing log file: " + path_);
    }
}

void log_file_storage::compact() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = replay();

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc | std::ios::binary);
        for (const auto& [_, rec] : records) {
            out << json{{"op", "put"}, {"rec", rec.to_json()}}.dump() << '\n';
        }
        out.flush();
        if (!out) {
            throw adapter_io_error("Failed writing " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw adapter_io_error("Failed replacing " + path_ + ": " + ec.message());
    }
    LOG_DEBUG("storage", "Compacted %s to %zu records", path_.c_str(), records.size());
}

void log_file_storage::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw adapter_io_error("Failed truncating log file: " + path_);
    }
}

// ============================================================================
// sqlite_storage
// ============================================================================

sqlite_storage::sqlite_storage(std::shared_ptr<sqlite_database> db, const std::string& collection_name)
    : db_(std::move(db)), table_("docs_" + collection_name) {
    if (!db_) {
        throw missing_adapter("sqlite_storage needs a database");
    }
    ensure_table();
}

void sqlite_storage::ensure_table() {
    db_->execute("CREATE TABLE IF NOT EXISTS " + quote_identifier(table_) +
                 " (id TEXT PRIMARY KEY, state TEXT NOT NULL, doc TEXT, base TEXT)");
}

static std::optional<document> parse_column(const column_value_t& value, const std::string& table) {
    if (std::holds_alternative<std::nullptr_t>(value)) return std::nullopt;
    if (!std::holds_alternative<std::string>(value)) {
        throw corrupt_storage("Unexpected column type in " + table);
    }
    json parsed = json::parse(std::get<std::string>(value), nullptr, false);
    if (parsed.is_discarded()) {
        throw corrupt_storage("Malformed JSON in " + table);
    }
    return parsed;
}

std::vector<stored_record> sqlite_storage::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = db_->query("SELECT id, state, doc, base FROM " + quote_identifier(table_) + " ORDER BY id");

    std::vector<stored_record> out;
    out.reserve(rows.size());
    for (auto& row : rows) {
        if (!std::holds_alternative<std::string>(row["id"]) ||
            !std::holds_alternative<std::string>(row["state"])) {
            throw corrupt_storage("Malformed row in " + table_);
        }
        stored_record rec;
        rec.id = std::get<std::string>(row["id"]);
        rec.state = parse_entry_state(std::get<std::string>(row["state"]));
        rec.doc = parse_column(row["doc"], table_);
        rec.base = parse_column(row["base"], table_);
        out.push_back(std::move(rec));
    }
    return out;
}

void sqlite_storage::persist(const std::vector<stored_record>& upserts,
                             const std::vector<doc_id_t>& removals) {
    if (upserts.empty() && removals.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto table = quote_identifier(table_);
    transaction txn(*db_);

    for (const auto& rec : upserts) {
        db_->execute("INSERT INTO " + table + " (id, state, doc, base) VALUES (?, ?, ?, ?) "
                     "ON CONFLICT (id) DO UPDATE SET state = excluded.state, "
                     "doc = excluded.doc, base = excluded.base",
                     {rec.id,
                      std::string(to_string(rec.state)),
                      rec.doc ? column_value_t(rec.doc->dump()) : column_value_t(nullptr),
                      rec.base ? column_value_t(rec.base->dump()) : column_value_t(nullptr)});
    }
    for (const auto& id : removals) {
        db_->execute("DELETE FROM " + table + " WHERE id = ?", {id});
    }

    txn.commit();
}

void sqlite_storage::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_->execute("DROP TABLE IF EXISTS " + quote_identifier(table_));
    ensure_table();
}

// ============================================================================
// Selection
// ============================================================================

const char* to_string(storage_kind kind) {
    switch (kind) {
        case storage_kind::memory: return "memory";
        case storage_kind::log_file: return "log_file";
        case storage_kind::sqlite: return "sqlite";
    }
    return "memory";
}

static bool viable(storage_kind kind, const storage_probe& probe) {
    switch (kind) {
        case storage_kind::memory: return true;
        case storage_kind::log_file: return probe.directory_writable;
        case storage_kind::sqlite: return probe.sqlite_available && probe.directory_writable;
    }
    return false;
}

storage_kind choose_storage(const storage_probe& probe) {
    if (probe.preference && viable(*probe.preference, probe)) {
        return *probe.preference;
    }
    if (viable(storage_kind::sqlite, probe)) return storage_kind::sqlite;
    if (viable(storage_kind::log_file, probe)) return storage_kind::log_file;
    return storage_kind::memory;
}

storage_probe probe_storage(const storage_config& config) {
    storage_probe probe;
    probe.preference = config.kind_preference;
    // ON CONFLICT ... DO UPDATE needs 3.24
    probe.sqlite_available = sqlite3_libversion_number() >= 3024000;

    if (!config.directory.empty()) {
        std::error_code ec;
        fs::create_directories(config.directory, ec);
        if (!ec && fs::is_directory(config.directory, ec)) {
            auto marker = fs::path(config.directory) / ".localdoc-probe";
            std::ofstream out(marker);
            probe.directory_writable = static_cast<bool>(out);
            out.close();
            fs::remove(marker, ec);
        }
    }
    return probe;
}

storage_factory make_storage_factory(const storage_config& config) {
    auto probe = probe_storage(config);
    auto kind = choose_storage(probe);
    LOG_INFO("storage", "Using %s storage", to_string(kind));

    // Opened on first use and shared by every collection
    auto shared_db = std::make_shared<std::shared_ptr<sqlite_database>>();
    auto db_mutex = std::make_shared<std::mutex>();

    return [config, kind, shared_db, db_mutex](const std::string& name) -> std::unique_ptr<storage_adapter> {
        if (kind == storage_kind::sqlite) {
            try {
                std::lock_guard<std::mutex> lock(*db_mutex);
                if (!*shared_db) {
                    auto path = (fs::path(config.directory) / config.sqlite_file_name).string();
                    *shared_db = std::make_shared<sqlite_database>(path);
                }
                return std::make_unique<sqlite_storage>(*shared_db, name);
            } catch (const adapter_io_error& e) {
                LOG_WARN("storage", "SQLite storage for %s failed (%s), falling back to log file",
                         name.c_str(), e.what());
            }
        }
        if (kind != storage_kind::memory) {
            try {
                auto path = (fs::path(config.directory) / (name + ".jsonl")).string();
                return std::make_unique<log_file_storage>(path);
            } catch (const adapter_io_error& e) {
                LOG_WARN("storage", "Log file storage for %s failed (%s), falling back to memory",
                         name.c_str(), e.what());
            }
        }
        return std::make_unique<memory_storage>();
    };
}

storage_factory memory_storage_factory() {
    return [](const std::string&) -> std::unique_ptr<storage_adapter> {
        return std::make_unique<memory_storage>();
    };
}

} // namespace localdoc
