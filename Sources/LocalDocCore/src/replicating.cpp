#include "localdoc/replicating.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"

namespace localdoc {

replicating_collection::replicating_collection(collection& master, collection& replica)
    : master_(master), replica_(replica) {}

cursor replicating_collection::find(const json& selector, const find_options& options) {
    return master_.find(selector, options);
}

std::optional<document> replicating_collection::find_one(const json& selector, const find_options& options) {
    return master_.find_one(selector, options);
}

std::vector<upsert_item> replicating_collection::upsert(const std::vector<upsert_item>& items) {
    // The replica gets the normalized items so both sides share generated ids
    auto stored = master_.upsert(items);
    std::vector<upsert_item> mirrored;
    mirrored.reserve(stored.size());
    for (size_t i = 0; i < stored.size(); ++i) {
        mirrored.push_back(upsert_item{stored[i].doc, i < items.size() ? items[i].base : std::nullopt});
    }
    replica_.upsert(mirrored);
    return stored;
}

void replicating_collection::remove(const doc_id_t& id) {
    master_.remove(id);
    replica_.remove(id);
}

size_t replicating_collection::remove_matching(const json& selector) {
    size_t removed = master_.remove_matching(selector);
    size_t mirrored = replica_.remove_matching(selector);
    if (removed != mirrored) {
        LOG_WARN("replica", "%s: removed %zu in master but %zu in replica",
                 name().c_str(), removed, mirrored);
    }
    return removed;
}

void replicating_collection::cache(const std::vector<document>& docs, const json& selector,
                                   const find_options& options) {
    master_.cache(docs, selector, options);
    replica_.cache(docs, selector, options);
}

void replicating_collection::cache_one(const document& doc) {
    master_.cache_one(doc);
    replica_.cache_one(doc);
}

void replicating_collection::cache_list(const std::vector<document>& docs) {
    master_.cache_list(docs);
    replica_.cache_list(docs);
}

void replicating_collection::uncache(const json& selector) {
    master_.uncache(selector);
    replica_.uncache(selector);
}

void replicating_collection::uncache_list(const std::vector<doc_id_t>& ids) {
    master_.uncache_list(ids);
    replica_.uncache_list(ids);
}

void replicating_collection::seed(const std::vector<document>& docs) {
    master_.seed(docs);
    replica_.seed(docs);
}

void replicating_collection::resolve_upserts(const std::vector<upsert_resolution>& resolutions) {
    master_.resolve_upserts(resolutions);
    replica_.resolve_upserts(resolutions);
}

void replicating_collection::resolve_remove(const doc_id_t& id) {
    master_.resolve_remove(id);
    replica_.resolve_remove(id);
}

// ============================================================================
// replicating_db
// ============================================================================

replicating_db::replicating_db(local_store& master, local_store& replica)
    : master_(master), replica_(replica) {
    for (const auto& name : master_.collection_names()) {
        attach(name);
    }
}

replicating_collection& replicating_db::attach(const std::string& name) {
    auto& master = master_.add_collection(name);
    auto& replica = replica_.add_collection(name);
    auto col = std::make_unique<replicating_collection>(master, replica);
    auto& ref = *col;
    collections_[name] = std::move(col);
    LOG_DEBUG("replica", "Mirroring collection %s", name.c_str());
    return ref;
}

replicating_collection& replicating_db::add_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it != collections_.end()) {
        return *it->second;
    }
    return attach(name);
}

void replicating_db::remove_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw collection_not_found(name);
    }
    collections_.erase(it);
    master_.remove_collection(name);
    if (replica_.has_collection(name)) {
        replica_.remove_collection(name);
    }
}

replicating_collection& replicating_db::get_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw collection_not_found(name);
    }
    return *it->second;
}

bool replicating_db::has_collection(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.count(name) > 0;
}

std::vector<std::string> replicating_db::collection_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : collections_) {
        names.push_back(name);
    }
    return names;
}

} // namespace localdoc
