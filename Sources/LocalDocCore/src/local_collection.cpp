#include "localdoc/local_collection.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"
#include <set>

namespace localdoc {

// ============================================================================
// Upsert normalization
// ============================================================================

static void normalize_item(upsert_item& item) {
    if (!item.doc.is_object()) {
        throw validation_error("Upserted document must be an object");
    }
    auto id = item.doc.find(id_field);
    if (id == item.doc.end() || id->is_null()) {
        item.doc[id_field] = create_uid();
    } else if (!id->is_string()) {
        throw validation_error("Document _id must be a string");
    }
    if (item.base && item.base->is_null()) {
        item.base.reset();
    }
    if (item.base && doc_id(*item.base) != doc_id(item.doc)) {
        throw base_id_mismatch("Base id " + doc_id(*item.base) + " does not match doc id " + doc_id(item.doc));
    }
}

std::vector<upsert_item> regularize_upsert(std::vector<document> docs,
                                           std::vector<std::optional<document>> bases) {
    if (!bases.empty() && bases.size() != docs.size()) {
        throw validation_error("Bases must match docs in length");
    }
    std::vector<upsert_item> items;
    items.reserve(docs.size());
    for (size_t i = 0; i < docs.size(); ++i) {
        upsert_item item{std::move(docs[i]), bases.empty() ? std::nullopt : std::move(bases[i])};
        normalize_item(item);
        items.push_back(std::move(item));
    }
    return items;
}

// ============================================================================
// local_collection
// ============================================================================

local_collection::local_collection(std::string name, std::unique_ptr<storage_adapter> adapter)
    : name_(std::move(name)), adapter_(std::move(adapter)) {
    if (!adapter_) {
        throw missing_adapter("No storage adapter for collection " + name_);
    }
    for (auto& rec : adapter_->load_all()) {
        if (rec.state != entry_state::removed && !rec.doc) {
            throw corrupt_storage("Record " + rec.id + " in " + name_ + " has no document");
        }
        entries_[rec.id] = entry{rec.state, std::move(rec.doc), std::move(rec.base)};
    }
    LOG_DEBUG("local", "Loaded %zu records into %s", entries_.size(), name_.c_str());
}

const local_collection::entry* local_collection::lookup(const doc_id_t& id, const change_set& changes) const {
    auto staged = changes.find(id);
    if (staged != changes.end()) {
        return staged->second ? &*staged->second : nullptr;
    }
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<document> local_collection::live_documents(const change_set& changes) const {
    std::vector<document> docs;
    docs.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        if (changes.count(id)) continue;
        if (e.state != entry_state::removed) docs.push_back(*e.doc);
    }
    for (const auto& [id, e] : changes) {
        if (e && e->state != entry_state::removed) docs.push_back(*e->doc);
    }
    return docs;
}

void local_collection::commit(change_set changes) {
    if (changes.empty()) return;

    std::vector<stored_record> upserts;
    std::vector<doc_id_t> removals;
    for (const auto& [id, e] : changes) {
        if (e) {
            upserts.push_back(stored_record{id, e->state, e->doc, e->base});
        } else {
            removals.push_back(id);
        }
    }

    adapter_->persist(upserts, removals);

    for (auto& [id, e] : changes) {
        if (e) {
            entries_[id] = std::move(*e);
        } else {
            entries_.erase(id);
        }
    }
}

// ============================================================================
// Reads
// ============================================================================

cursor local_collection::find(const json& selector, const find_options& options) {
    auto compiled = compile_selector(selector);
    return cursor([this, compiled = std::move(compiled), options]() {
        std::vector<document> docs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            docs = live_documents();
        }
        return process_find(std::move(docs), compiled, options);
    });
}

std::optional<document> local_collection::find_one(const json& selector, const find_options& options) {
    auto limited = options;
    limited.limit = 1;
    auto docs = find(selector, limited).fetch();
    if (docs.empty()) return std::nullopt;
    return std::move(docs.front());
}

std::vector<upsert_item> local_collection::pending_upserts() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<upsert_item> items;
    for (const auto& [id, e] : entries_) {
        if (e.state == entry_state::upserted) {
            items.push_back(upsert_item{*e.doc, e.base});
        }
    }
    return items;
}

std::vector<doc_id_t> local_collection::pending_removes() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<doc_id_t> ids;
    for (const auto& [id, e] : entries_) {
        if (e.state == entry_state::removed) ids.push_back(id);
    }
    return ids;
}

std::optional<stored_record> local_collection::record(const doc_id_t& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return stored_record{id, it->second.state, it->second.doc, it->second.base};
}

// ============================================================================
// Local writes
// ============================================================================

std::vector<upsert_item> local_collection::upsert(const std::vector<upsert_item>& items) {
    std::vector<upsert_item> normalized = items;
    for (auto& item : normalized) {
        normalize_item(item);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    std::vector<upsert_item> stored;
    stored.reserve(normalized.size());

    for (auto& item : normalized) {
        auto id = doc_id(item.doc);
        const entry* existing = lookup(id, changes);

        // The first base of a pending upsert is kept until resolved
        std::optional<document> base;
        if (existing && existing->state == entry_state::upserted && existing->base) {
            base = existing->base;
        } else if (item.base) {
            base = item.base;
        } else if (existing && existing->state == entry_state::cached) {
            base = existing->doc;
        }

        changes[id] = entry{entry_state::upserted, item.doc, base};
        stored.push_back(upsert_item{std::move(item.doc), std::move(base)});
    }

    commit(std::move(changes));
    return stored;
}

void local_collection::remove(const doc_id_t& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    const entry* existing = lookup(id, changes);
    if (existing && existing->state == entry_state::removed) return;

    changes[id] = entry{entry_state::removed, std::nullopt, std::nullopt};
    commit(std::move(changes));
}

size_t local_collection::remove_matching(const json& selector) {
    auto compiled = compile_selector(selector);

    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    for (const auto& doc : process_find(live_documents(), compiled)) {
        changes[doc_id(doc)] = entry{entry_state::removed, std::nullopt, std::nullopt};
    }
    size_t count = changes.size();
    commit(std::move(changes));
    return count;
}

// ============================================================================
// Server-sourced writes
// ============================================================================

void local_collection::stage_cache(const document& doc, change_set& changes) const {
    auto id = doc_id(doc);
    if (id.empty()) {
        throw validation_error("Cached document needs a string _id");
    }
    const entry* existing = lookup(id, changes);
    if (existing && existing->state != entry_state::cached) {
        return;  // pending local state wins
    }
    if (existing && is_stale_revision(doc, *existing->doc)) {
        LOG_DEBUG("local", "Ignoring stale revision of %s in %s", id.c_str(), name_.c_str());
        return;
    }
    changes[id] = entry{entry_state::cached, doc, std::nullopt};
}

void local_collection::cache_list(const std::vector<document>& docs) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    for (const auto& doc : docs) {
        stage_cache(doc, changes);
    }
    commit(std::move(changes));
}

void local_collection::cache_one(const document& doc) {
    cache_list({doc});
}

void local_collection::cache(const std::vector<document>& docs, const json& selector,
                             const find_options& options) {
    auto compiled = compile_selector(selector);

    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    std::set<doc_id_t> returned;
    for (const auto& doc : docs) {
        stage_cache(doc, changes);
        returned.insert(doc_id(doc));
    }

    // Evict cached entries of this query that the remote no longer returns
    auto window = options;
    window.fields.reset();
    bool sorted_full_window = options.sort && options.limit && !docs.empty() &&
                              docs.size() == *options.limit;
    auto cmp = sorted_full_window ? compile_sort(*options.sort) : document_comparator();

    for (const auto& doc : process_find(live_documents(changes), compiled, window)) {
        auto id = doc_id(doc);
        if (returned.count(id)) continue;

        const entry* existing = lookup(id, changes);
        if (!existing || existing->state != entry_state::cached) continue;

        // Past the end of a full sorted window: outside what the remote answered for
        if (sorted_full_window && cmp(doc, docs.back()) >= 0) continue;

        changes[id] = std::nullopt;
    }

    commit(std::move(changes));
}

void local_collection::uncache(const json& selector) {
    auto compiled = compile_selector(selector);

    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    for (const auto& [id, e] : entries_) {
        if (e.state == entry_state::cached && compiled.matches(*e.doc)) {
            changes[id] = std::nullopt;
        }
    }
    commit(std::move(changes));
}

void local_collection::uncache_list(const std::vector<doc_id_t>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    for (const auto& id : ids) {
        auto it = entries_.find(id);
        if (it != entries_.end() && it->second.state == entry_state::cached) {
            changes[id] = std::nullopt;
        }
    }
    commit(std::move(changes));
}

void local_collection::seed(const std::vector<document>& docs) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    for (const auto& doc : docs) {
        auto id = doc_id(doc);
        if (id.empty()) {
            throw validation_error("Seeded document needs a string _id");
        }
        if (lookup(id, changes)) continue;
        changes[id] = entry{entry_state::cached, doc, std::nullopt};
    }
    commit(std::move(changes));
}

void local_collection::resolve_upserts(const std::vector<upsert_resolution>& resolutions) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_set changes;
    for (const auto& res : resolutions) {
        auto id = doc_id(res.doc);
        const entry* existing = lookup(id, changes);
        if (!existing || existing->state != entry_state::upserted) continue;

        const document& server = res.merged ? *res.merged : res.doc;
        if (*existing->doc == res.doc) {
            // Nothing changed locally since the upload
            const document& value = is_stale_revision(server, res.doc) ? res.doc : server;
            changes[id] = entry{entry_state::cached, value, std::nullopt};
        } else {
            // A newer local edit: keep it, merge it against the server's result next time
            changes[id] = entry{entry_state::upserted, existing->doc, server};
        }
    }
    commit(std::move(changes));
}

void local_collection::resolve_remove(const doc_id_t& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.state != entry_state::removed) return;

    change_set changes;
    changes[id] = std::nullopt;
    commit(std::move(changes));
}

void local_collection::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    adapter_->destroy();
    entries_.clear();
}

} // namespace localdoc
