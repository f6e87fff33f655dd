#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "query.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace localdoc {

// ============================================================================
// cursor - lazy query handle
// ============================================================================

class cursor {
public:
    using fetch_fn = std::function<std::vector<document>()>;

    explicit cursor(fetch_fn fn) : fetch_(std::move(fn)) {}

    /// Runs the query against the collection's current contents.
    std::vector<document> fetch() const { return fetch_(); }

private:
    fetch_fn fetch_;
};

// ============================================================================
// collection - one named document set with pending-change tracking
// ============================================================================

class collection {
public:
    virtual ~collection() = default;

    virtual const std::string& name() const = 0;

    virtual cursor find(const json& selector = json::object(), const find_options& options = {}) = 0;
    virtual std::optional<document> find_one(const json& selector = json::object(),
                                             const find_options& options = {}) = 0;

    /// Writes each item as a pending upsert. Returns the items as stored
    /// (ids assigned, bases resolved).
    virtual std::vector<upsert_item> upsert(const std::vector<upsert_item>& items) = 0;

    std::vector<upsert_item> upsert(std::vector<document> docs,
                                    std::vector<std::optional<document>> bases = {}) {
        return upsert(regularize_upsert(std::move(docs), std::move(bases)));
    }

    document upsert_one(document doc, std::optional<document> base = std::nullopt) {
        auto stored = upsert(std::vector<upsert_item>{upsert_item{std::move(doc), std::move(base)}});
        return stored.front().doc;
    }

    virtual void remove(const doc_id_t& id) = 0;

    /// Tombstones every current match. Returns how many were removed.
    virtual size_t remove_matching(const json& selector) = 0;

    /// Caches a remote query result and evicts cached entries of the same
    /// query that the result no longer contains.
    virtual void cache(const std::vector<document>& docs, const json& selector,
                       const find_options& options = {}) = 0;
    virtual void cache_one(const document& doc) = 0;
    virtual void cache_list(const std::vector<document>& docs) = 0;

    virtual void uncache(const json& selector) = 0;
    virtual void uncache_list(const std::vector<doc_id_t>& ids) = 0;

    /// Inserts documents whose ids are not present in any state.
    virtual void seed(const std::vector<document>& docs) = 0;

    virtual std::vector<upsert_item> pending_upserts() = 0;
    virtual std::vector<doc_id_t> pending_removes() = 0;

    virtual void resolve_upserts(const std::vector<upsert_resolution>& resolutions) = 0;
    virtual void resolve_remove(const doc_id_t& id) = 0;
};

// ============================================================================
// local_store - owned name -> collection map
// ============================================================================

class local_store {
public:
    virtual ~local_store() = default;

    virtual collection& add_collection(const std::string& name) = 0;

    /// Drops the collection and everything it stored.
    virtual void remove_collection(const std::string& name) = 0;

    /// Throws collection_not_found.
    virtual collection& get_collection(const std::string& name) = 0;

    virtual bool has_collection(const std::string& name) const = 0;
    virtual std::vector<std::string> collection_names() const = 0;

    collection& operator[](const std::string& name) { return get_collection(name); }
};

} // namespace localdoc

#endif // __cplusplus
