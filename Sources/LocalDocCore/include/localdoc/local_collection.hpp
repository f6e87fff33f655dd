#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include "storage.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace localdoc {

/// Collection backed by a storage adapter. Every call is one atomic
/// read-modify-write under the collection mutex; memory is updated only after
/// the adapter accepted the change.
class local_collection : public collection {
public:
    /// Loads the adapter's records. Throws missing_adapter for a null adapter.
    local_collection(std::string name, std::unique_ptr<storage_adapter> adapter);

    // Non-copyable
    local_collection(const local_collection&) = delete;
    local_collection& operator=(const local_collection&) = delete;

    const std::string& name() const override { return name_; }

    cursor find(const json& selector = json::object(), const find_options& options = {}) override;
    std::optional<document> find_one(const json& selector = json::object(),
                                     const find_options& options = {}) override;

    using collection::upsert;
    std::vector<upsert_item> upsert(const std::vector<upsert_item>& items) override;

    void remove(const doc_id_t& id) override;
    size_t remove_matching(const json& selector) override;

    void cache(const std::vector<document>& docs, const json& selector,
               const find_options& options = {}) override;
    void cache_one(const document& doc) override;
    void cache_list(const std::vector<document>& docs) override;

    void uncache(const json& selector) override;
    void uncache_list(const std::vector<doc_id_t>& ids) override;

    void seed(const std::vector<document>& docs) override;

    std::vector<upsert_item> pending_upserts() override;
    std::vector<doc_id_t> pending_removes() override;

    void resolve_upserts(const std::vector<upsert_resolution>& resolutions) override;
    void resolve_remove(const doc_id_t& id) override;

    /// State of one id, for inspection.
    std::optional<stored_record> record(const doc_id_t& id) const;

    /// Purges the adapter's data and the in-memory state.
    void destroy();

private:
    struct entry {
        entry_state state = entry_state::cached;
        std::optional<document> doc;
        std::optional<document> base;
    };

    // Pending edits for one operation: nullopt deletes the id
    using change_set = std::map<doc_id_t, std::optional<entry>>;

    std::string name_;
    std::unique_ptr<storage_adapter> adapter_;
    mutable std::mutex mutex_;
    std::map<doc_id_t, entry> entries_;

    const entry* lookup(const doc_id_t& id, const change_set& changes) const;
    std::vector<document> live_documents(const change_set& changes = {}) const;
    void stage_cache(const document& doc, change_set& changes) const;
    void commit(change_set changes);
};

} // namespace localdoc

#endif // __cplusplus
