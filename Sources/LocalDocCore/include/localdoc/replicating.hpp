#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace localdoc {

// ============================================================================
// replicating_collection - master copy mirrored into a replica
// ============================================================================

/// Writes go to master then replica; reads come from master only. A failure
/// on either side propagates and the two may diverge.
class replicating_collection : public collection {
public:
    replicating_collection(collection& master, collection& replica);

    const std::string& name() const override { return master_.name(); }
    collection& master() { return master_; }
    collection& replica() { return replica_; }

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

    std::vector<upsert_item> pending_upserts() override { return master_.pending_upserts(); }
    std::vector<doc_id_t> pending_removes() override { return master_.pending_removes(); }

    void resolve_upserts(const std::vector<upsert_resolution>& resolutions) override;
    void resolve_remove(const doc_id_t& id) override;

private:
    collection& master_;
    collection& replica_;
};

// ============================================================================
// replicating_db
// ============================================================================

class replicating_db : public local_store {
public:
    /// Mirrors every collection already present in master.
    replicating_db(local_store& master, local_store& replica);

    // Non-copyable
    replicating_db(const replicating_db&) = delete;
    replicating_db& operator=(const replicating_db&) = delete;

    replicating_collection& add_collection(const std::string& name) override;
    void remove_collection(const std::string& name) override;
    replicating_collection& get_collection(const std::string& name) override;

    bool has_collection(const std::string& name) const override;
    std::vector<std::string> collection_names() const override;

    local_store& master() { return master_; }
    local_store& replica() { return replica_; }

private:
    local_store& master_;
    local_store& replica_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<replicating_collection>> collections_;

    replicating_collection& attach(const std::string& name);
};

} // namespace localdoc

#endif // __cplusplus
