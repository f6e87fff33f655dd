#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include "hybrid.hpp"
#include "remote.hpp"
#include <string>

namespace localdoc {

// ============================================================================
// Cloning
// ============================================================================

/// Copies documents, pending upserts (with bases) and pending removes.
void clone_local_collection(collection& from, collection& to);

/// Creates the collections `to` lacks, then clones each one.
void clone_local_db(local_store& from, local_store& to);

// ============================================================================
// Migration
// ============================================================================

/// remote_endpoint answered by another local collection. Upserts land there as
/// pending upserts, so uploading through it moves pending work across stores.
class local_remote : public remote_endpoint {
public:
    explicit local_remote(collection& target) : target_(target) {}

    const std::string& name() const override { return target_.name(); }

    void find(const remote_query& query, find_handler on_success, error_handler on_error) override;
    void upsert(const std::vector<upsert_item>& items, upsert_handler on_done) override;
    void remove(const doc_id_t& id, remove_handler on_done) override;

private:
    collection& target_;
};

/// Uploads `from`'s pending changes into `to` for every collection both hold.
/// Throws the first failure.
upload_report migrate_local_db(local_store& from, local_store& to);

} // namespace localdoc

#endif // __cplusplus
