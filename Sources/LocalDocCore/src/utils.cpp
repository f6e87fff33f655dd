#include "localdoc/utils.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"

namespace localdoc {

void clone_local_collection(collection& from, collection& to) {
    to.seed(from.find().fetch());

    auto upserts = from.pending_upserts();
    if (!upserts.empty()) {
        to.upsert(upserts);
    }

    for (const auto& id : from.pending_removes()) {
        to.remove(id);
    }
    LOG_DEBUG("local", "Cloned %s (%zu upserts)", from.name().c_str(), upserts.size());
}

void clone_local_db(local_store& from, local_store& to) {
    for (const auto& name : from.collection_names()) {
        auto& target = to.add_collection(name);
        clone_local_collection(from.get_collection(name), target);
    }
}

// ============================================================================
// local_remote
// ============================================================================

void local_remote::find(const remote_query& query, find_handler on_success, error_handler on_error) {
    std::vector<document> docs;
    try {
        docs = target_.find(query.selector, query.options).fetch();
    } catch (const localdoc_error&) {
        on_error(std::current_exception());
        return;
    }
    on_success(std::move(docs));
}

void local_remote::upsert(const std::vector<upsert_item>& items, upsert_handler on_done) {
    std::vector<upsert_outcome> outcomes;
    outcomes.reserve(items.size());
    try {
        for (auto& stored : target_.upsert(items)) {
            outcomes.push_back(upsert_outcome{200, std::move(stored.doc), {}});
        }
    } catch (const localdoc_error& e) {
        LOG_ERROR("local", "Migrating upserts into %s failed: %s", target_.name().c_str(), e.what());
        outcomes.assign(items.size(), upsert_outcome{500, std::nullopt, e.what()});
    }
    on_done(std::move(outcomes));
}

void local_remote::remove(const doc_id_t& id, remove_handler on_done) {
    try {
        target_.remove(id);
    } catch (const localdoc_error& e) {
        LOG_ERROR("local", "Migrating remove of %s into %s failed: %s", id.c_str(),
                  target_.name().c_str(), e.what());
        on_done(remove_outcome{500, e.what()});
        return;
    }
    on_done(remove_outcome{200, {}});
}

upload_report migrate_local_db(local_store& from, local_store& to) {
    hybrid_db migration(from, [&to](const std::string& name) -> std::unique_ptr<remote_endpoint> {
        return std::make_unique<local_remote>(to.get_collection(name));
    });

    for (const auto& name : from.collection_names()) {
        if (to.has_collection(name)) {
            migration.add_collection(name);
        }
    }
    return migration.upload().get();
}

} // namespace localdoc
