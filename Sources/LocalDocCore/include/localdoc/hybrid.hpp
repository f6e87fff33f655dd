#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include "delivery.hpp"
#include "remote.hpp"
#include "scheduler.hpp"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace localdoc {

// ============================================================================
// Options
// ============================================================================

/// Unset fields inherit: per-call over per-collection over database-wide.
struct hybrid_options {
    std::optional<bool> interim;                    // deliver the local result first (true)
    std::optional<bool> cache_find;                 // cache remote find results (true)
    std::optional<bool> cache_find_one;             // cache remote find_one results (true)
    std::optional<bool> shortcut;                   // find_one skips the remote on a local hit (false)
    std::optional<bool> use_local_on_remote_error;  // without interim, fall back to local (true)

    struct resolved {
        bool interim = true;
        bool cache_find = true;
        bool cache_find_one = true;
        bool shortcut = false;
        bool use_local_on_remote_error = true;
    };

    /// Fields set here win over `outer`.
    hybrid_options merged_over(const hybrid_options& outer) const;

    /// Fills unset fields with the defaults.
    resolved resolve() const;
};

struct upload_report {
    size_t upserted = 0;
    size_t removed = 0;
    size_t failed = 0;
    std::vector<doc_id_t> discarded;   // abandoned after 403 / 410

    void merge(const upload_report& other);
};

using find_channel = std::shared_ptr<delivery_channel<std::vector<document>>>;
using find_one_channel = std::shared_ptr<delivery_channel<std::optional<document>>>;

// ============================================================================
// hybrid_collection - local collection fronting a remote one
// ============================================================================

class hybrid_collection {
public:
    using upload_callback = std::function<void(upload_report, std::exception_ptr)>;

    hybrid_collection(collection& local,
                      std::shared_ptr<remote_endpoint> remote,
                      hybrid_options options,
                      shared_scheduler sched);
    ~hybrid_collection();

    hybrid_collection(const hybrid_collection&) = delete;
    hybrid_collection& operator=(const hybrid_collection&) = delete;

    const std::string& name() const { return name_; }
    collection& local() { return local_; }
    remote_endpoint& remote() { return *remote_; }
    const hybrid_options& options() const { return options_; }

    /// Local answer first (interim), then the remote-confirmed answer when it
    /// differs. Validation errors throw synchronously.
    find_channel find(const json& selector = json::object(),
                      const find_options& options = {},
                      const hybrid_options& call_options = {});

    /// Never delivers an interim null.
    find_one_channel find_one(const json& selector = json::object(),
                              const find_options& options = {},
                              const hybrid_options& call_options = {});

    // Local writes, uploaded by upload()
    std::vector<upsert_item> upsert(std::vector<document> docs,
                                    std::vector<std::optional<document>> bases = {}) {
        return local_.upsert(std::move(docs), std::move(bases));
    }
    document upsert_one(document doc, std::optional<document> base = std::nullopt) {
        return local_.upsert_one(std::move(doc), std::move(base));
    }
    void remove(const doc_id_t& id) { local_.remove(id); }

    /// Sends pending upserts as one batch, then pending removes. Callers
    /// must not start another upload before this one finished.
    std::future<upload_report> upload();
    void upload_async(upload_callback done);

    /// Shared with in-flight callbacks; `local` is cleared on destruction so
    /// replies arriving afterwards are dropped instead of touching it.
    struct local_handle;

private:
    friend class hybrid_db;

    /// Stops in-flight callbacks from reaching the local collection.
    void detach();

    collection& local_;
    std::string name_;
    std::shared_ptr<local_handle> handle_;
    std::shared_ptr<remote_endpoint> remote_;
    hybrid_options options_;
    shared_scheduler scheduler_;
};

// ============================================================================
// hybrid_db
// ============================================================================

using remote_factory = std::function<std::unique_ptr<remote_endpoint>(const std::string& name)>;

/// Remote factory producing HTTP remote_collections sharing one client.
remote_factory http_remote_factory(remote_config config, std::shared_ptr<http_client> client);

class hybrid_db {
public:
    /// A null scheduler means immediate_scheduler.
    hybrid_db(local_store& local, remote_factory remotes,
              hybrid_options options = {}, shared_scheduler sched = nullptr);

    // Non-copyable
    hybrid_db(const hybrid_db&) = delete;
    hybrid_db& operator=(const hybrid_db&) = delete;

    /// Creates the local collection when missing. Returns the existing
    /// hybrid collection when the name is already present.
    hybrid_collection& add_collection(const std::string& name, const hybrid_options& options = {});
    void remove_collection(const std::string& name);

    /// Throws collection_not_found.
    hybrid_collection& get_collection(const std::string& name);
    hybrid_collection& operator[](const std::string& name) { return get_collection(name); }

    std::vector<std::string> collection_names() const;

    local_store& local() { return local_; }
    const shared_scheduler& get_scheduler() const { return scheduler_; }

    /// Uploads every collection in name order, stopping at the first failure.
    std::future<upload_report> upload();

private:
    local_store& local_;
    remote_factory remotes_;
    hybrid_options options_;
    shared_scheduler scheduler_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<hybrid_collection>> collections_;
};

} // namespace localdoc

#endif // __cplusplus
