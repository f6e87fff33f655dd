#include "localdoc/hybrid.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"
#include <atomic>
#include <set>

namespace localdoc {

struct hybrid_collection::local_handle {
    std::mutex mutex;
    collection* local = nullptr;
};

using local_handle_ptr = std::shared_ptr<hybrid_collection::local_handle>;

// ============================================================================
// Options
// ============================================================================

hybrid_options hybrid_options::merged_over(const hybrid_options& outer) const {
    hybrid_options out;
    out.interim = interim ? interim : outer.interim;
    out.cache_find = cache_find ? cache_find : outer.cache_find;
    out.cache_find_one = cache_find_one ? cache_find_one : outer.cache_find_one;
    out.shortcut = shortcut ? shortcut : outer.shortcut;
    out.use_local_on_remote_error = use_local_on_remote_error ? use_local_on_remote_error
                                                              : outer.use_local_on_remote_error;
    return out;
}

hybrid_options::resolved hybrid_options::resolve() const {
    resolved r;
    r.interim = interim.value_or(r.interim);
    r.cache_find = cache_find.value_or(r.cache_find);
    r.cache_find_one = cache_find_one.value_or(r.cache_find_one);
    r.shortcut = shortcut.value_or(r.shortcut);
    r.use_local_on_remote_error = use_local_on_remote_error.value_or(r.use_local_on_remote_error);
    return r;
}

void upload_report::merge(const upload_report& other) {
    upserted += other.upserted;
    removed += other.removed;
    failed += other.failed;
    discarded.insert(discarded.end(), other.discarded.begin(), other.discarded.end());
}

namespace {

std::string describe(const std::exception_ptr& err) {
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown error";
}

// ============================================================================
// find
// ============================================================================

struct find_context {
    local_handle_ptr handle;
    std::string name;
    json selector;
    find_options options;
    hybrid_options::resolved opts;
    std::vector<document> local_data;
    find_channel channel;
};

/// Remote rows with pending local changes laid over them.
std::vector<document> overlay_pending(collection& local, std::vector<document> data,
                                      const json& selector, const find_options& options) {
    auto removes = local.pending_removes();
    auto upserts = local.pending_upserts();

    std::set<doc_id_t> shadowed(removes.begin(), removes.end());
    for (const auto& item : upserts) {
        shadowed.insert(doc_id(item.doc));
    }

    std::vector<document> out;
    for (auto& doc : data) {
        if (!shadowed.count(doc_id(doc))) out.push_back(std::move(doc));
    }
    if (upserts.empty()) return out;

    for (auto& item : upserts) {
        out.push_back(std::move(item.doc));
    }
    return process_find(std::move(out), selector, options);
}

void complete_find(const std::shared_ptr<find_context>& ctx, std::vector<document> remote_data) {
    std::vector<document> result;
    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> lock(ctx->handle->mutex);
        collection* local = ctx->handle->local;
        if (!local) {
            LOG_WARN("hybrid", "Dropping remote results for removed collection %s", ctx->name.c_str());
            err = std::make_exception_ptr(collection_not_found(ctx->name));
        } else {
            try {
                if (ctx->opts.cache_find) {
                    local->cache(remote_data, ctx->selector, ctx->options);
                    result = local->find(ctx->selector, ctx->options).fetch();
                } else {
                    result = overlay_pending(*local, std::move(remote_data), ctx->selector, ctx->options);
                }
            } catch (const localdoc_error& e) {
                LOG_ERROR("hybrid", "Applying remote results to %s failed: %s", ctx->name.c_str(), e.what());
                err = std::current_exception();
            } catch (const json::exception& e) {
                LOG_ERROR("hybrid", "Remote results for %s are not documents: %s", ctx->name.c_str(), e.what());
                err = std::make_exception_ptr(remote_error(502, e.what()));
            }
        }
    }
    // Channel subscribers run outside the handle lock
    if (err) {
        ctx->channel->fail(err);
        return;
    }

    if (!ctx->opts.interim || result != ctx->local_data) {
        ctx->channel->push_confirmed(std::move(result));
    }
    ctx->channel->close();
}

void fail_find(const std::shared_ptr<find_context>& ctx, const std::exception_ptr& err) {
    LOG_WARN("hybrid", "Remote find on %s failed: %s", ctx->name.c_str(), describe(err).c_str());
    if (ctx->opts.interim) {
        ctx->channel->close();
    } else if (ctx->opts.use_local_on_remote_error) {
        ctx->channel->push_confirmed(ctx->local_data);
    } else {
        ctx->channel->fail(err);
    }
}

// ============================================================================
// upload
// ============================================================================

struct upload_state {
    std::mutex mutex;
    upload_report report;
    std::exception_ptr first_error;

    void record(std::exception_ptr err) {
        std::lock_guard<std::mutex> lock(mutex);
        ++report.failed;
        if (!first_error) first_error = err;
    }
};

void apply_upsert_outcomes(collection& local, const std::vector<upsert_item>& upserts,
                           const std::vector<upsert_outcome>& outcomes, upload_state& state) {
    if (outcomes.size() != upserts.size()) {
        LOG_ERROR("hybrid", "Upload of %s got %zu outcomes for %zu items",
                  local.name().c_str(), outcomes.size(), upserts.size());
        state.record(std::make_exception_ptr(remote_error(502, "Outcome count mismatch")));
        return;
    }

    std::vector<upsert_resolution> resolutions;
    for (size_t i = 0; i < upserts.size(); ++i) {
        const auto& item = upserts[i];
        const auto& outcome = outcomes[i];
        auto id = doc_id(item.doc);

        try {
            if (outcome.ok() && outcome.doc) {
                resolutions.push_back(upsert_resolution{item.doc, item.base, outcome.doc});
            } else if (outcome.ok()) {
                // Accepted but nothing stored: drop the local copy
                local.remove(id);
                local.resolve_remove(id);
                std::lock_guard<std::mutex> lock(state.mutex);
                ++state.report.upserted;
            } else if (outcome.discard()) {
                LOG_WARN("hybrid", "Discarding upsert of %s in %s: %d %s", id.c_str(),
                         local.name().c_str(), outcome.status, outcome.message.c_str());
                local.remove(id);
                local.resolve_remove(id);
                std::lock_guard<std::mutex> lock(state.mutex);
                state.report.discarded.push_back(id);
            } else {
                LOG_ERROR("hybrid", "Upsert of %s in %s failed: %d %s", id.c_str(),
                          local.name().c_str(), outcome.status, outcome.message.c_str());
                state.record(make_fault_error(outcome.status, outcome.message));
            }
        } catch (const localdoc_error&) {
            state.record(std::current_exception());
        } catch (const json::exception& e) {
            state.record(std::make_exception_ptr(remote_error(502, e.what())));
        }
    }

    if (resolutions.empty()) return;
    try {
        local.resolve_upserts(resolutions);
        std::lock_guard<std::mutex> lock(state.mutex);
        state.report.upserted += resolutions.size();
    } catch (const localdoc_error&) {
        state.record(std::current_exception());
    } catch (const json::exception& e) {
        state.record(std::make_exception_ptr(remote_error(502, e.what())));
    }
}

void apply_remove_outcome(collection& local, const doc_id_t& id, const remove_outcome& outcome,
                          upload_state& state) {
    if (!outcome.ok() && !outcome.discard()) {
        LOG_ERROR("hybrid", "Remove of %s in %s failed: %d %s", id.c_str(),
                  local.name().c_str(), outcome.status, outcome.message.c_str());
        state.record(make_fault_error(outcome.status, outcome.message));
        return;
    }

    try {
        local.resolve_remove(id);
    } catch (const localdoc_error&) {
        state.record(std::current_exception());
        return;
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    if (outcome.ok()) {
        ++state.report.removed;
    } else {
        LOG_WARN("hybrid", "Discarding remove of %s in %s: %d", id.c_str(), local.name().c_str(), outcome.status);
        state.report.discarded.push_back(id);
    }
}

/// Runs `apply` against the local collection, or records collection_not_found
/// when it was removed while the request was in flight.
template <typename Fn>
void with_local(const local_handle_ptr& handle, const std::string& name, upload_state& state, Fn&& apply) {
    std::lock_guard<std::mutex> lock(handle->mutex);
    if (handle->local) {
        apply(*handle->local);
    } else {
        state.record(std::make_exception_ptr(collection_not_found(name)));
    }
}

void upload_removes(const local_handle_ptr& handle,
                    const std::string& name,
                    const std::shared_ptr<remote_endpoint>& remote,
                    const shared_scheduler& sched,
                    const std::vector<doc_id_t>& ids,
                    const std::shared_ptr<upload_state>& state,
                    std::function<void()> finish) {
    if (ids.empty()) {
        finish();
        return;
    }

    // All sent at once; whichever outcome lands last finishes the upload
    auto remaining = std::make_shared<std::atomic<size_t>>(ids.size());
    auto done = std::make_shared<std::function<void()>>(std::move(finish));
    for (const auto& id : ids) {
        remote->remove(id, [=](remove_outcome outcome) {
            sched->invoke([=]() {
                with_local(handle, name, *state, [&](collection& local) {
                    apply_remove_outcome(local, id, outcome, *state);
                });
                if (remaining->fetch_sub(1) == 1) (*done)();
            });
        });
    }
}

void upload_in_order(std::vector<std::shared_ptr<hybrid_collection>> cols, size_t index,
                     std::shared_ptr<upload_report> total,
                     std::shared_ptr<std::promise<upload_report>> promise) {
    if (index >= cols.size()) {
        promise->set_value(*total);
        return;
    }
    cols[index]->upload_async([=](upload_report report, std::exception_ptr err) {
        total->merge(report);
        if (err) {
            promise->set_exception(err);
            return;
        }
        upload_in_order(cols, index + 1, total, promise);
    });
}

} // namespace

// ============================================================================
// hybrid_collection
// ============================================================================

hybrid_collection::hybrid_collection(collection& local,
                                     std::shared_ptr<remote_endpoint> remote,
                                     hybrid_options options,
                                     shared_scheduler sched)
    : local_(local)
    , name_(local.name())
    , handle_(std::make_shared<local_handle>())
    , remote_(std::move(remote))
    , options_(std::move(options))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>()) {
    if (!remote_) {
        throw validation_error("hybrid_collection needs a remote endpoint");
    }
    handle_->local = &local_;
}

hybrid_collection::~hybrid_collection() {
    detach();
}

void hybrid_collection::detach() {
    std::lock_guard<std::mutex> lock(handle_->mutex);
    handle_->local = nullptr;
}

find_channel hybrid_collection::find(const json& selector, const find_options& options,
                                     const hybrid_options& call_options) {
    auto ctx = std::make_shared<find_context>();
    ctx->handle = handle_;
    ctx->name = name_;
    ctx->selector = selector;
    ctx->options = options;
    ctx->opts = call_options.merged_over(options_).resolve();
    ctx->channel = std::make_shared<delivery_channel<std::vector<document>>>();

    ctx->local_data = local_.find(selector, options).fetch();
    if (ctx->opts.interim) {
        ctx->channel->push_interim(ctx->local_data);
    }

    remote_query query;
    query.selector = selector;
    query.options = options;
    if (ctx->opts.cache_find) {
        // Cached documents must be complete
        query.options.fields.reset();
    }
    if (query.options.fields) {
        query.local_rows = ctx->local_data;
    } else if (options.fields) {
        query.local_rows = local_.find(selector, query.options).fetch();
    } else {
        query.local_rows = ctx->local_data;
    }

    auto sched = scheduler_;
    auto channel = ctx->channel;
    remote_->find(query,
        [ctx, sched](std::vector<document> remote_data) {
            sched->invoke([ctx, data = std::move(remote_data)]() mutable {
                complete_find(ctx, std::move(data));
            });
        },
        [ctx, sched](std::exception_ptr err) {
            sched->invoke([ctx, err]() { fail_find(ctx, err); });
        });
    return channel;
}

find_one_channel hybrid_collection::find_one(const json& selector, const find_options& options,
                                             const hybrid_options& call_options) {
    auto opts = call_options.merged_over(options_).resolve();
    auto channel = std::make_shared<delivery_channel<std::optional<document>>>();

    auto local_doc = local_.find_one(selector, options);
    if (local_doc && opts.interim) {
        channel->push_interim(local_doc);
    }
    if (local_doc && opts.shortcut) {
        if (!opts.interim) channel->push_confirmed(local_doc);
        channel->close();
        return channel;
    }

    find_options remote_options = options;
    if (selector.is_string() || (selector.is_object() && selector.contains(id_field))) {
        remote_options.limit = 1;
    }

    hybrid_options inner;
    inner.interim = false;
    inner.cache_find = opts.cache_find_one;
    inner.use_local_on_remote_error = opts.interim || opts.use_local_on_remote_error;

    bool interim = opts.interim;
    auto results = find(selector, remote_options, inner);
    results->subscribe(
        [channel, local_doc, interim](const delivery<std::vector<document>>& d) {
            if (d.kind != delivery_kind::confirmed) return;
            if (d.value.empty()) {
                channel->push_confirmed(std::nullopt);
            } else if (!interim || !local_doc || *local_doc != d.value.front()) {
                channel->push_confirmed(d.value.front());
            }
            channel->close();
        },
        [channel](std::exception_ptr err) { channel->fail(err); });
    return channel;
}

std::future<upload_report> hybrid_collection::upload() {
    auto promise = std::make_shared<std::promise<upload_report>>();
    auto future = promise->get_future();
    upload_async([promise](upload_report report, std::exception_ptr err) {
        if (err) {
            promise->set_exception(err);
        } else {
            promise->set_value(std::move(report));
        }
    });
    return future;
}

void hybrid_collection::upload_async(upload_callback done) {
    auto state = std::make_shared<upload_state>();
    auto handle = handle_;
    auto name = name_;
    auto remote = remote_;
    auto sched = scheduler_;

    std::vector<upsert_item> upserts;
    std::vector<doc_id_t> removes;
    {
        std::lock_guard<std::mutex> lock(handle->mutex);
        if (!handle->local) {
            done(upload_report{}, std::make_exception_ptr(collection_not_found(name)));
            return;
        }
        upserts = handle->local->pending_upserts();
        removes = handle->local->pending_removes();
    }
    LOG_DEBUG("hybrid", "Uploading %zu upserts and %zu removes for %s",
              upserts.size(), removes.size(), name.c_str());

    std::function<void()> finish = [state, done]() {
        done(state->report, state->first_error);
    };
    auto send_removes = [=]() {
        upload_removes(handle, name, remote, sched, removes, state, finish);
    };

    if (upserts.empty()) {
        send_removes();
        return;
    }

    remote->upsert(upserts, [=](std::vector<upsert_outcome> outcomes) {
        sched->invoke([=]() {
            with_local(handle, name, *state, [&](collection& local) {
                apply_upsert_outcomes(local, upserts, outcomes, *state);
            });
            send_removes();
        });
    });
}

// ============================================================================
// hybrid_db
// ============================================================================

remote_factory http_remote_factory(remote_config config, std::shared_ptr<http_client> client) {
    return [config = std::move(config), client = std::move(client)](const std::string& name)
               -> std::unique_ptr<remote_endpoint> {
        return std::make_unique<remote_collection>(name, config, client);
    };
}

hybrid_db::hybrid_db(local_store& local, remote_factory remotes,
                     hybrid_options options, shared_scheduler sched)
    : local_(local)
    , remotes_(std::move(remotes))
    , options_(std::move(options))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>()) {
    if (!remotes_) {
        throw validation_error("hybrid_db needs a remote factory");
    }
}

hybrid_collection& hybrid_db::add_collection(const std::string& name, const hybrid_options& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it != collections_.end()) {
        return *it->second;
    }

    auto& local = local_.add_collection(name);
    std::shared_ptr<remote_endpoint> remote = remotes_(name);
    if (!remote) {
        throw localdoc_error("No remote endpoint for collection " + name);
    }
    auto col = std::make_shared<hybrid_collection>(local, std::move(remote),
                                                   options.merged_over(options_), scheduler_);
    auto& ref = *col;
    collections_.emplace(name, std::move(col));
    return ref;
}

void hybrid_db::remove_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw collection_not_found(name);
    }
    // An upload in progress may still own the hybrid collection
    it->second->detach();
    collections_.erase(it);
    local_.remove_collection(name);
}

hybrid_collection& hybrid_db::get_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw collection_not_found(name);
    }
    return *it->second;
}

std::vector<std::string> hybrid_db::collection_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : collections_) {
        names.push_back(name);
    }
    return names;
}

std::future<upload_report> hybrid_db::upload() {
    std::vector<std::shared_ptr<hybrid_collection>> cols;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [_, col] : collections_) {
            cols.push_back(col);
        }
    }

    auto promise = std::make_shared<std::promise<upload_report>>();
    auto future = promise->get_future();
    upload_in_order(std::move(cols), 0, std::make_shared<upload_report>(), promise);
    return future;
}

} // namespace localdoc
