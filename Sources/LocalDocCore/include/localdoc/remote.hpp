#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "network.hpp"
#include "query.hpp"
#include "quickfind.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace localdoc {

// ============================================================================
// Outcomes
// ============================================================================

/// Result for one uploaded item. `doc` is the server's stored document.
struct upsert_outcome {
    int status = 200;
    std::optional<document> doc;
    std::string message;

    bool ok() const { return status >= 200 && status < 300; }
    fault kind() const { return classify_status(status); }
    bool discard() const { return is_discard(kind()); }
};

struct remove_outcome {
    int status = 200;
    std::string message;

    bool ok() const { return status >= 200 && status < 300; }
    fault kind() const { return classify_status(status); }
    bool discard() const { return is_discard(kind()); }
};

struct remote_query {
    json selector = json::object();
    find_options options;
    /// Rows the caller already holds for this query; enables quickfind.
    std::optional<std::vector<document>> local_rows;
};

// ============================================================================
// remote_endpoint - the server side of one collection
// ============================================================================

class remote_endpoint {
public:
    using find_handler = std::function<void(std::vector<document>)>;
    using error_handler = std::function<void(std::exception_ptr)>;
    using upsert_handler = std::function<void(std::vector<upsert_outcome>)>;
    using remove_handler = std::function<void(remove_outcome)>;

    virtual ~remote_endpoint() = default;

    virtual const std::string& name() const = 0;

    virtual void find(const remote_query& query, find_handler on_success, error_handler on_error) = 0;

    /// One outcome per item, same order. Never fails as a whole.
    virtual void upsert(const std::vector<upsert_item>& items, upsert_handler on_done) = 0;

    virtual void remove(const doc_id_t& id, remove_handler on_done) = 0;
};

// ============================================================================
// remote_collection - HTTP wire client
// ============================================================================

struct remote_config {
    std::string base_url;                 // e.g. "https://api.example.com/v3/"
    std::string client;                   // appended as ?client=
    std::string authorization_token;      // sent as a Bearer token
    bool use_post_find = false;           // POST /<col>/find instead of GET
    bool use_quickfind = false;
    size_t quickfind_shard_width = 2;
};

/// Marker for a per-item fault inside a batch response.
inline constexpr const char* fault_field = "$fault";

class remote_collection : public remote_endpoint {
public:
    remote_collection(std::string name, remote_config config, std::shared_ptr<http_client> client);

    const std::string& name() const override { return name_; }
    const remote_config& config() const { return config_; }

    void find(const remote_query& query, find_handler on_success, error_handler on_error) override;
    void upsert(const std::vector<upsert_item>& items, upsert_handler on_done) override;
    void remove(const doc_id_t& id, remove_handler on_done) override;

    /// Whether find() would use quickfind for this query.
    bool quickfind_applies(const remote_query& query) const;

private:
    std::string name_;
    remote_config config_;
    std::shared_ptr<http_client> client_;
    quickfind_codec quickfind_;

    std::string collection_url(const std::string& suffix = "") const;
    http_request make_request(const std::string& method, const std::string& url) const;

    void find_plain(const remote_query& query, find_handler on_success, error_handler on_error);
    void find_quick(const remote_query& query, find_handler on_success, error_handler on_error);

    using batch_handler = std::function<void(std::vector<upsert_outcome>)>;
    void send_batch(const std::string& method, const std::vector<upsert_item>& items,
                    batch_handler on_done);
};

/// Error text from a response body: its "error" or "message" field, else the raw body.
std::string response_message(const http_response& response);

/// Body of one upsert or patch request. A single item is sent bare, several
/// as arrays: POST doc / [docs], PATCH {doc, base} / {doc: [...], base: [...]}.
json encode_upsert_body(const std::vector<upsert_item>& items, bool patch);

/// Per-item outcomes from a batch reply. Faults appear as
/// {"$fault": {"status": N, "message": "..."}}; a null element means the
/// server stored nothing.
std::vector<upsert_outcome> decode_upsert_response(const http_response& response, size_t count);

} // namespace localdoc

#endif // __cplusplus
