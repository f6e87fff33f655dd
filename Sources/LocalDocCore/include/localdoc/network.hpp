#pragma once

#ifdef __cplusplus

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace localdoc {

// ============================================================================
// HTTP transport seam
// ============================================================================
//
// The embedding application supplies the transport (libcurl, URLSession,
// OkHttp, ...). Bodies are JSON text. Status 0 means no response arrived.

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;

    void set_json_body(std::string text) {
        body = std::move(text);
        headers["Content-Type"] = "application/json";
    }

    const std::string& body_string() const { return body; }

    /// Path part of the url, without scheme, host or query string.
    std::string path() const;

    /// Decoded query string parameters.
    std::map<std::string, std::string> query_params() const;
};

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    const std::string& body_string() const { return body; }

    static http_response with_body(int status, std::string text) {
        http_response r;
        r.status_code = status;
        r.body = std::move(text);
        r.headers["Content-Type"] = "application/json";
        return r;
    }
};

class http_client {
public:
    using completion_handler = std::function<void(http_response)>;

    virtual ~http_client() = default;

    /// Start `request`; `handler` runs exactly once, on any thread.
    virtual void send_async(const http_request& request, completion_handler handler) = 0;
};

// ============================================================================
// URL helpers
// ============================================================================

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

/// "?a=1&b=2" from ordered pairs (empty string for no pairs).
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

// ============================================================================
// mock_http_client
// ============================================================================

/// Records every request and answers through a responder function. In
/// deferred mode completions are held until flush().
class mock_http_client : public http_client {
public:
    using responder_fn = std::function<http_response(const http_request&)>;

    explicit mock_http_client(responder_fn responder = nullptr)
        : responder_(std::move(responder)) {}

    void send_async(const http_request& request, completion_handler handler) override {
        responder_fn responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (deferred_) {
                held_.emplace_back(request, std::move(handler));
                return;
            }
            responder = responder_;
        }
        complete(responder, request, handler);
    }

    void set_responder(responder_fn responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_deferred(bool deferred) {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_ = deferred;
    }

    /// Completes held requests in arrival order, including any queued by
    /// their handlers. Returns how many completed.
    size_t flush() {
        size_t done = 0;
        for (;;) {
            std::pair<http_request, completion_handler> next;
            responder_fn responder;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (held_.empty()) return done;
                next = std::move(held_.front());
                held_.pop_front();
                responder = responder_;
            }
            complete(responder, next.first, next.second);
            ++done;
        }
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.size();
    }

    std::vector<http_request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    static void complete(const responder_fn& responder, const http_request& request,
                         const completion_handler& handler) {
        auto response = responder ? responder(request) : http_response{};
        if (handler) handler(std::move(response));
    }

    mutable std::mutex mutex_;
    responder_fn responder_;
    bool deferred_ = false;
    std::vector<http_request> requests_;
    std::deque<std::pair<http_request, completion_handler>> held_;
};

} // namespace localdoc

#endif // __cplusplus
