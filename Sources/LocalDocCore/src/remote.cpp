#include "localdoc/remote.hpp"
#include "localdoc/log.hpp"
#include <algorithm>
#include <mutex>

namespace localdoc {

// ============================================================================
// Wire helpers
// ============================================================================

std::string response_message(const http_response& response) {
    auto body = response.body_string();
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        for (const char* key : {"error", "message"}) {
            auto it = parsed.find(key);
            if (it != parsed.end() && it->is_string()) return it->get<std::string>();
        }
    }
    if (body.empty()) {
        return response.status_code == 0 ? "No response" : "HTTP " + std::to_string(response.status_code);
    }
    return body;
}

json encode_upsert_body(const std::vector<upsert_item>& items, bool patch) {
    if (!patch) {
        if (items.size() == 1) return items.front().doc;
        json docs = json::array();
        for (const auto& item : items) docs.push_back(item.doc);
        return docs;
    }

    if (items.size() == 1) {
        return json{{"doc", items.front().doc}, {"base", items.front().base.value_or(json())}};
    }
    json docs = json::array();
    json bases = json::array();
    for (const auto& item : items) {
        docs.push_back(item.doc);
        bases.push_back(item.base.value_or(json()));
    }
    return json{{"doc", docs}, {"base", bases}};
}

static upsert_outcome decode_element(const json& element) {
    upsert_outcome outcome;
    if (element.is_null()) {
        return outcome;
    }
    if (element.is_object()) {
        auto f = element.find(fault_field);
        if (f != element.end()) {
            outcome.status = f->value("status", 500);
            outcome.message = f->value("message", std::string("Item failed"));
            return outcome;
        }
        outcome.doc = element;
        return outcome;
    }
    outcome.status = 502;
    outcome.message = "Unexpected element in response: " + element.dump();
    return outcome;
}

std::vector<upsert_outcome> decode_upsert_response(const http_response& response, size_t count) {
    if (response.status_code != 200) {
        auto message = response_message(response);
        return std::vector<upsert_outcome>(count, upsert_outcome{response.status_code, std::nullopt, message});
    }

    auto body = response.body_string();
    json parsed = body.empty() ? json() : json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return std::vector<upsert_outcome>(count, upsert_outcome{502, std::nullopt, "Malformed response body"});
    }

    std::vector<upsert_outcome> outcomes;
    if (parsed.is_array()) {
        if (parsed.size() != count) {
            return std::vector<upsert_outcome>(count, upsert_outcome{502, std::nullopt,
                "Batch response has " + std::to_string(parsed.size()) + " items, expected " + std::to_string(count)});
        }
        for (const auto& element : parsed) outcomes.push_back(decode_element(element));
        return outcomes;
    }

    if (count != 1) {
        return std::vector<upsert_outcome>(count, upsert_outcome{502, std::nullopt, "Expected an array response"});
    }
    outcomes.push_back(decode_element(parsed));
    return outcomes;
}

// ============================================================================
// remote_collection
// ============================================================================

remote_collection::remote_collection(std::string name, remote_config config, std::shared_ptr<http_client> client)
    : name_(std::move(name))
    , config_(std::move(config))
    , client_(std::move(client))
    , quickfind_(config_.quickfind_shard_width) {
    if (!client_) {
        throw validation_error("remote_collection needs an http_client");
    }
}

std::string remote_collection::collection_url(const std::string& suffix) const {
    std::string url = config_.base_url;
    if (!url.empty() && url.back() != '/') url += '/';
    url += name_;
    if (!suffix.empty()) {
        url += '/';
        url += suffix;
    }
    return url;
}

http_request remote_collection::make_request(const std::string& method, const std::string& url) const {
    http_request request;
    request.method = method;
    request.url = url;
    request.headers["Accept"] = "application/json";
    if (!config_.authorization_token.empty()) {
        request.headers["Authorization"] = "Bearer " + config_.authorization_token;
    }
    return request;
}

bool remote_collection::quickfind_applies(const remote_query& query) const {
    if (!config_.use_quickfind || !query.local_rows) return false;
    const auto& options = query.options;
    if (options.skip > 0) return false;
    if (options.limit && !options.sort) return false;
    if (options.has_projection()) {
        // Hashes need the revision of every row
        auto rev = options.fields->find(rev_field);
        if (rev == options.fields->end() || !(*rev == 1 || *rev == true)) return false;
    }
    return true;
}

void remote_collection::find(const remote_query& query, find_handler on_success, error_handler on_error) {
    if (quickfind_applies(query)) {
        find_quick(query, std::move(on_success), std::move(on_error));
    } else {
        find_plain(query, std::move(on_success), std::move(on_error));
    }
}

static void deliver_rows(const http_response& response,
                         const remote_endpoint::find_handler& on_success,
                         const remote_endpoint::error_handler& on_error,
                         const std::string& name) {
    if (response.status_code != 200) {
        LOG_WARN("remote", "find on %s failed with %d", name.c_str(), response.status_code);
        on_error(make_fault_error(response.status_code, response_message(response)));
        return;
    }
    json parsed = json::parse(response.body_string(), nullptr, false);
    bool documents = !parsed.is_discarded() && parsed.is_array() &&
                     std::all_of(parsed.begin(), parsed.end(), [](const json& row) { return row.is_object(); });
    if (!documents) {
        LOG_WARN("remote", "find on %s returned something other than documents", name.c_str());
        on_error(std::make_exception_ptr(remote_error(502, "Expected an array of documents")));
        return;
    }
    on_success(parsed.get<std::vector<document>>());
}

void remote_collection::find_plain(const remote_query& query, find_handler on_success, error_handler on_error) {
    const auto& options = query.options;
    http_request request;

    if (config_.use_post_find) {
        std::vector<std::pair<std::string, std::string>> params;
        if (!config_.client.empty()) params.emplace_back("client", config_.client);
        request = make_request("POST", collection_url("find") + build_query(params));

        json body = options.to_json();
        body["selector"] = query.selector;
        request.set_json_body(body.dump());
    } else {
        std::vector<std::pair<std::string, std::string>> params;
        params.emplace_back("selector", query.selector.dump());
        if (options.fields) params.emplace_back("fields", options.fields->dump());
        if (options.sort && !options.sort->empty()) params.emplace_back("sort", to_json(*options.sort).dump());
        if (options.skip > 0) params.emplace_back("skip", std::to_string(options.skip));
        if (options.limit) params.emplace_back("limit", std::to_string(*options.limit));
        if (!config_.client.empty()) params.emplace_back("client", config_.client);
        request = make_request("GET", collection_url() + build_query(params));
    }

    LOG_DEBUG("remote", "%s %s", request.method.c_str(), request.url.c_str());
    client_->send_async(request, [on_success, on_error, name = name_](http_response response) {
        deliver_rows(response, on_success, on_error, name);
    });
}

void remote_collection::find_quick(const remote_query& query, find_handler on_success, error_handler on_error) {
    const auto& options = query.options;
    std::vector<std::pair<std::string, std::string>> params;
    if (!config_.client.empty()) params.emplace_back("client", config_.client);
    auto request = make_request("POST", collection_url("quickfind") + build_query(params));

    auto local_rows = *query.local_rows;
    json body = {
        {"quickfind", quickfind_.encode_request(local_rows)},
        {"selector", query.selector},
        {"sort", options.sort ? to_json(*options.sort) : json()},
        {"limit", options.limit ? json(*options.limit) : json()},
        {"fields", options.fields ? *options.fields : json()},
    };
    request.set_json_body(body.dump());

    auto codec = quickfind_;
    auto sort = options.sort;
    auto limit = options.limit;
    client_->send_async(request, [codec, sort, limit, on_success, on_error, name = name_,
                                  rows = std::move(local_rows)](http_response response) {
        if (response.status_code != 200) {
            LOG_WARN("quickfind", "quickfind on %s failed with %d", name.c_str(), response.status_code);
            on_error(make_fault_error(response.status_code, response_message(response)));
            return;
        }
        json parsed = json::parse(response.body_string(), nullptr, false);
        if (parsed.is_discarded()) {
            on_error(std::make_exception_ptr(remote_error(response.status_code, "Malformed quickfind response")));
            return;
        }
        std::vector<document> docs;
        try {
            auto decoded = codec.decode_response(quickfind_codec::rows_from_json(parsed), rows, sort);
            docs = std::move(decoded.docs);
        } catch (const validation_error& e) {
            on_error(std::make_exception_ptr(remote_error(502, e.what())));
            return;
        } catch (const json::exception& e) {
            on_error(std::make_exception_ptr(remote_error(502, e.what())));
            return;
        }
        if (limit && docs.size() > *limit) docs.resize(*limit);
        on_success(std::move(docs));
    });
}

void remote_collection::send_batch(const std::string& method, const std::vector<upsert_item>& items,
                                   batch_handler on_done) {
    std::vector<std::pair<std::string, std::string>> params;
    if (!config_.client.empty()) params.emplace_back("client", config_.client);
    auto request = make_request(method, collection_url() + build_query(params));
    request.set_json_body(encode_upsert_body(items, method == "PATCH").dump());

    LOG_DEBUG("remote", "%s %s (%zu items)", method.c_str(), request.url.c_str(), items.size());
    size_t count = items.size();
    client_->send_async(request, [count, on_done](http_response response) {
        on_done(decode_upsert_response(response, count));
    });
}

void remote_collection::upsert(const std::vector<upsert_item>& items, upsert_handler on_done) {
    if (items.empty()) {
        on_done({});
        return;
    }

    // Split into plain upserts and 3-way patches, remembering original positions
    std::vector<upsert_item> plain, patched;
    std::vector<size_t> plain_index, patched_index;
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].base) {
            patched.push_back(items[i]);
            patched_index.push_back(i);
        } else {
            plain.push_back(items[i]);
            plain_index.push_back(i);
        }
    }

    struct batch_state {
        std::mutex mutex;
        std::vector<upsert_outcome> outcomes;
        int remaining = 0;
    };
    auto state = std::make_shared<batch_state>();
    state->outcomes.resize(items.size());
    state->remaining = (plain.empty() ? 0 : 1) + (patched.empty() ? 0 : 1);

    auto collect = [state, on_done](const std::vector<size_t>& index) {
        return [state, on_done, index](std::vector<upsert_outcome> outcomes) {
            bool finished = false;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                for (size_t i = 0; i < index.size() && i < outcomes.size(); ++i) {
                    state->outcomes[index[i]] = std::move(outcomes[i]);
                }
                finished = --state->remaining == 0;
            }
            if (finished) on_done(std::move(state->outcomes));
        };
    };

    if (!plain.empty()) send_batch("POST", plain, collect(plain_index));
    if (!patched.empty()) send_batch("PATCH", patched, collect(patched_index));
}

void remote_collection::remove(const doc_id_t& id, remove_handler on_done) {
    if (config_.client.empty()) {
        LOG_WARN("remote", "remove of %s on %s needs a client", id.c_str(), name_.c_str());
        on_done(remove_outcome{401, "Client required to remove"});
        return;
    }

    auto request = make_request("DELETE", collection_url(url_encode(id)) +
                                          build_query({{"client", config_.client}}));
    LOG_DEBUG("remote", "DELETE %s", request.url.c_str());
    client_->send_async(request, [on_done](http_response response) {
        remove_outcome outcome;
        outcome.status = response.status_code;
        if (!response.is_success()) outcome.message = response_message(response);
        on_done(std::move(outcome));
    });
}

} // namespace localdoc
