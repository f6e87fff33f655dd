#include "localdoc/quickfind.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <set>

namespace localdoc {

std::string sha1_hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha1(), nullptr) != 1) {
        throw localdoc_error("SHA-1 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

quickfind_codec::quickfind_codec(size_t shard_width) : shard_width_(shard_width) {
    if (shard_width_ == 0 || shard_width_ > 40) {
        throw validation_error("Quickfind shard width must be between 1 and 40");
    }
}

std::string quickfind_codec::shard_of(const doc_id_t& id) const {
    return sha1_hex(id).substr(0, shard_width_);
}

std::string quickfind_codec::hash_rows(std::vector<const document*> rows) const {
    std::sort(rows.begin(), rows.end(), [](const document* a, const document* b) {
        return doc_id(*a) < doc_id(*b);
    });

    std::string input;
    for (const document* row : rows) {
        input += doc_id(*row);
        input += ':';
        if (has_revision(*row)) {
            const auto& rev = (*row)[rev_field];
            input += rev.is_string() ? rev.get<std::string>() : rev.dump();
        } else {
            input += row->dump();
        }
        input += '|';
    }
    return sha1_hex(input).substr(0, 20);
}

std::map<std::string, std::vector<const document*>> quickfind_codec::group(const std::vector<document>& rows) const {
    std::map<std::string, std::vector<const document*>> shards;
    for (const auto& row : rows) {
        shards[shard_of(doc_id(row))].push_back(&row);
    }
    return shards;
}

shard_hashes quickfind_codec::encode_request(const std::vector<document>& client_rows) const {
    shard_hashes hashes;
    for (auto& [shard, rows] : group(client_rows)) {
        hashes[shard] = hash_rows(std::move(rows));
    }
    return hashes;
}

shard_rows quickfind_codec::encode_response(const std::vector<document>& server_rows,
                                            const shard_hashes& request) const {
    shard_rows response;
    auto shards = group(server_rows);

    for (auto& [shard, rows] : shards) {
        auto it = request.find(shard);
        if (it != request.end() && it->second == hash_rows(rows)) continue;

        auto& out = response[shard];
        for (const document* row : rows) out.push_back(*row);
    }
    for (const auto& [shard, _] : request) {
        if (!shards.count(shard)) response[shard];
    }
    return response;
}

quickfind_codec::decoded quickfind_codec::decode_response(const shard_rows& response,
                                                          const std::vector<document>& client_rows,
                                                          const std::optional<sort_spec>& sort) const {
    decoded result;
    for (const auto& [shard, _] : response) {
        result.changed_shards.push_back(shard);
    }

    for (const auto& row : client_rows) {
        auto id = doc_id(row);
        auto changed = response.find(shard_of(id));
        if (changed == response.end()) {
            result.docs.push_back(row);
            continue;
        }
        bool still_there = std::any_of(changed->second.begin(), changed->second.end(),
                                       [&id](const document& d) { return doc_id(d) == id; });
        if (!still_there) result.removed_ids.push_back(id);
    }
    for (const auto& [shard, rows] : response) {
        result.docs.insert(result.docs.end(), rows.begin(), rows.end());
    }

    if (sort && !sort->empty()) {
        sort_documents(result.docs, *sort);
    } else {
        std::stable_sort(result.docs.begin(), result.docs.end(), [](const document& a, const document& b) {
            return doc_id(a) < doc_id(b);
        });
    }

    LOG_DEBUG("quickfind", "%zu changed shards, %zu removed", result.changed_shards.size(),
              result.removed_ids.size());
    return result;
}

json quickfind_codec::to_json(const shard_rows& rows) {
    json out = json::object();
    for (const auto& [shard, docs] : rows) {
        out[shard] = docs;
    }
    return out;
}

shard_rows quickfind_codec::rows_from_json(const json& value) {
    if (!value.is_object()) {
        throw validation_error("Quickfind response must be an object");
    }
    shard_rows rows;
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (!it.value().is_array()) {
            throw validation_error("Quickfind shard " + it.key() + " must be an array");
        }
        auto& docs = rows[it.key()];
        for (const auto& doc : it.value()) docs.push_back(doc);
    }
    return rows;
}

} // namespace localdoc
