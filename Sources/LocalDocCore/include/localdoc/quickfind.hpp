#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "sort.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace localdoc {

/// Lowercase hex SHA-1 of the input bytes.
std::string sha1_hex(const std::string& input);

// ============================================================================
// Quickfind - shard-hash diff of a query result
// ============================================================================
//
// The client groups the rows it already holds for a query into shards keyed
// by a prefix of SHA-1(_id), hashes each shard and sends the hashes. The
// server answers only the shards whose hash differs, with its full row set
// for each. Unchanged shards are served from the client's rows.

using shard_hashes = std::map<std::string, std::string>;
using shard_rows = std::map<std::string, std::vector<document>>;

class quickfind_codec {
public:
    explicit quickfind_codec(size_t shard_width = 2);

    size_t shard_width() const { return shard_width_; }

    std::string shard_of(const doc_id_t& id) const;

    /// First 20 hex digits of SHA-1 over the rows sorted by id, each
    /// contributing "id:rev|" (or "id:<json>|" without a _rev).
    std::string hash_rows(std::vector<const document*> rows) const;

    /// Client half: one hash per non-empty shard.
    shard_hashes encode_request(const std::vector<document>& client_rows) const;

    /// Server half: the authoritative rows of every shard whose hash differs
    /// from the request. Shards the server no longer has come back empty.
    shard_rows encode_response(const std::vector<document>& server_rows,
                               const shard_hashes& request) const;

    struct decoded {
        std::vector<document> docs;
        std::vector<doc_id_t> removed_ids;
        std::vector<std::string> changed_shards;
    };

    /// Client half: replace changed shards, then sort by `sort` or by _id.
    decoded decode_response(const shard_rows& response,
                            const std::vector<document>& client_rows,
                            const std::optional<sort_spec>& sort = std::nullopt) const;

    static json to_json(const shard_rows& rows);

    /// Throws validation_error for anything but an object of arrays.
    static shard_rows rows_from_json(const json& value);

private:
    size_t shard_width_;

    std::map<std::string, std::vector<const document*>> group(const std::vector<document>& rows) const;
};

} // namespace localdoc

#endif // __cplusplus
