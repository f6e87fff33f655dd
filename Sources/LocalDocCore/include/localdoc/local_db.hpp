#pragma once

#ifdef __cplusplus

#include "collection.hpp"
#include "local_collection.hpp"
#include "storage.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace localdoc {

/// Owns a set of local collections, each with its own storage adapter.
class local_db : public local_store {
public:
    /// Creates the initial collections up front.
    explicit local_db(storage_factory factory, const std::vector<std::string>& initial_names = {});

    // Non-copyable
    local_db(const local_db&) = delete;
    local_db& operator=(const local_db&) = delete;

    /// Returns the existing collection when the name is already present.
    local_collection& add_collection(const std::string& name) override;
    void remove_collection(const std::string& name) override;
    local_collection& get_collection(const std::string& name) override;

    bool has_collection(const std::string& name) const override;
    std::vector<std::string> collection_names() const override;

private:
    storage_factory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<local_collection>> collections_;
};

} // namespace localdoc

#endif // __cplusplus
