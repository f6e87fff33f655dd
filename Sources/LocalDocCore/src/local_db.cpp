#include "localdoc/local_db.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"

namespace localdoc {

local_db::local_db(storage_factory factory, const std::vector<std::string>& initial_names)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw missing_adapter("local_db needs a storage factory");
    }
    for (const auto& name : initial_names) {
        add_collection(name);
    }
}

local_collection& local_db::add_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it != collections_.end()) {
        return *it->second;
    }

    auto adapter = factory_(name);
    if (!adapter) {
        LOG_ERROR("local", "No storage adapter for %s", name.c_str());
        throw missing_adapter("No storage adapter for collection " + name);
    }
    auto col = std::make_unique<local_collection>(name, std::move(adapter));
    auto& ref = *col;
    collections_.emplace(name, std::move(col));
    LOG_DEBUG("local", "Added collection %s", name.c_str());
    return ref;
}

void local_db::remove_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw collection_not_found(name);
    }
    it->second->destroy();
    collections_.erase(it);
}

local_collection& local_db::get_collection(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw collection_not_found(name);
    }
    return *it->second;
}

bool local_db::has_collection(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.count(name) > 0;
}

std::vector<std::string> local_db::collection_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(collections_.size());
    for (const auto& [name, _] : collections_) {
        names.push_back(name);
    }
    return names;
}

} // namespace localdoc
