#pragma once

// localdoc - local-first document store with remote sync
//
// Usage:
//   #include <localdoc/localdoc.hpp>
//
//   int main() {
//       localdoc::local_db local(localdoc::make_storage_factory({}));
//       localdoc::hybrid_db db(local, localdoc::http_remote_factory(config, client));
//
//       auto& trips = db.add_collection("trips");
//       trips.upsert_one({{"name", "Costa Rica"}, {"days", 10}});
//
//       // Local answer now, server answer when it differs
//       auto results = trips.find({{"days", {{"$gte", 7}}}});
//       for (auto& doc : results->get()) {
//           std::cout << doc["name"] << std::endl;
//       }
//
//       trips.upload().get();
//   }

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "selector.hpp"
#include "sort.hpp"
#include "geo.hpp"
#include "query.hpp"
#include "storage.hpp"
#include "local_collection.hpp"
#include "local_db.hpp"
#include "scheduler.hpp"
#include "delivery.hpp"
#include "network.hpp"
#include "quickfind.hpp"
#include "remote.hpp"
#include "hybrid.hpp"
#include "replicating.hpp"
#include "utils.hpp"
