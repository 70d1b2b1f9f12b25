// Repository: Stagegate
// Component: Staged Request Store Interface
// Purpose: Durable shadow of the pending queue. Backends throw StorageError.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_ISTAGED_REQUEST_STORE_HPP_
#define STAGEGATE_STORE_ISTAGED_REQUEST_STORE_HPP_

#include <string>
#include <vector>

#include "stagegate/staging/StagedRequest.hpp"

namespace stagegate::store {

// Save is an upsert keyed by request id. Delete of an unknown id is not an
// error. LoadAll returns every persisted request in no particular order.
class IStagedRequestStore {
 public:
  virtual ~IStagedRequestStore() = default;

  virtual void Save(const staging::StagedRequest& request) = 0;
  virtual void Delete(const std::string& request_id) = 0;
  virtual std::vector<staging::StagedRequest> LoadAll() = 0;

  // Batch forms. Backends override these when they can do better than one
  // call per item (single rewrite, single transaction).
  virtual void SaveAll(const std::vector<staging::StagedRequest>& requests) {
    for (const auto& r : requests) Save(r);
  }
  virtual void DeleteAll(const std::vector<std::string>& request_ids) {
    for (const auto& id : request_ids) Delete(id);
  }
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_ISTAGED_REQUEST_STORE_HPP_
