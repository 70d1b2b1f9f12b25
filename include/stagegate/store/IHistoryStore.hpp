// Repository: Stagegate
// Component: History Store Interface
// Purpose: Durable per-requester decision history. Backends throw StorageError.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_IHISTORY_STORE_HPP_
#define STAGEGATE_STORE_IHISTORY_STORE_HPP_

#include <map>
#include <string>
#include <vector>

#include "stagegate/staging/StagedRequest.hpp"

namespace stagegate::store {

using HistoryMap = std::map<std::string, std::vector<staging::StagedRequest>>;

class IHistoryStore {
 public:
  virtual ~IHistoryStore() = default;

  // Replaces the stored history of requester_id with history.
  virtual void Save(const std::string& requester_id,
                    const std::vector<staging::StagedRequest>& history) = 0;
  virtual std::vector<staging::StagedRequest> Load(const std::string& requester_id) = 0;
  virtual HistoryMap LoadAll() = 0;
  virtual void Delete(const std::string& requester_id) = 0;
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_IHISTORY_STORE_HPP_
