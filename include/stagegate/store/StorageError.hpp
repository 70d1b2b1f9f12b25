// Repository: Stagegate
// Component: Storage Error
// Purpose: Exception type thrown by durable backends on I/O or database faults.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_STORAGE_ERROR_HPP_
#define STAGEGATE_STORE_STORAGE_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace stagegate::store {

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_STORAGE_ERROR_HPP_
