#pragma once

#include <memory>

#include "config/config.pb.h"
#include "object_store.hpp"

namespace vault::storage {

/*
  Builds the object store from configuration.

      storage.memory → MemoryObjectStore (also when storage is unset)
      storage.object → ArrowObjectStore over the resolved filesystem
*/

class StorageFactory {
 public:
  static ObjectStorePtr Build(const vault::runtime::config::StorageConfig& cfg);
};

} // namespace vault::storage
