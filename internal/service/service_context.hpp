#pragma once

#include <cstdint>
#include <memory>

namespace vault::upload {
class SessionManager;
class CompletionReconciler;
} // namespace vault::upload
namespace vault::storage {
class ObjectStore;
}
namespace vault::metadata {
class MetadataCache;
}
namespace vault::db {
class Repository;
}

namespace vault::service {

/*
  Dependency container shared by the service and its endpoints.
*/
struct ServiceContext {
  std::shared_ptr<vault::upload::SessionManager>       sessions;
  std::shared_ptr<vault::upload::CompletionReconciler> reconciler;
  std::shared_ptr<vault::storage::ObjectStore>         store;
  std::shared_ptr<vault::metadata::MetadataCache>      metadata;
  std::shared_ptr<vault::db::Repository>               repository;

  // single-shot uploads above this size are refused
  uint64_t small_object_threshold_bytes = 0;
};

} // namespace vault::service
