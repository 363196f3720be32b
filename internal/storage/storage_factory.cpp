#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "memory/memory_object_store.hpp"
#include "object/arrow_object_store.hpp"

namespace vault::storage {

ObjectStorePtr StorageFactory::Build(const vault::runtime::config::StorageConfig& cfg) {
  if (cfg.has_object()) {
    auto [object_fs, object_root] = common::Unwrap(common::ResolveFileSystem(cfg.object()));
    return std::make_shared<ArrowObjectStore>(std::move(object_fs), std::move(object_root));
  }

  StoreLimits limits;
  if (cfg.has_memory()) {
    if (cfg.memory().min_part_size_bytes() != 0) limits.min_part_size_bytes = cfg.memory().min_part_size_bytes();
    if (cfg.memory().max_part_count() != 0) limits.max_part_count = cfg.memory().max_part_count();
  }
  return std::make_shared<MemoryObjectStore>(limits);
}

} // namespace vault::storage
