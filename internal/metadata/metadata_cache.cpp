#include "metadata_cache.hpp"

#include <mutex>

namespace vault::metadata {

using vault::archive::v1::ArchiveRecord;

void MetadataCache::Put(const ArchiveRecord& record) {
  std::unique_lock lock(mutex_);
  cache_[record.file_id()] = record;
}

std::optional<ArchiveRecord> MetadataCache::Get(const std::string& file_id) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(file_id);
  if (it == cache_.end()) return std::nullopt;

  return it->second;
}

void MetadataCache::Remove(const std::string& file_id) {
  std::unique_lock lock(mutex_);
  cache_.erase(file_id);
}

size_t MetadataCache::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace vault::metadata
