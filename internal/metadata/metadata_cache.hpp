#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "vault/archive/v1.hpp"

namespace vault::metadata {

/*
  Process-local read-through cache of catalog records, keyed by file_id.

  Only records that reached a terminal status are cached; the catalog
  stays the source of truth.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MetadataCache {
 public:
  void Put(const vault::archive::v1::ArchiveRecord& record);

  std::optional<vault::archive::v1::ArchiveRecord> Get(const std::string& file_id) const;

  void Remove(const std::string& file_id);

  size_t Size() const;

 private:
  mutable std::shared_mutex                                          mutex_;
  std::unordered_map<std::string, vault::archive::v1::ArchiveRecord> cache_;
};

} // namespace vault::metadata
