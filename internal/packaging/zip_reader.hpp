#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vault::packaging {

struct ZipEntryInfo {
  std::string name;
  uint64_t    size                = 0;
  uint32_t    crc32               = 0;
  uint64_t    local_header_offset = 0;
  uint16_t    method              = 0; // 0 = stored
};

/*
  Central-directory ZIP reader for stored archives (ZIP64 aware).

  Used by list-zip and by round-trip checks of the packager. Compressed
  entries are listed but cannot be read. All failures throw
  util::PackagingError.
*/
class ZipReader {
 public:
  static ZipReader Open(std::shared_ptr<arrow::io::RandomAccessFile> file);
  static ZipReader OpenPath(const std::string& path);

  const std::vector<ZipEntryInfo>& Entries() const {
    return entries_;
  }

  // Whole entry in memory; CRC verified.
  std::shared_ptr<arrow::Buffer> ReadEntry(const ZipEntryInfo& entry) const;

  // Streams the entry in bounded windows and checks its CRC.
  void VerifyEntry(const ZipEntryInfo& entry) const;

 private:
  explicit ZipReader(std::shared_ptr<arrow::io::RandomAccessFile> file) : file_(std::move(file)) {
  }

  void     ReadCentralDirectory();
  uint64_t DataOffset(const ZipEntryInfo& entry) const;

  std::shared_ptr<arrow::io::RandomAccessFile> file_;
  std::vector<ZipEntryInfo>                    entries_;
};

} // namespace vault::packaging
