#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "archive_request.hpp"
#include "archive_stream.hpp"

namespace vault::packaging {

/*
  Stored (uncompressed) ZIP layout with streaming CRC-32.

  Format choices:
    - method 0, general purpose flags: data descriptor (bit 3) + UTF-8 names (bit 11)
    - every entry stamped 1980-01-01 00:00 so equal inputs give equal bytes
    - ZIP64 extra fields per entry once a size or offset reaches 0xFFFFFFFF,
      ZIP64 end records once entry count, directory size or offset overflow

  Because entries are stored and sizes come from the sources up front,
  every offset is known before streaming; only CRCs are computed on the
  fly and land in the data descriptors and the central directory.
*/

struct ZipEntryLayout {
  std::string   name;
  ByteSourcePtr source;
  uint64_t      size                = 0;
  uint64_t      local_header_offset = 0;
  uint64_t      data_offset         = 0;
};

class ZipLayout final : public ArchiveLayout, public std::enable_shared_from_this<ZipLayout> {
 public:
  // Sizes every source; throws util::PackagingError when one cannot be read.
  static std::shared_ptr<const ZipLayout> Build(const std::vector<SourceItem>& items);

  uint64_t TotalSize() const override {
    return total_size_;
  }

  std::unique_ptr<ArchiveStream> Open() const override;

  const std::vector<ZipEntryLayout>& Entries() const {
    return entries_;
  }

  uint64_t CentralDirectoryOffset() const {
    return central_offset_;
  }

  uint64_t CentralDirectorySize() const {
    return central_size_;
  }

  bool UsesZip64End() const {
    return zip64_end_;
  }

 private:
  friend class ZipStream;

  std::vector<ZipEntryLayout> entries_;
  uint64_t                    central_offset_ = 0;
  uint64_t                    central_size_   = 0;
  bool                        zip64_end_      = false;
  uint64_t                    total_size_     = 0;
};

namespace zip {

inline constexpr uint32_t kLocalHeaderSignature     = 0x04034b50;
inline constexpr uint32_t kDataDescriptorSignature  = 0x08074b50;
inline constexpr uint32_t kCentralHeaderSignature   = 0x02014b50;
inline constexpr uint32_t kZip64EndSignature        = 0x06064b50;
inline constexpr uint32_t kZip64LocatorSignature    = 0x07064b50;
inline constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;

inline constexpr uint16_t kZip64ExtraId  = 0x0001;
inline constexpr uint32_t kMax32         = 0xFFFFFFFFu;
inline constexpr uint16_t kMax16         = 0xFFFFu;
inline constexpr uint16_t kFlags         = 0x0808;
inline constexpr uint16_t kDosTime       = 0x0000;
inline constexpr uint16_t kDosDate       = 0x0021; // 1980-01-01
inline constexpr uint16_t kVersion20     = 20;
inline constexpr uint16_t kVersion45     = 45;
inline constexpr uint16_t kVersionMadeBy = (3 << 8) | kVersion45; // unix

inline constexpr uint64_t kLocalHeaderFixed  = 30;
inline constexpr uint64_t kCentralFixed      = 46;
inline constexpr uint64_t kEndFixed          = 22;
inline constexpr uint64_t kZip64EndRecord    = 56;
inline constexpr uint64_t kZip64Locator      = 20;

} // namespace zip

} // namespace vault::packaging
