#include "zip_layout.hpp"

#include <arrow/buffer.h>
#include <zlib.h>

#include <algorithm>
#include <cstring>

#include "internal/util/errors.hpp"

namespace vault::packaging {

namespace {

void PutLE16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void PutLE32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void PutLE64(std::string& out, uint64_t v) {
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

bool EntryNeedsZip64(uint64_t size) {
  return size >= zip::kMax32;
}

uint64_t LocalHeaderSize(const ZipEntryLayout& e) {
  return zip::kLocalHeaderFixed + e.name.size() + (EntryNeedsZip64(e.size) ? 20 : 0);
}

uint64_t DescriptorSize(const ZipEntryLayout& e) {
  return EntryNeedsZip64(e.size) ? 24 : 16;
}

// Number of 8-byte values in the central zip64 extra field.
int CentralZip64Fields(const ZipEntryLayout& e) {
  int fields = 0;
  if (EntryNeedsZip64(e.size)) fields += 2;
  if (e.local_header_offset >= zip::kMax32) fields += 1;
  return fields;
}

uint64_t CentralEntrySize(const ZipEntryLayout& e) {
  const int fields = CentralZip64Fields(e);
  return zip::kCentralFixed + e.name.size() + (fields > 0 ? 4 + 8 * fields : 0);
}

std::string LocalHeader(const ZipEntryLayout& e) {
  const bool zip64 = EntryNeedsZip64(e.size);

  std::string out;
  out.reserve(LocalHeaderSize(e));
  PutLE32(out, zip::kLocalHeaderSignature);
  PutLE16(out, zip64 ? zip::kVersion45 : zip::kVersion20);
  PutLE16(out, zip::kFlags);
  PutLE16(out, 0); // stored
  PutLE16(out, zip::kDosTime);
  PutLE16(out, zip::kDosDate);
  PutLE32(out, 0); // crc in descriptor
  PutLE32(out, zip64 ? zip::kMax32 : 0);
  PutLE32(out, zip64 ? zip::kMax32 : 0);
  PutLE16(out, static_cast<uint16_t>(e.name.size()));
  PutLE16(out, zip64 ? 20 : 0);
  out += e.name;
  if (zip64) {
    PutLE16(out, zip::kZip64ExtraId);
    PutLE16(out, 16);
    PutLE64(out, 0);
    PutLE64(out, 0);
  }
  return out;
}

std::string DataDescriptor(const ZipEntryLayout& e, uint32_t crc) {
  std::string out;
  out.reserve(DescriptorSize(e));
  PutLE32(out, zip::kDataDescriptorSignature);
  PutLE32(out, crc);
  if (EntryNeedsZip64(e.size)) {
    PutLE64(out, e.size);
    PutLE64(out, e.size);
  } else {
    PutLE32(out, static_cast<uint32_t>(e.size));
    PutLE32(out, static_cast<uint32_t>(e.size));
  }
  return out;
}

std::string CentralEntry(const ZipEntryLayout& e, uint32_t crc) {
  const bool big_size   = EntryNeedsZip64(e.size);
  const bool big_offset = e.local_header_offset >= zip::kMax32;
  const int  fields     = CentralZip64Fields(e);

  std::string out;
  out.reserve(CentralEntrySize(e));
  PutLE32(out, zip::kCentralHeaderSignature);
  PutLE16(out, zip::kVersionMadeBy);
  PutLE16(out, fields > 0 ? zip::kVersion45 : zip::kVersion20);
  PutLE16(out, zip::kFlags);
  PutLE16(out, 0);
  PutLE16(out, zip::kDosTime);
  PutLE16(out, zip::kDosDate);
  PutLE32(out, crc);
  PutLE32(out, big_size ? zip::kMax32 : static_cast<uint32_t>(e.size));
  PutLE32(out, big_size ? zip::kMax32 : static_cast<uint32_t>(e.size));
  PutLE16(out, static_cast<uint16_t>(e.name.size()));
  PutLE16(out, static_cast<uint16_t>(fields > 0 ? 4 + 8 * fields : 0));
  PutLE16(out, 0); // comment
  PutLE16(out, 0); // disk
  PutLE16(out, 0); // internal attributes
  PutLE32(out, 0100644u << 16);
  PutLE32(out, big_offset ? zip::kMax32 : static_cast<uint32_t>(e.local_header_offset));
  out += e.name;
  if (fields > 0) {
    PutLE16(out, zip::kZip64ExtraId);
    PutLE16(out, static_cast<uint16_t>(8 * fields));
    if (big_size) {
      PutLE64(out, e.size);
      PutLE64(out, e.size);
    }
    if (big_offset) PutLE64(out, e.local_header_offset);
  }
  return out;
}

std::string EndRecords(const ZipLayout& layout) {
  const uint64_t count  = layout.Entries().size();
  const uint64_t offset = layout.CentralDirectoryOffset();
  const uint64_t size   = layout.CentralDirectorySize();

  std::string out;
  if (layout.UsesZip64End()) {
    const uint64_t zip64_end_offset = offset + size;

    PutLE32(out, zip::kZip64EndSignature);
    PutLE64(out, zip::kZip64EndRecord - 12);
    PutLE16(out, zip::kVersionMadeBy);
    PutLE16(out, zip::kVersion45);
    PutLE32(out, 0);
    PutLE32(out, 0);
    PutLE64(out, count);
    PutLE64(out, count);
    PutLE64(out, size);
    PutLE64(out, offset);

    PutLE32(out, zip::kZip64LocatorSignature);
    PutLE32(out, 0);
    PutLE64(out, zip64_end_offset);
    PutLE32(out, 1);
  }

  const bool big = layout.UsesZip64End();
  PutLE32(out, zip::kEndOfCentralDirSignature);
  PutLE16(out, 0);
  PutLE16(out, 0);
  PutLE16(out, big ? zip::kMax16 : static_cast<uint16_t>(count));
  PutLE16(out, big ? zip::kMax16 : static_cast<uint16_t>(count));
  PutLE32(out, big ? zip::kMax32 : static_cast<uint32_t>(size));
  PutLE32(out, big ? zip::kMax32 : static_cast<uint32_t>(offset));
  PutLE16(out, 0);
  return out;
}

} // namespace

// ------------------------------------------------------------
// Stream
// ------------------------------------------------------------

class ZipStream final : public ArchiveStream {
 public:
  explicit ZipStream(std::shared_ptr<const ZipLayout> layout) : layout_(std::move(layout)) {
    crcs_.resize(layout_->entries_.size(), 0);
  }

  std::shared_ptr<arrow::Buffer> NextWindow(uint64_t max_bytes) override {
    if (max_bytes == 0) {
      throw util::InvalidArgument("window size must be positive");
    }
    auto allocated = arrow::AllocateResizableBuffer(static_cast<int64_t>(max_bytes));
    if (!allocated.ok()) {
      throw util::PackagingError(allocated.status().ToString());
    }
    std::shared_ptr<arrow::ResizableBuffer> window = std::move(*allocated);

    uint8_t* dst    = window->mutable_data();
    uint64_t filled = 0;

    while (filled < max_bytes) {
      if (pending_pos_ < pending_.size()) {
        const auto n = std::min<uint64_t>(pending_.size() - pending_pos_, max_bytes - filled);
        std::memcpy(dst + filled, pending_.data() + pending_pos_, n);
        pending_pos_ += n;
        filled += n;
        continue;
      }

      if (phase_ == Phase::kData) {
        filled += ReadData(dst + filled, max_bytes - filled);
        continue;
      }

      if (!Advance()) break;
    }

    auto status = window->Resize(static_cast<int64_t>(filled), /*shrink_to_fit=*/false);
    if (!status.ok()) {
      throw util::PackagingError(status.ToString());
    }
    position_ += filled;
    return window;
  }

  uint64_t Position() const override {
    return position_;
  }

 private:
  enum class Phase { kStart, kLocalHeader, kData, kCentral, kEnd, kDone };

  void SetPending(std::string bytes) {
    pending_     = std::move(bytes);
    pending_pos_ = 0;
  }

  // Moves to the next layout section once the current one is drained.
  bool Advance() {
    const auto& entries = layout_->entries_;
    switch (phase_) {
      case Phase::kStart:
        index_ = 0;
        if (entries.empty()) {
          phase_ = Phase::kCentral;
          return Advance();
        }
        phase_ = Phase::kLocalHeader;
        SetPending(LocalHeader(entries[0]));
        return true;

      case Phase::kLocalHeader:
        OpenEntry();
        phase_ = Phase::kData;
        return true;

      case Phase::kData:
        return true;

      case Phase::kCentral:
        if (central_index_ < entries.size()) {
          SetPending(CentralEntry(entries[central_index_], crcs_[central_index_]));
          ++central_index_;
          return true;
        }
        phase_ = Phase::kEnd;
        SetPending(EndRecords(*layout_));
        return true;

      case Phase::kEnd:
        phase_ = Phase::kDone;
        return false;

      case Phase::kDone:
      default:
        return false;
    }
  }

  void OpenEntry() {
    const auto& entry = layout_->entries_[index_];
    auto        input = entry.source->Open();
    if (!input.ok()) {
      throw util::PackagingError("cannot open " + entry.source->Describe() + ": " + input.status().ToString());
    }
    input_     = std::move(*input);
    remaining_ = entry.size;
    crc_       = crc32_z(0L, Z_NULL, 0);
  }

  uint64_t ReadData(uint8_t* dst, uint64_t capacity) {
    const auto& entry = layout_->entries_[index_];

    if (remaining_ == 0) {
      FinishEntry();
      return 0;
    }

    const auto want = std::min(remaining_, capacity);
    auto       read = input_->Read(static_cast<int64_t>(want), dst);
    if (!read.ok()) {
      throw util::PackagingError("cannot read " + entry.source->Describe() + ": " + read.status().ToString());
    }
    const auto got = static_cast<uint64_t>(*read);
    if (got == 0) {
      throw util::PackagingError(entry.source->Describe() + " is shorter than its declared size");
    }

    crc_ = crc32_z(crc_, dst, static_cast<z_size_t>(got));
    remaining_ -= got;
    if (remaining_ == 0) {
      FinishEntry();
    }
    return got;
  }

  void FinishEntry() {
    const auto& entries = layout_->entries_;
    const auto& entry   = entries[index_];

    uint8_t trailing = 0;
    auto     extra    = input_->Read(1, &trailing);
    if (!extra.ok()) {
      throw util::PackagingError("cannot read " + entry.source->Describe() + ": " + extra.status().ToString());
    }
    if (*extra != 0) {
      throw util::PackagingError(entry.source->Describe() + " changed size while packaging");
    }
    auto close_status = input_->Close();
    if (!close_status.ok()) {
      throw util::PackagingError("cannot close " + entry.source->Describe() + ": " + close_status.ToString());
    }
    input_.reset();

    crcs_[index_] = static_cast<uint32_t>(crc_);
    std::string tail = DataDescriptor(entry, crcs_[index_]);

    ++index_;
    if (index_ < entries.size()) {
      tail += LocalHeader(entries[index_]);
      phase_ = Phase::kLocalHeader;
    } else {
      phase_ = Phase::kCentral;
    }
    SetPending(std::move(tail));
  }

  std::shared_ptr<const ZipLayout> layout_;

  Phase       phase_ = Phase::kStart;
  std::string pending_;
  size_t      pending_pos_ = 0;

  size_t                                  index_         = 0;
  size_t                                  central_index_ = 0;
  std::shared_ptr<arrow::io::InputStream> input_;
  uint64_t                                remaining_ = 0;
  uLong                                   crc_       = 0;
  std::vector<uint32_t>                   crcs_;

  uint64_t position_ = 0;
};

// ------------------------------------------------------------
// Layout
// ------------------------------------------------------------

std::shared_ptr<const ZipLayout> ZipLayout::Build(const std::vector<SourceItem>& items) {
  auto layout = std::make_shared<ZipLayout>();
  layout->entries_.reserve(items.size());

  uint64_t offset = 0;
  for (const auto& item : items) {
    if (item.relative_path.size() >= zip::kMax16) {
      throw util::PackagingError("entry name too long: " + item.relative_path.substr(0, 64));
    }
    auto size = item.source->Size();
    if (!size.ok()) {
      throw util::PackagingError("cannot read " + item.source->Describe() + ": " + size.status().ToString());
    }

    ZipEntryLayout entry;
    entry.name                = item.relative_path;
    entry.source              = item.source;
    entry.size                = *size;
    entry.local_header_offset = offset;
    entry.data_offset         = offset + LocalHeaderSize(entry);

    offset = entry.data_offset + entry.size + DescriptorSize(entry);
    layout->entries_.push_back(std::move(entry));
  }

  layout->central_offset_ = offset;
  for (const auto& entry : layout->entries_) {
    layout->central_size_ += CentralEntrySize(entry);
  }

  layout->zip64_end_ = layout->entries_.size() >= zip::kMax16 || layout->central_size_ >= zip::kMax32 ||
                       layout->central_offset_ >= zip::kMax32;

  layout->total_size_ = layout->central_offset_ + layout->central_size_ + zip::kEndFixed +
                        (layout->zip64_end_ ? zip::kZip64EndRecord + zip::kZip64Locator : 0);
  return layout;
}

std::unique_ptr<ArchiveStream> ZipLayout::Open() const {
  return std::make_unique<ZipStream>(shared_from_this());
}

} // namespace vault::packaging
