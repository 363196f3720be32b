#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>

namespace vault::packaging {

/*
  Lazily produced archive bytes.

  NextWindow() yields at most max_bytes; an empty buffer marks the end.
  Memory held by the stream is bounded by one window plus per-entry
  header bytes. Source failures throw util::PackagingError.
*/
class ArchiveStream {
 public:
  virtual ~ArchiveStream() = default;

  virtual std::shared_ptr<arrow::Buffer> NextWindow(uint64_t max_bytes) = 0;

  // Bytes produced so far.
  virtual uint64_t Position() const = 0;
};

/*
  Deterministic byte layout of one archive. The total size is known
  before any source byte is read; Open() may be called again to replay
  the same bytes from the start.
*/
class ArchiveLayout {
 public:
  virtual ~ArchiveLayout() = default;

  virtual uint64_t TotalSize() const = 0;

  virtual std::unique_ptr<ArchiveStream> Open() const = 0;
};

} // namespace vault::packaging
