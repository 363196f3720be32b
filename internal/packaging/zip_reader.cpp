#include "zip_reader.hpp"

#include <arrow/io/file.h>
#include <zlib.h>

#include <algorithm>

#include "internal/util/errors.hpp"
#include "zip_layout.hpp"

namespace vault::packaging {

namespace {

constexpr int64_t kVerifyWindowBytes = 1 << 20;

uint16_t LE16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t LE32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t LE64(const uint8_t* p) {
  return static_cast<uint64_t>(LE32(p)) | (static_cast<uint64_t>(LE32(p + 4)) << 32);
}

template <typename T>
T Check(arrow::Result<T> result, const char* what) {
  if (!result.ok()) throw util::PackagingError(std::string(what) + ": " + result.status().ToString());
  return std::move(result).ValueOrDie();
}

std::shared_ptr<arrow::Buffer> ReadExactly(arrow::io::RandomAccessFile& file, uint64_t offset, uint64_t length) {
  auto buffer = Check(file.ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length)), "zip read");
  if (static_cast<uint64_t>(buffer->size()) != length) {
    throw util::PackagingError("zip archive is truncated");
  }
  return buffer;
}

} // namespace

ZipReader ZipReader::Open(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  ZipReader reader(std::move(file));
  reader.ReadCentralDirectory();
  return reader;
}

ZipReader ZipReader::OpenPath(const std::string& path) {
  auto file = Check(arrow::io::ReadableFile::Open(path), "cannot open zip");
  return Open(std::move(file));
}

void ZipReader::ReadCentralDirectory() {
  const auto file_size = static_cast<uint64_t>(Check(file_->GetSize(), "zip size"));
  if (file_size < zip::kEndFixed) {
    throw util::PackagingError("not a zip archive");
  }

  // End record sits in the trailing 22 + 65535 (max comment) bytes.
  const uint64_t tail_len = std::min<uint64_t>(file_size, zip::kEndFixed + zip::kMax16);
  const uint64_t tail_off = file_size - tail_len;
  auto           tail     = ReadExactly(*file_, tail_off, tail_len);
  const uint8_t* t        = tail->data();

  int64_t eocd = -1;
  for (int64_t i = static_cast<int64_t>(tail_len - zip::kEndFixed); i >= 0; --i) {
    if (LE32(t + i) == zip::kEndOfCentralDirSignature) {
      eocd = i;
      break;
    }
  }
  if (eocd < 0) {
    throw util::PackagingError("zip end of central directory not found");
  }

  const uint8_t* e      = t + eocd;
  uint64_t       count  = LE16(e + 10);
  uint64_t       size   = LE32(e + 12);
  uint64_t       offset = LE32(e + 16);

  if (count == zip::kMax16 || size == zip::kMax32 || offset == zip::kMax32) {
    const uint64_t eocd_abs = tail_off + static_cast<uint64_t>(eocd);
    if (eocd_abs < zip::kZip64Locator) {
      throw util::PackagingError("zip64 locator missing");
    }
    auto locator = ReadExactly(*file_, eocd_abs - zip::kZip64Locator, zip::kZip64Locator);
    if (LE32(locator->data()) != zip::kZip64LocatorSignature) {
      throw util::PackagingError("zip64 locator missing");
    }
    auto record = ReadExactly(*file_, LE64(locator->data() + 8), zip::kZip64EndRecord);
    if (LE32(record->data()) != zip::kZip64EndSignature) {
      throw util::PackagingError("zip64 end record missing");
    }
    count  = LE64(record->data() + 32);
    size   = LE64(record->data() + 40);
    offset = LE64(record->data() + 48);
  }

  if (offset + size > file_size) {
    throw util::PackagingError("zip central directory out of bounds");
  }

  auto           directory = ReadExactly(*file_, offset, size);
  const uint8_t* p         = directory->data();
  const uint8_t* end       = p + size;

  entries_.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    if (end - p < static_cast<std::ptrdiff_t>(zip::kCentralFixed) || LE32(p) != zip::kCentralHeaderSignature) {
      throw util::PackagingError("corrupt zip central directory");
    }
    const uint16_t method      = LE16(p + 10);
    const uint16_t name_len    = LE16(p + 28);
    const uint16_t extra_len   = LE16(p + 30);
    const uint16_t comment_len = LE16(p + 32);
    if (end - p < static_cast<std::ptrdiff_t>(zip::kCentralFixed + name_len + extra_len + comment_len)) {
      throw util::PackagingError("corrupt zip central directory");
    }

    ZipEntryInfo info;
    info.method              = method;
    info.crc32               = LE32(p + 16);
    info.size                = LE32(p + 24);
    uint64_t compressed      = LE32(p + 20);
    info.local_header_offset = LE32(p + 42);
    info.name.assign(reinterpret_cast<const char*>(p + zip::kCentralFixed), name_len);

    const uint8_t* x     = p + zip::kCentralFixed + name_len;
    const uint8_t* x_end = x + extra_len;
    while (x_end - x >= 4) {
      const uint16_t id  = LE16(x);
      const uint16_t len = LE16(x + 2);
      const uint8_t* v   = x + 4;
      if (x_end - v < len) break;
      if (id == zip::kZip64ExtraId) {
        const uint8_t* cursor = v;
        auto           take   = [&](uint64_t& field) {
          if (field == zip::kMax32 && v + len - cursor >= 8) {
            field = LE64(cursor);
            cursor += 8;
          }
        };
        take(info.size);
        take(compressed);
        take(info.local_header_offset);
      }
      x = v + len;
    }

    entries_.push_back(std::move(info));
    p += zip::kCentralFixed + name_len + extra_len + comment_len;
  }
}

uint64_t ZipReader::DataOffset(const ZipEntryInfo& entry) const {
  auto header = ReadExactly(*file_, entry.local_header_offset, zip::kLocalHeaderFixed);
  if (LE32(header->data()) != zip::kLocalHeaderSignature) {
    throw util::PackagingError("corrupt local header for " + entry.name);
  }
  return entry.local_header_offset + zip::kLocalHeaderFixed + LE16(header->data() + 26) + LE16(header->data() + 28);
}

std::shared_ptr<arrow::Buffer> ZipReader::ReadEntry(const ZipEntryInfo& entry) const {
  if (entry.method != 0) {
    throw util::PackagingError("compressed entries are not supported: " + entry.name);
  }

  auto data = ReadExactly(*file_, DataOffset(entry), entry.size);
  auto crc  = crc32_z(0L, data->data(), static_cast<z_size_t>(data->size()));
  if (static_cast<uint32_t>(crc) != entry.crc32) {
    throw util::PackagingError("crc mismatch for " + entry.name);
  }
  return data;
}

void ZipReader::VerifyEntry(const ZipEntryInfo& entry) const {
  if (entry.method != 0) {
    throw util::PackagingError("compressed entries are not supported: " + entry.name);
  }

  uint64_t offset    = DataOffset(entry);
  uint64_t remaining = entry.size;
  uLong    crc       = crc32_z(0L, Z_NULL, 0);
  while (remaining > 0) {
    const auto n      = std::min<uint64_t>(remaining, kVerifyWindowBytes);
    auto       window = ReadExactly(*file_, offset, n);
    crc               = crc32_z(crc, window->data(), static_cast<z_size_t>(n));
    offset += n;
    remaining -= n;
  }
  if (static_cast<uint32_t>(crc) != entry.crc32) {
    throw util::PackagingError("crc mismatch for " + entry.name);
  }
}

} // namespace vault::packaging
