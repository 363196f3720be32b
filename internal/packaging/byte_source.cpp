#include "byte_source.hpp"

#include <arrow/io/file.h>
#include <arrow/io/memory.h>

#include <filesystem>

namespace vault::packaging {

arrow::Result<std::shared_ptr<arrow::io::InputStream>> FileByteSource::Open() const {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path_));
  return std::static_pointer_cast<arrow::io::InputStream>(file);
}

arrow::Result<uint64_t> FileByteSource::Size() const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    return arrow::Status::IOError("not a readable regular file: ", path_);
  }
  auto size = std::filesystem::file_size(path_, ec);
  if (ec) {
    return arrow::Status::IOError("cannot stat ", path_, ": ", ec.message());
  }
  return static_cast<uint64_t>(size);
}

MemoryByteSource::MemoryByteSource(std::string data, std::string label)
    : data_(arrow::Buffer::FromString(std::move(data))), label_(std::move(label)) {
}

arrow::Result<std::shared_ptr<arrow::io::InputStream>> MemoryByteSource::Open() const {
  return std::static_pointer_cast<arrow::io::InputStream>(std::make_shared<arrow::io::BufferReader>(data_));
}

arrow::Result<uint64_t> MemoryByteSource::Size() const {
  return static_cast<uint64_t>(data_->size());
}

} // namespace vault::packaging
