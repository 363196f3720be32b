#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstdint>
#include <memory>
#include <string>

namespace vault::packaging {

/*
  Re-openable source of bytes for one archive item.

  Open() may be called more than once; each call yields a fresh stream
  positioned at the start. Size() must match the number of bytes the
  stream yields; the packager fails the archive when it does not.
*/
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual arrow::Result<std::shared_ptr<arrow::io::InputStream>> Open() const = 0;

  virtual arrow::Result<uint64_t> Size() const = 0;

  // Human readable origin for error messages.
  virtual std::string Describe() const = 0;
};

using ByteSourcePtr = std::shared_ptr<const ByteSource>;

class FileByteSource final : public ByteSource {
 public:
  explicit FileByteSource(std::string path) : path_(std::move(path)) {
  }

  arrow::Result<std::shared_ptr<arrow::io::InputStream>> Open() const override;
  arrow::Result<uint64_t>                                Size() const override;

  std::string Describe() const override {
    return path_;
  }

 private:
  std::string path_;
};

class MemoryByteSource final : public ByteSource {
 public:
  explicit MemoryByteSource(std::shared_ptr<arrow::Buffer> data, std::string label = "<memory>")
      : data_(std::move(data)), label_(std::move(label)) {
  }

  explicit MemoryByteSource(std::string data, std::string label = "<memory>");

  arrow::Result<std::shared_ptr<arrow::io::InputStream>> Open() const override;
  arrow::Result<uint64_t>                                Size() const override;

  std::string Describe() const override {
    return label_;
  }

 private:
  std::shared_ptr<arrow::Buffer> data_;
  std::string                    label_;
};

} // namespace vault::packaging
