#include "internal/packaging/packager.hpp"
#include "internal/packaging/zip_layout.hpp"
#include "internal/packaging/zip_reader.hpp"
#include "internal/util/errors.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using vault::packaging::ArchiveRequest;
using vault::packaging::ArchiveStream;
using vault::packaging::MakeArchiveRequest;
using vault::packaging::MemoryByteSource;
using vault::packaging::Packager;
using vault::packaging::SourceItem;
using vault::packaging::TreeSources;
using vault::packaging::ZipReader;

SourceItem Item(const std::string& path, const std::string& data) {
  return SourceItem{path, std::make_shared<MemoryByteSource>(data, path)};
}

std::string Drain(ArchiveStream& stream, uint64_t window) {
  std::string out;
  for (;;) {
    auto buffer = stream.NextWindow(window);
    assert(buffer != nullptr);
    if (buffer->size() == 0) break;
    assert(static_cast<uint64_t>(buffer->size()) <= window);
    out.append(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));
  }
  return out;
}

// 2024-01-02 03:04:05 UTC
vault::util::TimePoint FixedTime() {
  return vault::util::TimePoint(std::chrono::seconds(1704164645));
}

template <typename Fn>
void ExpectPackagingError(Fn&& fn) {
  bool thrown = false;
  try {
    fn();
  } catch (const vault::util::PackagingError&) {
    thrown = true;
  }
  assert(thrown);
}

void TestSingleFileIsUploadedVerbatim() {
  auto request = MakeArchiveRequest({Item("report.pdf", "%PDF-1.7 body")}, {"finance"},
                                    vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD);
  const auto archive = Packager::Package(request, FixedTime());

  assert(archive.name == "report.pdf");
  assert(archive.content_type == "application/pdf");
  assert(archive.total_size == 13);
  assert(archive.tags.size() == 1 && archive.tags.front() == "finance");
  assert(archive.policy == vault::archive::v1::RETENTION_POLICY_LEGAL_HOLD);

  auto stream = archive.OpenStream();
  assert(Drain(*stream, 4) == "%PDF-1.7 body");
}

void TestUnknownExtensionFallsBackToOctetStream() {
  assert(Packager::GuessContentType("blob.weird") == "application/octet-stream");
  assert(Packager::GuessContentType("noextension") == "application/octet-stream");
  assert(Packager::GuessContentType("dir/photo.JPG") == "image/jpeg");
}

void TestTreeIsPackagedUnderCommonRoot() {
  auto request = MakeArchiveRequest({Item("photos/a.txt", "alpha"), Item("photos/nested/b.txt", "bravo bravo")}, {},
                                    vault::archive::v1::RETENTION_POLICY_STANDARD);
  const auto archive = Packager::Package(request, FixedTime());

  assert(archive.name == "photos.zip");
  assert(archive.content_type == "application/zip");

  auto       stream = archive.OpenStream();
  const auto bytes  = Drain(*stream, 7);
  assert(bytes.size() == archive.total_size);
  assert(stream->Position() == archive.total_size);

  auto reader = ZipReader::Open(std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(bytes)));
  assert(reader.Entries().size() == 2);
  assert(reader.Entries()[0].name == "photos/a.txt");
  assert(reader.Entries()[1].name == "photos/nested/b.txt");
  assert(reader.Entries()[1].size == 11);

  for (const auto& entry : reader.Entries()) {
    reader.VerifyEntry(entry);
  }
  assert(reader.ReadEntry(reader.Entries()[0])->ToString() == "alpha");
  assert(reader.ReadEntry(reader.Entries()[1])->ToString() == "bravo bravo");
}

void TestTreeWithoutCommonRootIsNamedByTimestamp() {
  auto request = MakeArchiveRequest({Item("a.txt", "a"), Item("docs/b.txt", "b")}, {},
                                    vault::archive::v1::RETENTION_POLICY_STANDARD);
  const auto archive = Packager::Package(request, FixedTime());
  assert(archive.name == "archive-20240102-030405.zip");
}

void TestReplayYieldsIdenticalBytes() {
  auto request = MakeArchiveRequest({Item("set/one.bin", std::string(5000, 'x')), Item("set/two.bin", "tail")}, {},
                                    vault::archive::v1::RETENTION_POLICY_STANDARD);
  const auto archive = Packager::Package(request, FixedTime());

  auto first  = archive.OpenStream();
  auto second = archive.OpenStream();
  assert(Drain(*first, 1024) == Drain(*second, 333));
}

void TestInvalidRelativePathsAreRejected() {
  for (const std::string bad : {"", "/abs/path.txt", "dir/../escape.txt", "dir//double.txt", "./here.txt"}) {
    ArchiveRequest request;
    request.contents = TreeSources{{Item("ok/x.txt", "x"), Item(bad, "y")}};
    ExpectPackagingError([&] { Packager::Package(request, FixedTime()); });
  }
}

void TestDuplicatePathsAreRejected() {
  auto request = MakeArchiveRequest({Item("d/x.txt", "1"), Item("d/x.txt", "2")}, {},
                                    vault::archive::v1::RETENTION_POLICY_STANDARD);
  ExpectPackagingError([&] { Packager::Package(request, FixedTime()); });
}

void TestEmptyRequestIsRejected() {
  ExpectPackagingError([] { MakeArchiveRequest({}, {}, vault::archive::v1::RETENTION_POLICY_STANDARD); });
}

void TestEmptyEntriesStillProduceValidContainer() {
  auto request = MakeArchiveRequest({Item("e/empty.txt", ""), Item("e/full.txt", "z")}, {},
                                    vault::archive::v1::RETENTION_POLICY_STANDARD);
  const auto archive = Packager::Package(request, FixedTime());

  auto       stream = archive.OpenStream();
  const auto bytes  = Drain(*stream, 64);
  assert(bytes.size() == archive.total_size);

  auto reader = ZipReader::Open(std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(bytes)));
  assert(reader.Entries().size() == 2);
  assert(reader.Entries()[0].size == 0);
  assert(reader.ReadEntry(reader.Entries()[0])->size() == 0);
}

} // namespace

int main() {
  TestSingleFileIsUploadedVerbatim();
  TestUnknownExtensionFallsBackToOctetStream();
  TestTreeIsPackagedUnderCommonRoot();
  TestTreeWithoutCommonRootIsNamedByTimestamp();
  TestReplayYieldsIdenticalBytes();
  TestInvalidRelativePathsAreRejected();
  TestDuplicatePathsAreRejected();
  TestEmptyRequestIsRejected();
  TestEmptyEntriesStillProduceValidContainer();

  std::cout << "vault_unit_packager: pass\n";
  return 0;
}
