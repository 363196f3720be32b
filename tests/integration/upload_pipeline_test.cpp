#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/packaging/archive_request.hpp"
#include "internal/packaging/zip_reader.hpp"
#include "internal/service/local_endpoint.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/transfer/upload_flow.hpp"
#include "internal/util/errors.hpp"

namespace {

using vault::transfer::FlowState;
using vault::transfer::TransferMode;
using vault::transfer::UploadFlow;

constexpr uint64_t kMiB = 1024 * 1024;

/*
  Object store that counts write-path calls before delegating.
*/
class CountingStore final : public vault::storage::ObjectStore {
 public:
  explicit CountingStore(std::shared_ptr<vault::storage::MemoryObjectStore> inner) : inner_(std::move(inner)) {
  }

  std::atomic<int> writers{0};
  std::atomic<int> multipart_uploads{0};
  std::atomic<int> parts{0};

  std::unique_ptr<vault::storage::ObjectWriter> OpenWriter(const std::string& key, const std::string& content_type) override {
    ++writers;
    return inner_->OpenWriter(key, content_type);
  }
  std::string CreateMultipartUpload(const std::string& key, const std::string& content_type) override {
    ++multipart_uploads;
    return inner_->CreateMultipartUpload(key, content_type);
  }
  std::string UploadPart(const std::string& key, const std::string& upload_id, uint32_t part_number,
                         const std::shared_ptr<arrow::Buffer>& data) override {
    ++parts;
    return inner_->UploadPart(key, upload_id, part_number, data);
  }
  vault::storage::ObjectInfo CompleteMultipartUpload(const std::string& key, const std::string& upload_id,
                                                     const std::vector<vault::storage::CompletedPart>& completed) override {
    return inner_->CompleteMultipartUpload(key, upload_id, completed);
  }
  void AbortMultipartUpload(const std::string& key, const std::string& upload_id) override {
    inner_->AbortMultipartUpload(key, upload_id);
  }
  std::optional<vault::storage::ObjectInfo> Head(const std::string& key) override {
    return inner_->Head(key);
  }
  std::shared_ptr<arrow::Buffer> ReadRange(const std::string& key, uint64_t offset, uint64_t length) override {
    return inner_->ReadRange(key, offset, length);
  }
  vault::storage::StoreLimits Limits() const override {
    return inner_->Limits();
  }

 private:
  std::shared_ptr<vault::storage::MemoryObjectStore> inner_;
};

/*
  Part transport that fails chosen parts a fixed number of times.
*/
class FaultyTransport final : public vault::transfer::PartTransport {
 public:
  explicit FaultyTransport(std::shared_ptr<vault::transfer::PartTransport> inner) : inner_(std::move(inner)) {
  }

  void FailPart(uint32_t part_number, int times) {
    std::lock_guard lock(mutex_);
    failures_.resize(std::max<size_t>(failures_.size(), part_number + 1), 0);
    failures_[part_number] = times;
  }

  int Attempts(uint32_t part_number) {
    std::lock_guard lock(mutex_);
    return part_number < attempts_.size() ? attempts_[part_number] : 0;
  }

  std::string TransferPart(const std::string& url, uint32_t part_number, const std::shared_ptr<arrow::Buffer>& data) override {
    {
      std::lock_guard lock(mutex_);
      attempts_.resize(std::max<size_t>(attempts_.size(), part_number + 1), 0);
      ++attempts_[part_number];
      if (part_number < failures_.size() && failures_[part_number] > 0) {
        --failures_[part_number];
        throw vault::util::PartTransferError(part_number, "injected connection reset");
      }
    }
    return inner_->TransferPart(url, part_number, data);
  }

 private:
  std::shared_ptr<vault::transfer::PartTransport> inner_;
  std::mutex                                      mutex_;
  std::vector<int>                                failures_;
  std::vector<int>                                attempts_;
};

/*
  Endpoint that reports the next `count` upload sessions as expired
  on every capability request. FailCapability makes the capability
  service unavailable for one part a number of times. LoseCompletions
  drops the response of the next completions after the server ran them.
*/
class FlakyEndpoint final : public vault::transfer::UploadEndpoint {
 public:
  explicit FlakyEndpoint(std::shared_ptr<vault::transfer::UploadEndpoint> inner) : inner_(std::move(inner)) {
  }

  void ExpireNextSessions(int count) {
    std::lock_guard lock(mutex_);
    remaining_ = count;
  }

  void FailCapability(uint32_t part_number, int times) {
    std::lock_guard lock(mutex_);
    outages_[part_number] = times;
  }

  void LoseCompletions(int times) {
    std::lock_guard lock(mutex_);
    lost_completions_ = times;
  }

  int CapabilityRequests(uint32_t part_number) {
    std::lock_guard lock(mutex_);
    auto            it = requests_.find(part_number);
    return it == requests_.end() ? 0 : it->second;
  }

  vault::archive::v1::StartUploadResponse StartUpload(const vault::archive::v1::StartUploadRequest& request) override {
    return inner_->StartUpload(request);
  }
  vault::archive::v1::GetUploadPartUrlResponse GetUploadPartUrl(const vault::archive::v1::GetUploadPartUrlRequest& request) override {
    {
      std::lock_guard lock(mutex_);
      ++requests_[request.part_number()];
      if (auto it = outages_.find(request.part_number()); it != outages_.end() && it->second > 0) {
        --it->second;
        throw vault::util::StorageError("capability service unavailable");
      }
      if (!expired_.count(request.upload_id()) && remaining_ > 0) {
        --remaining_;
        expired_.insert(request.upload_id());
      }
      if (expired_.count(request.upload_id())) {
        throw vault::util::SessionExpiredError(vault::util::SessionExpiredError::Scope::kSession,
                                               "upload session " + request.upload_id() + " expired");
      }
    }
    return inner_->GetUploadPartUrl(request);
  }
  vault::archive::v1::CompleteUploadResponse CompleteUpload(const vault::archive::v1::CompleteUploadRequest& request) override {
    auto response = inner_->CompleteUpload(request);
    std::lock_guard lock(mutex_);
    ++completions_;
    if (lost_completions_ > 0) {
      --lost_completions_;
      throw vault::util::StorageError("deadline exceeded");
    }
    return response;
  }

  int Completions() {
    std::lock_guard lock(mutex_);
    return completions_;
  }
  void AbortUpload(const vault::archive::v1::AbortUploadRequest& request) override {
    inner_->AbortUpload(request);
  }
  vault::archive::v1::ArchiveResponse Archive(const vault::archive::v1::ArchiveHeader& header,
                                              vault::packaging::ArchiveStream&          stream) override {
    return inner_->Archive(header, stream);
  }

 private:
  std::shared_ptr<vault::transfer::UploadEndpoint> inner_;
  std::mutex                                       mutex_;
  std::set<std::string>                            expired_;
  std::map<uint32_t, int>                          outages_;
  std::map<uint32_t, int>                          requests_;
  int                                              remaining_        = 0;
  int                                              lost_completions_ = 0;
  int                                              completions_      = 0;
};

struct Pipeline {
  std::shared_ptr<vault::storage::MemoryObjectStore> memory = std::make_shared<vault::storage::MemoryObjectStore>();
  std::shared_ptr<CountingStore>                     store  = std::make_shared<CountingStore>(memory);
  std::shared_ptr<vault::db::memory::MemoryRepository> repository = std::make_shared<vault::db::memory::MemoryRepository>();
  vault::factory::Application                        app;
  std::shared_ptr<vault::service::LocalEndpoint>     endpoint;
  std::shared_ptr<FaultyTransport>                   transport;

  Pipeline() {
    vault::runtime::config::RuntimeConfig config;
    auto*                                 uploads = config.mutable_uploads();
    uploads->set_small_object_threshold_bytes(25 * kMiB);
    uploads->set_default_chunk_size_bytes(5 * kMiB);
    uploads->set_capability_secret("pipeline-secret");
    uploads->set_capability_base_url("vault://parts");
    uploads->mutable_capability_ttl()->set_seconds(60);
    uploads->mutable_session_max_age()->set_seconds(3600);
    uploads->mutable_reaper_interval()->set_seconds(60);
    uploads->mutable_catalog_retry()->set_max_attempts(1);

    app       = vault::factory::Build(config, store, repository);
    endpoint  = std::make_shared<vault::service::LocalEndpoint>(app.archive_service);
    transport = std::make_shared<FaultyTransport>(endpoint);
  }

  vault::transfer::FlowOptions Options(uint64_t chunk) const {
    vault::transfer::FlowOptions options;
    options.policy                  = vault::transfer::TransferPolicy{25 * kMiB, chunk, 5 * kMiB};
    options.parallelism             = 3;
    options.max_session_restarts    = 1;
    options.part_retry.max_attempts = 3;
    return options;
  }

  std::unique_ptr<UploadFlow> Flow(uint64_t chunk = 5 * kMiB, std::shared_ptr<vault::transfer::UploadEndpoint> control = nullptr) {
    auto flow = std::make_unique<UploadFlow>(control ? control : endpoint, transport, Options(chunk));
    flow->SetSleeper([](std::chrono::milliseconds) {});
    return flow;
  }

  std::vector<vault::db::model::ArchiveRecord> Catalog() {
    auto tx   = repository->Begin();
    auto rows = repository->ListArchives(*tx);
    tx->Commit();
    return rows;
  }

  std::string Read(const std::string& file_id) {
    vault::archive::v1::ReadArchiveRequest request;
    request.set_file_id(file_id);
    std::string out;
    app.archive_service->ReadArchive(request, [&](const std::shared_ptr<arrow::Buffer>& chunk) { out += chunk->ToString(); });
    return out;
  }
};

std::string Pattern(uint64_t size) {
  std::string data(size, '\0');
  for (uint64_t i = 0; i < size; ++i) data[i] = static_cast<char>((i * 31 + 7) % 251);
  return data;
}

vault::packaging::ArchiveRequest Request(std::vector<std::pair<std::string, std::string>> files) {
  std::vector<vault::packaging::SourceItem> items;
  for (auto& [path, data] : files) {
    items.push_back({path, std::make_shared<vault::packaging::MemoryByteSource>(std::move(data), path)});
  }
  return vault::packaging::MakeArchiveRequest(std::move(items), {"integration"}, vault::archive::v1::RETENTION_POLICY_STANDARD);
}

void TestSmallFileTakesSingleShotPath() {
  Pipeline   p;
  const auto data = Pattern(10 * kMiB);
  auto       flow = p.Flow();

  const auto outcome = flow->Run(Request({{"scan.pdf", data}}));
  assert(outcome.mode == TransferMode::kSingleShot);
  assert(flow->state() == FlowState::kArchived);
  assert(p.store->writers == 1);
  assert(p.store->multipart_uploads == 0);

  assert(outcome.record.size_bytes() == 10 * kMiB);
  assert(outcome.record.original_filename() == "scan.pdf");
  assert(outcome.record.content_type() == "application/pdf");
  assert(outcome.record.status() == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);

  vault::archive::v1::GetArchiveRequest get;
  get.set_file_id(outcome.record.file_id());
  assert(p.app.archive_service->GetArchive(get).record().size_bytes() == 10 * kMiB);
  assert(p.Read(outcome.record.file_id()) == data);
}

void TestMultipartSurvivesTransientPartFailures() {
  Pipeline   p;
  const auto data = Pattern(12 * kMiB);
  p.transport->FailPart(2, 2);

  auto                   flow = p.Flow();
  std::mutex             events_mutex;
  std::vector<uint32_t>  finished;
  uint64_t               bytes_done = 0;
  std::vector<FlowState> states;
  flow->SetProgressListener([&](const vault::transfer::ProgressEvent& e) {
    std::lock_guard lock(events_mutex);
    finished.push_back(e.part_number);
    bytes_done = std::max(bytes_done, e.bytes_done);
  });
  flow->SetStateListener([&](FlowState s) { states.push_back(s); });

  const auto outcome = flow->Run(Request({{"blob.bin", data}}));
  assert(outcome.mode == TransferMode::kMultipart);
  assert(outcome.part_count == 3);
  assert(p.transport->Attempts(2) == 3);
  assert(p.transport->Attempts(1) == 1);
  assert(p.store->parts == 3);
  assert(finished.size() == 3);
  assert(bytes_done == 12 * kMiB);
  assert(states.back() == FlowState::kArchived);
  assert(std::find(states.begin(), states.end(), FlowState::kReconciling) != states.end());

  assert(outcome.record.size_bytes() == 12 * kMiB);
  assert(outcome.record.content_fingerprint().find("-3") != std::string::npos);
  assert(p.Read(outcome.record.file_id()) == data);
  assert(p.app.sessions->ActiveCount() == 0);
}

void TestExhaustedPartAbortsUpload() {
  Pipeline p;
  p.transport->FailPart(3, 10);
  auto flow = p.Flow();

  bool thrown = false;
  try {
    flow->Run(Request({{"blob.bin", Pattern(12 * kMiB)}}));
  } catch (const vault::util::UploadFailed& e) {
    thrown = e.part_number() == 3;
  }
  assert(thrown);
  assert(flow->state() == FlowState::kAborted);
  assert(p.transport->Attempts(3) == 3);
  assert(p.memory->PendingUploadCount() == 0);
  assert(p.memory->ObjectCount() == 0);
  assert(p.app.sessions->ActiveCount() == 0);
  assert(p.Catalog().empty());
}

void TestCapabilityOutageIsRetried() {
  Pipeline   p;
  const auto data  = Pattern(12 * kMiB);
  auto       flaky = std::make_shared<FlakyEndpoint>(p.endpoint);
  auto       flow  = p.Flow(5 * kMiB, flaky);
  flaky->FailCapability(2, 1);

  const auto outcome = flow->Run(Request({{"blob.bin", data}}));
  assert(outcome.mode == TransferMode::kMultipart);
  assert(outcome.session_restarts == 0);
  assert(flaky->CapabilityRequests(2) == 2);
  assert(p.transport->Attempts(2) == 1);
  assert(p.store->multipart_uploads == 1);
  assert(p.Read(outcome.record.file_id()) == data);

  const auto catalog = p.Catalog();
  assert(catalog.size() == 1);
  assert(catalog[0].status == vault::archive::v1::ARCHIVE_STATUS_ARCHIVED);
}

void TestCapabilityOutageBeyondRetriesAbortsUpload() {
  Pipeline p;
  auto     flaky = std::make_shared<FlakyEndpoint>(p.endpoint);
  auto     flow  = p.Flow(5 * kMiB, flaky);
  flaky->FailCapability(1, 10);

  bool thrown = false;
  try {
    flow->Run(Request({{"blob.bin", Pattern(12 * kMiB)}}));
  } catch (const vault::util::UploadFailed& e) {
    thrown = e.part_number() == 1;
  }
  assert(thrown);
  assert(flow->state() == FlowState::kAborted);
  assert(flaky->CapabilityRequests(1) == 3);
  assert(p.transport->Attempts(1) == 0);
  assert(p.memory->PendingUploadCount() == 0);
  assert(p.Catalog().empty());
}

void TestLostCompletionResponseIsRetried() {
  Pipeline   p;
  const auto data  = Pattern(12 * kMiB);
  auto       flaky = std::make_shared<FlakyEndpoint>(p.endpoint);
  auto       flow  = p.Flow(5 * kMiB, flaky);
  flaky->LoseCompletions(1);

  const auto outcome = flow->Run(Request({{"blob.bin", data}}));
  assert(flow->state() == FlowState::kArchived);
  assert(flaky->Completions() == 2);
  assert(p.memory->ObjectCount() == 1);
  assert(p.Read(outcome.record.file_id()) == data);
  assert(p.Catalog().size() == 1);
}

void TestTreeWithoutCommonRootIsZipped() {
  Pipeline p;
  auto     flow = p.Flow();

  const auto outcome = flow->Run(Request({{"a/1.txt", "first file"}, {"b/2.txt", "second file"}}));
  const auto& name   = outcome.record.original_filename();
  assert(name.rfind("archive-", 0) == 0);
  assert(name.size() == std::string("archive-yyyymmdd-HHMMSS.zip").size());
  assert(outcome.record.content_type() == "application/zip");

  const auto bytes  = p.Read(outcome.record.file_id());
  auto       reader = vault::packaging::ZipReader::Open(std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(bytes)));
  assert(reader.Entries().size() == 2);
  assert(reader.Entries()[0].name == "a/1.txt");
  assert(reader.Entries()[1].name == "b/2.txt");
  assert(reader.ReadEntry(reader.Entries()[1])->ToString() == "second file");
}

void TestExpiredSessionRestartsOnce() {
  Pipeline p;
  auto     expiring = std::make_shared<FlakyEndpoint>(p.endpoint);
  auto     flow     = p.Flow(5 * kMiB, expiring);
  expiring->ExpireNextSessions(1);

  const auto data    = Pattern(11 * kMiB);
  const auto outcome = flow->Run(Request({{"blob.bin", data}}));
  assert(outcome.session_restarts == 1);
  assert(p.store->multipart_uploads == 2);
  assert(p.memory->PendingUploadCount() == 0);
  assert(p.Read(outcome.record.file_id()) == data);

  // a second expiry beyond the restart budget is terminal
  expiring->ExpireNextSessions(2);
  bool thrown = false;
  try {
    flow->Run(Request({{"blob.bin", data}}));
  } catch (const vault::util::UploadFailed&) {
    thrown = true;
  }
  assert(thrown);
  assert(flow->state() == FlowState::kAborted);
}

void TestEmptyAndCancelledUploadsNeverCommit() {
  Pipeline p;
  auto     flow = p.Flow();

  bool empty = false;
  try {
    flow->Run(Request({{"empty.txt", ""}}));
  } catch (const vault::util::EmptyArchiveError&) {
    empty = true;
  }
  assert(empty);
  assert(p.store->writers == 0 && p.store->multipart_uploads == 0);

  vault::transfer::CancellationToken cancel;
  cancel.Cancel();
  bool cancelled = false;
  try {
    flow->Run(Request({{"blob.bin", Pattern(12 * kMiB)}}), &cancel);
  } catch (const vault::util::UploadFailed& e) {
    cancelled = e.cause() == "upload cancelled";
  }
  assert(cancelled);
  assert(p.memory->PendingUploadCount() == 0);
  assert(p.memory->ObjectCount() == 0);
}

void TestChunkBelowStoreMinimumIsRefused() {
  Pipeline p;
  auto     options                   = p.Options(1 * kMiB);
  options.policy.min_part_size_bytes = 0;
  UploadFlow flow(p.endpoint, p.transport, options);

  bool thrown = false;
  try {
    flow.Run(Request({{"blob.bin", Pattern(30 * kMiB)}}));
  } catch (const vault::util::UploadFailed&) {
    thrown = true;
  }
  assert(thrown);
  assert(p.store->multipart_uploads == 0);
}

} // namespace

int main() {
  TestSmallFileTakesSingleShotPath();
  TestMultipartSurvivesTransientPartFailures();
  TestExhaustedPartAbortsUpload();
  TestCapabilityOutageIsRetried();
  TestCapabilityOutageBeyondRetriesAbortsUpload();
  TestLostCompletionResponseIsRetried();
  TestTreeWithoutCommonRootIsZipped();
  TestExpiredSessionRestartsOnce();
  TestEmptyAndCancelledUploadsNeverCommit();
  TestChunkBelowStoreMinimumIsRefused();

  std::cout << "vault_integration_upload_pipeline: pass\n";
  return 0;
}
