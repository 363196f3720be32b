#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "internal/packaging/archive_request.hpp"
#include "internal/packaging/packager.hpp"
#include "part_transport.hpp"
#include "retry_policy.hpp"
#include "transfer_strategy.hpp"
#include "upload_endpoint.hpp"
#include "window_queue.hpp"

namespace vault::transfer {

enum class FlowState {
  kIdle,
  kPackaging,
  kStrategizing,
  kSingleShotUploading,
  kSessionOpen,
  kPartsUploading,
  kReconciling,
  kCommitted,
  kArchived,
  kAborted,
};

std::string_view ToString(FlowState state);

// Emitted once per finished part; folded locally by the single listener.
struct ProgressEvent {
  uint32_t part_number = 0;
  uint32_t parts_done  = 0;
  uint32_t part_count  = 0;
  uint64_t bytes_done  = 0;
  uint64_t total_bytes = 0;
};

using ProgressListener = std::function<void(const ProgressEvent&)>;
using StateListener    = std::function<void(FlowState)>;
using Sleeper          = std::function<void(std::chrono::milliseconds)>;

class CancellationToken {
 public:
  void Cancel() {
    cancelled_ = true;
  }
  bool IsCancelled() const {
    return cancelled_;
  }

 private:
  std::atomic<bool> cancelled_{false};
};

struct FlowOptions {
  TransferPolicy policy;
  uint32_t       parallelism          = 1;
  uint32_t       max_session_restarts = 0;
  RetryPolicy    part_retry;

  static FlowOptions FromConfig(const vault::runtime::config::TransferConfig& config);
};

struct UploadOutcome {
  vault::archive::v1::ArchiveRecord record;
  TransferMode                      mode             = TransferMode::kSingleShot;
  uint32_t                          part_count       = 0;
  uint32_t                          session_restarts = 0;
};

/*
  UploadFlow

  Client side of one upload:

      Idle → Packaging → Strategizing → SingleShotUploading → Archived
                                      → SessionOpen → PartsUploading → Reconciling → Committed → Archived
      any failure → Aborted

  Multipart parts are read sequentially from the archive stream into a
  bounded queue and written by `parallelism` workers. Each attempt asks
  for a fresh capability; a part gives up after its retry policy is
  exhausted, which aborts the session and surfaces util::UploadFailed.
  A session-level expiry aborts and restarts from Strategizing, at most
  max_session_restarts times.

  Cancellation lets in-flight parts finish, then aborts the session.

  One flow instance runs one upload at a time.
*/
class UploadFlow {
 public:
  UploadFlow(std::shared_ptr<UploadEndpoint> endpoint, std::shared_ptr<PartTransport> transport, FlowOptions options);

  void SetProgressListener(ProgressListener listener) {
    progress_ = std::move(listener);
  }
  void SetStateListener(StateListener listener) {
    state_listener_ = std::move(listener);
  }
  // Replaces std::this_thread::sleep_for between part retries.
  void SetSleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
  }

  // Packages the request, then uploads it.
  UploadOutcome Run(const packaging::ArchiveRequest& request, const CancellationToken* cancel = nullptr);

  // Uploads an already packaged archive (starts at Strategizing).
  UploadOutcome Upload(const packaging::PackagedArchive& archive, const CancellationToken* cancel = nullptr);

  FlowState state() const {
    return state_;
  }

  const std::string& failure_cause() const {
    return failure_cause_;
  }

 private:
  UploadOutcome UploadSingleShot(const packaging::PackagedArchive& archive);
  UploadOutcome UploadMultipart(const packaging::PackagedArchive& archive, TransferPlan plan, const CancellationToken* cancel);

  std::string TransferWithRetry(const std::string& filename, const std::string& upload_id, const PartJob& job,
                                const CancellationToken* cancel);

  vault::archive::v1::CompleteUploadResponse CompleteWithRetry(const vault::archive::v1::CompleteUploadRequest& request);
  void AbortQuietly(const std::string& filename, const std::string& upload_id);
  void Transition(FlowState next);
  void Fail(const std::string& cause);

  std::shared_ptr<UploadEndpoint> endpoint_;
  std::shared_ptr<PartTransport>  transport_;
  FlowOptions                     options_;

  ProgressListener progress_;
  StateListener    state_listener_;
  Sleeper          sleeper_;

  std::atomic<FlowState> state_{FlowState::kIdle};
  std::string            failure_cause_;
};

} // namespace vault::transfer
