#include "upload_flow.hpp"

#include <exception>
#include <thread>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "receipt_table.hpp"

namespace vault::transfer {

using observability::StringField;
using observability::UIntField;

std::string_view ToString(FlowState state) {
  switch (state) {
    case FlowState::kIdle:
      return "idle";
    case FlowState::kPackaging:
      return "packaging";
    case FlowState::kStrategizing:
      return "strategizing";
    case FlowState::kSingleShotUploading:
      return "single-shot-uploading";
    case FlowState::kSessionOpen:
      return "session-open";
    case FlowState::kPartsUploading:
      return "parts-uploading";
    case FlowState::kReconciling:
      return "reconciling";
    case FlowState::kCommitted:
      return "committed";
    case FlowState::kArchived:
      return "archived";
    case FlowState::kAborted:
      return "aborted";
  }
  return "unknown";
}

FlowOptions FlowOptions::FromConfig(const vault::runtime::config::TransferConfig& config) {
  FlowOptions options;
  options.policy               = TransferPolicyFromConfig(config);
  options.parallelism          = config.parallelism() == 0 ? 1 : config.parallelism();
  options.max_session_restarts = config.max_session_restarts();
  options.part_retry           = RetryPolicy::FromConfig(config.part_retry());
  return options;
}

UploadFlow::UploadFlow(std::shared_ptr<UploadEndpoint> endpoint, std::shared_ptr<PartTransport> transport, FlowOptions options)
    : endpoint_(std::move(endpoint)), transport_(std::move(transport)), options_(std::move(options)) {
  if (options_.parallelism == 0) options_.parallelism = 1;
  sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

void UploadFlow::Transition(FlowState next) {
  VAULT_LOG_DEBUG("upload flow transition", {StringField("from", ToString(state_)), StringField("to", ToString(next))});
  state_ = next;
  if (state_listener_) state_listener_(next);
}

void UploadFlow::Fail(const std::string& cause) {
  failure_cause_ = cause;
  Transition(FlowState::kAborted);
  VAULT_LOG_ERROR("upload aborted", {StringField("cause", cause)});
}

// ------------------------------------------------------------
// Entry points
// ------------------------------------------------------------

UploadOutcome UploadFlow::Run(const packaging::ArchiveRequest& request, const CancellationToken* cancel) {
  failure_cause_.clear();
  Transition(FlowState::kPackaging);

  packaging::PackagedArchive archive;
  try {
    archive = packaging::Packager::Package(request);
  } catch (const std::exception& e) {
    Fail(e.what());
    throw;
  }
  return Upload(archive, cancel);
}

UploadOutcome UploadFlow::Upload(const packaging::PackagedArchive& archive, const CancellationToken* cancel) {
  failure_cause_.clear();

  try {
    ValidateTransferPolicy(options_.policy);
  } catch (const std::exception& e) {
    Fail(e.what());
    throw;
  }

  uint32_t restarts = 0;
  for (;;) {
    Transition(FlowState::kStrategizing);

    TransferPlan plan;
    try {
      plan = PlanTransfer(archive.total_size, options_.policy);
    } catch (const std::exception& e) {
      Fail(e.what());
      throw;
    }

    VAULT_LOG_INFO("transfer planned", {StringField("name", archive.name), StringField("mode", ToString(plan.mode)),
                                        UIntField("size_bytes", plan.total_size), UIntField("parts", plan.PartCount())});

    if (plan.mode == TransferMode::kSingleShot) {
      return UploadSingleShot(archive);
    }

    try {
      auto outcome             = UploadMultipart(archive, std::move(plan), cancel);
      outcome.session_restarts = restarts;
      return outcome;
    } catch (const util::SessionExpiredError& e) {
      if (e.scope() != util::SessionExpiredError::Scope::kSession || restarts >= options_.max_session_restarts) {
        Fail(e.what());
        throw util::UploadFailed(0, e.what());
      }
      ++restarts;
      VAULT_LOG_WARN("upload session expired, restarting", {StringField("name", archive.name), UIntField("restart", restarts)});
    }
  }
}

// ------------------------------------------------------------
// Single-shot
// ------------------------------------------------------------

UploadOutcome UploadFlow::UploadSingleShot(const packaging::PackagedArchive& archive) {
  Transition(FlowState::kSingleShotUploading);

  vault::archive::v1::ArchiveHeader header;
  header.set_filename(archive.name);
  header.set_content_type(archive.content_type);
  header.set_policy(archive.policy);
  header.set_size_bytes(archive.total_size);
  for (const auto& tag : archive.tags) header.add_tags(tag);

  try {
    auto stream   = archive.OpenStream();
    auto response = endpoint_->Archive(header, *stream);

    Transition(FlowState::kArchived);
    VAULT_LOG_INFO("archive stored", {StringField("file_id", response.record().file_id()), StringField("mode", "single-shot")});
    if (progress_) progress_(ProgressEvent{1, 1, 1, archive.total_size, archive.total_size});

    return UploadOutcome{response.record(), TransferMode::kSingleShot, 1, 0};
  } catch (const util::PackagingError& e) {
    Fail(e.what());
    throw;
  } catch (const std::exception& e) {
    Fail(e.what());
    throw util::UploadFailed(0, e.what());
  }
}

// ------------------------------------------------------------
// Multipart
// ------------------------------------------------------------

UploadOutcome UploadFlow::UploadMultipart(const packaging::PackagedArchive& archive, TransferPlan plan, const CancellationToken* cancel) {
  Transition(FlowState::kSessionOpen);

  vault::archive::v1::StartUploadRequest start_request;
  start_request.set_filename(archive.name);
  start_request.set_content_type(archive.content_type);
  start_request.set_expected_size_bytes(archive.total_size);
  start_request.set_chunk_size_bytes(plan.chunk_size);

  vault::archive::v1::StartUploadResponse start;
  try {
    start = endpoint_->StartUpload(start_request);
  } catch (const std::exception& e) {
    Fail(e.what());
    throw util::UploadFailed(0, e.what());
  }
  const auto upload_id = start.upload_id();

  // The server echoes the chunk size in effect; re-plan when it differs.
  if (start.chunk_size_bytes() != plan.chunk_size) {
    auto policy                = options_.policy;
    policy.chunk_size_bytes    = start.chunk_size_bytes();
    policy.min_part_size_bytes = 0;
    try {
      plan = PlanTransfer(archive.total_size, policy);
    } catch (const std::exception& e) {
      AbortQuietly(archive.name, upload_id);
      Fail(e.what());
      throw util::UploadFailed(0, e.what());
    }
  }
  if (plan.mode != TransferMode::kMultipart || start.expected_part_count() != plan.PartCount()) {
    AbortQuietly(archive.name, upload_id);
    const std::string cause = "server expects " + std::to_string(start.expected_part_count()) + " parts, planned " +
                              std::to_string(plan.PartCount());
    Fail(cause);
    throw util::UploadFailed(0, cause);
  }

  VAULT_LOG_INFO("upload session opened", {StringField("upload_id", upload_id), UIntField("parts", plan.PartCount()),
                                           UIntField("chunk_size_bytes", plan.chunk_size)});
  Transition(FlowState::kPartsUploading);

  ReceiptTable receipts(plan.PartCount());
  WindowQueue  queue(options_.parallelism);

  std::mutex         failure_mutex;
  std::exception_ptr failure;
  std::mutex         progress_mutex;
  uint32_t           parts_done = 0;
  uint64_t           bytes_done = 0;

  auto record_failure = [&](std::exception_ptr error) {
    {
      std::lock_guard lock(failure_mutex);
      if (!failure) failure = error;
    }
    queue.Shutdown();
  };

  auto worker = [&] {
    while (auto job = queue.Dequeue()) {
      if (cancel && cancel->IsCancelled()) {
        queue.Shutdown();
        break;
      }
      try {
        auto receipt = TransferWithRetry(archive.name, upload_id, *job, cancel);
        receipts.Record(job->window.part_number, std::move(receipt));

        std::lock_guard lock(progress_mutex);
        ++parts_done;
        bytes_done += job->window.length;
        if (progress_) {
          progress_(ProgressEvent{job->window.part_number, parts_done, plan.PartCount(), bytes_done, plan.total_size});
        }
      } catch (...) {
        record_failure(std::current_exception());
        break;
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(options_.parallelism);
  for (uint32_t i = 0; i < options_.parallelism; ++i) {
    workers.emplace_back(worker);
  }

  // Producer: read windows in part order.
  try {
    auto stream = archive.OpenStream();
    for (const auto& part : plan.parts) {
      if (cancel && cancel->IsCancelled()) break;

      auto data = stream->NextWindow(part.length);
      if (static_cast<uint64_t>(data->size()) != part.length) {
        throw util::PackagingError("archive stream ended early at part " + std::to_string(part.part_number));
      }
      if (!queue.Enqueue(PartJob{part, std::move(data)})) break;
    }
    queue.Close();
  } catch (...) {
    record_failure(std::current_exception());
  }

  for (auto& t : workers) t.join();

  if (!failure && cancel && cancel->IsCancelled()) {
    AbortQuietly(archive.name, upload_id);
    Fail("upload cancelled");
    throw util::UploadFailed(0, "upload cancelled");
  }

  if (failure) {
    AbortQuietly(archive.name, upload_id);
    try {
      std::rethrow_exception(failure);
    } catch (const util::PartTransferError& e) {
      Fail(e.what());
      throw util::UploadFailed(e.part_number(), e.cause());
    } catch (const util::SessionExpiredError& e) {
      if (e.scope() == util::SessionExpiredError::Scope::kSession) {
        failure_cause_ = e.what();
        throw;
      }
      Fail(e.what());
      throw util::UploadFailed(0, e.what());
    } catch (const util::PackagingError& e) {
      Fail(e.what());
      throw;
    } catch (const std::exception& e) {
      Fail(e.what());
      throw util::UploadFailed(0, e.what());
    }
  }

  // Reconciling: complete only with a full receipt set.
  Transition(FlowState::kReconciling);
  if (!receipts.Complete()) {
    AbortQuietly(archive.name, upload_id);
    const std::string cause = "missing receipts for " + std::to_string(receipts.Missing().size()) + " parts";
    Fail(cause);
    throw util::UploadFailed(0, cause);
  }

  vault::archive::v1::CompleteUploadRequest complete_request;
  complete_request.set_filename(archive.name);
  complete_request.set_upload_id(upload_id);
  for (auto& receipt : receipts.Ordered()) {
    *complete_request.add_parts() = std::move(receipt);
  }
  for (const auto& tag : archive.tags) complete_request.add_tags(tag);
  complete_request.set_policy(archive.policy);
  complete_request.set_file_size_bytes(archive.total_size);
  complete_request.set_content_type(archive.content_type);

  vault::archive::v1::CompleteUploadResponse complete;
  try {
    complete = CompleteWithRetry(complete_request);
  } catch (const util::SessionExpiredError& e) {
    AbortQuietly(archive.name, upload_id);
    if (e.scope() == util::SessionExpiredError::Scope::kSession) {
      failure_cause_ = e.what();
      throw;
    }
    Fail(e.what());
    throw util::UploadFailed(0, e.what());
  } catch (const std::exception& e) {
    AbortQuietly(archive.name, upload_id);
    Fail(e.what());
    throw util::UploadFailed(0, e.what());
  }

  Transition(FlowState::kCommitted);
  Transition(FlowState::kArchived);
  VAULT_LOG_INFO("archive stored", {StringField("file_id", complete.file_id()), StringField("upload_id", upload_id),
                                    StringField("mode", "multipart")});

  return UploadOutcome{complete.record(), TransferMode::kMultipart, plan.PartCount(), 0};
}

std::string UploadFlow::TransferWithRetry(const std::string& filename, const std::string& upload_id, const PartJob& job,
                                          const CancellationToken* cancel) {
  const auto part_number = job.window.part_number;
  RetryState retry(options_.part_retry);

  for (;;) {
    std::string cause;
    try {
      // fresh capability for every attempt
      vault::archive::v1::GetUploadPartUrlRequest request;
      request.set_filename(filename);
      request.set_upload_id(upload_id);
      request.set_part_number(part_number);
      auto capability = endpoint_->GetUploadPartUrl(request);

      return transport_->TransferPart(capability.url(), part_number, job.data);
    } catch (const util::PartTransferError& e) {
      cause = e.cause();
    } catch (const util::SessionExpiredError& e) {
      if (e.scope() == util::SessionExpiredError::Scope::kSession) throw;
      cause = e.what();
    } catch (const util::StorageError& e) {
      // capability service unavailable or timed out
      cause = e.what();
    }

    auto delay = retry.RecordFailure();
    if (!delay) {
      VAULT_LOG_ERROR("part retries exhausted", {StringField("upload_id", upload_id), UIntField("part_number", part_number),
                                                 UIntField("attempts", retry.failures()), StringField("cause", cause)});
      throw util::PartTransferError(part_number, cause);
    }
    if (cancel && cancel->IsCancelled()) {
      throw util::PartTransferError(part_number, "cancelled after: " + cause);
    }

    VAULT_LOG_WARN("part transfer failed, retrying", {StringField("upload_id", upload_id), UIntField("part_number", part_number),
                                                      UIntField("attempt", retry.failures()),
                                                      UIntField("backoff_ms", static_cast<uint64_t>(delay->count())),
                                                      StringField("cause", cause)});
    sleeper_(*delay);
  }
}

// A committed upload that failed catalog registration completes again from the
// server's pending record, so storage errors are retried.
vault::archive::v1::CompleteUploadResponse UploadFlow::CompleteWithRetry(const vault::archive::v1::CompleteUploadRequest& request) {
  RetryState retry(options_.part_retry);
  for (;;) {
    try {
      return endpoint_->CompleteUpload(request);
    } catch (const util::StorageError& e) {
      auto delay = retry.RecordFailure();
      if (!delay) throw;
      VAULT_LOG_WARN("complete upload failed, retrying", {StringField("upload_id", request.upload_id()),
                                                          UIntField("attempt", retry.failures()), StringField("error", e.what())});
      sleeper_(*delay);
    }
  }
}

void UploadFlow::AbortQuietly(const std::string& filename, const std::string& upload_id) {
  vault::archive::v1::AbortUploadRequest request;
  request.set_filename(filename);
  request.set_upload_id(upload_id);
  try {
    endpoint_->AbortUpload(request);
    VAULT_LOG_INFO("upload session aborted", {StringField("upload_id", upload_id)});
  } catch (const std::exception& e) {
    // the server reaper collects sessions we could not abort
    VAULT_LOG_WARN("abort failed", {StringField("upload_id", upload_id), StringField("error", e.what())});
  }
}

} // namespace vault::transfer
