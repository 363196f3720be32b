#include "archive_service.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/record_mapping.hpp"
#include "internal/metadata/metadata_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/transfer/upload_endpoint.hpp"
#include "internal/upload/completion_reconciler.hpp"
#include "internal/upload/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace vault::service {

using namespace vault::archive::v1;
using observability::IntField;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
    VAULT_LOG_WARN("RPC failed", {StringField("route", route), StringField("id", id), StringField("error", ex.what()),
                                  IntField("elapsed_ms", elapsed.count())});
    throw;
  }
}

} // namespace

ArchiveService::ArchiveService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ---------------------------------------------------------------------------
// Multipart
// ---------------------------------------------------------------------------

StartUploadResponse ArchiveService::StartUpload(const StartUploadRequest& req) {
  return ObserveRpc("ArchiveService.StartUpload", req.filename(), [&] {
    const auto session =
        ctx_.sessions->OpenSession(req.filename(), req.content_type(), req.expected_size_bytes(), req.chunk_size_bytes());

    StartUploadResponse resp;
    resp.set_upload_id(session.session_id);
    resp.set_chunk_size_bytes(session.chunk_size_bytes);
    resp.set_expected_part_count(session.expected_part_count);
    *resp.mutable_expires_at() = util::ToProto(session.expires_at);
    return resp;
  });
}

GetUploadPartUrlResponse ArchiveService::GetUploadPartUrl(const GetUploadPartUrlRequest& req) {
  return ObserveRpc("ArchiveService.GetUploadPartUrl", req.upload_id(), [&] {
    const auto session = ctx_.sessions->Get(req.upload_id());
    if (!req.filename().empty() && req.filename() != session.filename) {
      throw util::InvalidArgument("filename '" + req.filename() + "' does not match upload session " + req.upload_id());
    }

    const auto capability = ctx_.sessions->IssuePartCapability(req.upload_id(), req.part_number());

    GetUploadPartUrlResponse resp;
    resp.set_url(capability.url);
    *resp.mutable_expires_at() = util::ToProto(capability.expires_at);
    return resp;
  });
}

PutPartResponse ArchiveService::PutPart(const std::string& url, const std::shared_ptr<arrow::Buffer>& data) {
  return ObserveRpc("ArchiveService.PutPart", "", [&] {
    const auto written = ctx_.sessions->WritePart(url, data);

    PutPartResponse resp;
    resp.set_part_number(written.part_number);
    resp.set_receipt_token(written.etag);
    return resp;
  });
}

CompleteUploadResponse ArchiveService::CompleteUpload(const CompleteUploadRequest& req) {
  return ObserveRpc("ArchiveService.CompleteUpload", req.upload_id(), [&] {
    auto record = ctx_.reconciler->Complete(req);

    CompleteUploadResponse resp;
    resp.set_file_id(record.file_id());
    resp.set_status(record.status());
    *resp.mutable_record() = std::move(record);
    return resp;
  });
}

void ArchiveService::AbortUpload(const AbortUploadRequest& req) {
  ObserveRpc("ArchiveService.AbortUpload", req.upload_id(), [&] { ctx_.sessions->Abort(req.upload_id()); });
}

// ---------------------------------------------------------------------------
// Single-shot
// ---------------------------------------------------------------------------

ArchiveResponse ArchiveService::Archive(const ArchiveHeader& header, packaging::ArchiveStream& body) {
  return ObserveRpc("ArchiveService.Archive", header.filename(), [&] {
    if (header.size_bytes() == 0) {
      throw util::EmptyArchiveError();
    }
    if (header.filename().empty()) {
      throw util::InvalidArgument("filename must not be empty");
    }
    if (ctx_.small_object_threshold_bytes > 0 && header.size_bytes() > ctx_.small_object_threshold_bytes) {
      throw util::InvalidArgument("single-shot upload of " + std::to_string(header.size_bytes()) +
                                  " bytes exceeds the threshold of " + std::to_string(ctx_.small_object_threshold_bytes) +
                                  "; use a multipart upload");
    }

    db::model::ArchiveRecord row;
    row.file_id           = util::NewId();
    row.original_filename = header.filename();
    row.storage_key       = storage::common::ArchiveObjectKey(row.file_id, header.filename());
    row.content_type      = header.content_type();
    row.tags.assign(header.tags().begin(), header.tags().end());
    row.retention_policy = header.policy();
    row.status           = ARCHIVE_STATUS_ARCHIVED;

    auto     writer   = ctx_.store->OpenWriter(row.storage_key, header.content_type());
    uint64_t received = 0;
    try {
      for (;;) {
        auto chunk = body.NextWindow(transfer::kStreamFrameBytes);
        if (!chunk || chunk->size() == 0) break;
        received += static_cast<uint64_t>(chunk->size());
        if (received > header.size_bytes()) {
          throw util::InvalidArgument("single-shot body exceeds the declared " + std::to_string(header.size_bytes()) + " bytes");
        }
        writer->Write(chunk->data(), static_cast<uint64_t>(chunk->size()));
      }
      if (received != header.size_bytes()) {
        throw util::InvalidArgument("single-shot body carried " + std::to_string(received) + " of " +
                                    std::to_string(header.size_bytes()) + " declared bytes");
      }
    } catch (...) {
      writer->Abort();
      throw;
    }

    const auto info         = writer->Close();
    row.size_bytes          = info.size_bytes;
    row.content_fingerprint = info.etag;
    row.archived_at_ms      = util::ToUnixMillis(util::Now());

    ArchiveResponse resp;
    *resp.mutable_record() = ctx_.reconciler->Register(row);
    return resp;
  });
}

// ---------------------------------------------------------------------------
// Retrieval
// ---------------------------------------------------------------------------

ArchiveRecord ArchiveService::LookupRecord(const std::string& file_id) {
  if (auto cached = ctx_.metadata->Get(file_id)) {
    return *cached;
  }

  auto tx  = ctx_.repository->Begin();
  auto row = ctx_.repository->GetArchive(*tx, file_id);
  tx->Commit();
  if (!row) {
    throw util::NotFound("archive not found: " + file_id);
  }

  auto record = db::model::ToProto(*row);
  ctx_.metadata->Put(record);
  return record;
}

GetArchiveResponse ArchiveService::GetArchive(const GetArchiveRequest& req) {
  return ObserveRpc("ArchiveService.GetArchive", req.file_id(), [&] {
    GetArchiveResponse resp;
    *resp.mutable_record() = LookupRecord(req.file_id());
    return resp;
  });
}

void ArchiveService::ReadArchive(const ReadArchiveRequest& req, const ChunkSink& sink) {
  ObserveRpc("ArchiveService.ReadArchive", req.file_id(), [&] {
    const auto record = LookupRecord(req.file_id());
    if (record.status() != ARCHIVE_STATUS_ARCHIVED) {
      throw util::InvalidState("archive " + req.file_id() + " is not readable in status " + ArchiveStatus_Name(record.status()));
    }

    const uint64_t window = req.window_bytes() == 0 ? transfer::kStreamFrameBytes
                                                    : std::min<uint64_t>(req.window_bytes(), transfer::kStreamFrameBytes);
    uint64_t offset = 0;
    while (offset < record.size_bytes()) {
      auto chunk = ctx_.store->ReadRange(record.storage_key(), offset, window);
      if (!chunk || chunk->size() == 0) {
        throw util::StorageError("archive " + req.file_id() + " is shorter than its catalog size");
      }
      offset += static_cast<uint64_t>(chunk->size());
      sink(chunk);
    }
  });
}

} // namespace vault::service
