#include "archive_server.hpp"

#include <arrow/buffer_builder.h>

#include "grpc_error.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace vault::grpc {

using namespace vault::archive::v1;

namespace {

// Body frames of a single-shot upload, as an ArchiveStream.
class ArchiveRequestStream final : public vault::packaging::ArchiveStream {
 public:
  explicit ArchiveRequestStream(::grpc::ServerReader<ArchiveRequest>* reader) : reader_(reader) {
  }

  std::shared_ptr<arrow::Buffer> NextWindow(uint64_t) override {
    ArchiveRequest msg;
    while (reader_->Read(&msg)) {
      if (msg.body_case() != ArchiveRequest::kData) {
        throw util::InvalidArgument("archive stream carries a second header");
      }
      if (msg.data().empty()) continue;
      position_ += msg.data().size();
      return arrow::Buffer::FromString(std::move(*msg.mutable_data()));
    }
    return arrow::Buffer::FromString(std::string());
  }

  uint64_t Position() const override {
    return position_;
  }

 private:
  ::grpc::ServerReader<ArchiveRequest>* reader_;
  uint64_t                              position_ = 0;
};

} // namespace

ArchiveServer::ArchiveServer(std::shared_ptr<vault::service::ArchiveService> svc) : service_(std::move(svc)) {
}

::grpc::Status ArchiveServer::StartUpload(::grpc::ServerContext*, const StartUploadRequest* req, StartUploadResponse* resp) {
  try {
    *resp = service_->StartUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::GetUploadPartUrl(::grpc::ServerContext*, const GetUploadPartUrlRequest* req,
                                               GetUploadPartUrlResponse* resp) {
  try {
    *resp = service_->GetUploadPartUrl(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::PutPart(::grpc::ServerContext*, ::grpc::ServerReader<PutPartRequest>* reader, PutPartResponse* resp) {
  try {
    PutPartRequest msg;
    if (!reader->Read(&msg) || msg.body_case() != PutPartRequest::kHeader) {
      throw util::InvalidArgument("part stream must start with a header");
    }
    const auto header = msg.header();

    arrow::BufferBuilder builder;
    storage::common::Unwrap(builder.Reserve(static_cast<int64_t>(header.length_bytes())));
    while (reader->Read(&msg)) {
      if (msg.body_case() != PutPartRequest::kData) {
        throw util::InvalidArgument("part stream carries a second header");
      }
      if (static_cast<uint64_t>(builder.length()) + msg.data().size() > header.length_bytes()) {
        throw util::InvalidArgument("part body exceeds the declared " + std::to_string(header.length_bytes()) + " bytes");
      }
      storage::common::Unwrap(builder.Append(msg.data().data(), static_cast<int64_t>(msg.data().size())));
    }
    if (static_cast<uint64_t>(builder.length()) != header.length_bytes()) {
      throw util::InvalidArgument("part body carried " + std::to_string(builder.length()) + " of " +
                                  std::to_string(header.length_bytes()) + " declared bytes");
    }

    std::shared_ptr<arrow::Buffer> data = storage::common::Unwrap(builder.Finish());
    *resp                               = service_->PutPart(header.url(), data);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::CompleteUpload(::grpc::ServerContext*, const CompleteUploadRequest* req, CompleteUploadResponse* resp) {
  try {
    *resp = service_->CompleteUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::AbortUpload(::grpc::ServerContext*, const AbortUploadRequest* req, google::protobuf::Empty*) {
  try {
    service_->AbortUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::Archive(::grpc::ServerContext*, ::grpc::ServerReader<ArchiveRequest>* reader, ArchiveResponse* resp) {
  try {
    ArchiveRequest msg;
    if (!reader->Read(&msg) || msg.body_case() != ArchiveRequest::kHeader) {
      throw util::InvalidArgument("archive stream must start with a header");
    }
    ArchiveRequestStream body(reader);
    *resp = service_->Archive(msg.header(), body);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::GetArchive(::grpc::ServerContext*, const GetArchiveRequest* req, GetArchiveResponse* resp) {
  try {
    *resp = service_->GetArchive(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArchiveServer::ReadArchive(::grpc::ServerContext* ctx, const ReadArchiveRequest* req,
                                          ::grpc::ServerWriter<ReadArchiveResponse>* writer) {
  try {
    service_->ReadArchive(*req, [&](const std::shared_ptr<arrow::Buffer>& chunk) {
      if (ctx->IsCancelled()) {
        throw util::InvalidState("download cancelled by client");
      }
      ReadArchiveResponse msg;
      msg.set_data(chunk->data(), static_cast<size_t>(chunk->size()));
      if (!writer->Write(msg)) {
        throw util::InvalidState("download stream closed by client");
      }
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vault::grpc
