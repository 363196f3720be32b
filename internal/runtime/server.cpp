#include "server.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vault::runtime {

Server::Server(std::string bind_address, uint64_t max_message_bytes, std::vector<std::shared_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), max_message_bytes_(max_message_bytes), services_(std::move(services)) {
}

Server::~Server() {
  Shutdown();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());
  if (max_message_bytes_ > 0) {
    const auto limit = static_cast<int>(std::min<uint64_t>(max_message_bytes_, std::numeric_limits<int>::max()));
    builder.SetMaxReceiveMessageSize(limit);
    builder.SetMaxSendMessageSize(limit);
  }

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  VAULT_LOG_INFO("archive-vault listening", {observability::StringField("bind_address", bind_address_)});
}

void Server::Shutdown() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace vault::runtime
