#pragma once

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vault::runtime {

class Server {
 public:
  Server(std::string bind_address, uint64_t max_message_bytes, std::vector<std::shared_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Shutdown();

 private:
  std::string                                  bind_address_;
  uint64_t                                     max_message_bytes_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
};

} // namespace vault::runtime
