#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace scanhub::runtime {

/*
  Owns the gRPC listener for the registered services. Stop (also run by the
  destructor) cancels open streams after a short deadline so every Connect
  handler returns and unregisters its connection.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws when the address cannot be bound.
  void Start();
  void Stop();

 private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace scanhub::runtime
