#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>

#include "api/scanhub/v1.hpp"
#include "internal/service/session_service.hpp"
#include "internal/session/connection.hpp"

namespace scanhub::grpc {

using SessionStream = ::grpc::ServerReaderWriter<scanhub::api::ServerEvent, scanhub::api::ClientMessage>;

/*
  Connection over one Connect stream.

  Writes are serialized. Once Close() returns no further write reaches the
  stream, so the handler can return while other threads still hold the
  connection; their Send calls throw DeliveryFailed.
*/
class GrpcConnection final : public scanhub::session::Connection {
 public:
  GrpcConnection(std::string id, SessionStream* stream);

  const std::string& Id() const override;

  void Send(const scanhub::api::ServerEvent& event) override;

  void Close();

 private:
  std::string    id_;
  SessionStream* stream_;

  std::mutex write_mutex_;
  bool       closed_ = false;
};

class SessionServer final : public scanhub::api::SessionService::Service {
 public:
  explicit SessionServer(std::shared_ptr<scanhub::service::SessionService> svc);

  ::grpc::Status Connect(::grpc::ServerContext* context, SessionStream* stream) override;

 private:
  std::shared_ptr<scanhub::service::SessionService> service_;
  std::atomic<uint64_t>                             next_connection_id_{1};
};

} // namespace scanhub::grpc
