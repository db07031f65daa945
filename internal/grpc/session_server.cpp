#include "session_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace scanhub::grpc {

using observability::StringField;

GrpcConnection::GrpcConnection(std::string id, SessionStream* stream) : id_(std::move(id)), stream_(stream) {
}

const std::string& GrpcConnection::Id() const {
  return id_;
}

void GrpcConnection::Send(const scanhub::api::ServerEvent& event) {
  std::lock_guard lock(write_mutex_);
  if (closed_) {
    throw scanhub::util::DeliveryFailed("connection " + id_ + " is closed");
  }
  if (!stream_->Write(event)) {
    closed_ = true;
    throw scanhub::util::DeliveryFailed("connection " + id_ + " stream write failed");
  }
}

void GrpcConnection::Close() {
  std::lock_guard lock(write_mutex_);
  closed_ = true;
}

SessionServer::SessionServer(std::shared_ptr<scanhub::service::SessionService> svc) : service_(std::move(svc)) {
}

::grpc::Status SessionServer::Connect(::grpc::ServerContext* context, SessionStream* stream) {
  auto connection = std::make_shared<GrpcConnection>("conn-" + std::to_string(next_connection_id_++), stream);
  SCANHUB_LOG_DEBUG("stream opened", {StringField("connection", connection->Id()), StringField("peer", context->peer())});

  scanhub::api::ClientMessage first;
  if (!stream->Read(&first)) {
    connection->Close();
    return ::grpc::Status::OK;
  }

  scanhub::service::Session session;
  try {
    session = service_->Accept(connection, first);
  } catch (const std::exception& e) {
    connection->Close();
    return ToStatus(e);
  }

  ::grpc::Status status = ::grpc::Status::OK;
  try {
    scanhub::api::ClientMessage message;
    while (stream->Read(&message)) {
      service_->Dispatch(session, message);
    }
  } catch (const std::exception& e) {
    SCANHUB_LOG_ERROR("session aborted", {StringField("connection", connection->Id()), StringField("error", e.what())});
    status = ToStatus(e);
  }

  service_->Close(session);
  connection->Close();
  return status;
}

} // namespace scanhub::grpc
