#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "api/scanhub/v1.hpp"
#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/reconcile/reconciliation_worker.hpp"
#include "internal/session/session_registry.hpp"

namespace {

using scanhub::api::ClientMessage;
using scanhub::api::ServerEvent;
using scanhub::db::model::SyncStatus;

using Stream = ::grpc::ClientReaderWriter<ClientMessage, ServerEvent>;

scanhub::runtime::config::RuntimeConfig MakeConfig() {
  scanhub::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("127.0.0.1:0");
  config.mutable_database()->mutable_memory();

  auto* alice = config.mutable_identity()->add_users();
  alice->set_login("alice");
  alice->set_id(7);
  alice->set_display_name("Alice");

  config.mutable_legacy_sink()->set_min_latency_ms(0);
  config.mutable_legacy_sink()->set_max_latency_ms(0);
  config.mutable_legacy_sink()->set_failure_probability(0.0);
  return config;
}

ClientMessage Register(const std::string& login, scanhub::api::ConnectionRole role) {
  ClientMessage message;
  message.mutable_register_()->set_login(login);
  message.mutable_register_()->set_role(role);
  return message;
}

ServerEvent ReadEvent(Stream& stream) {
  ServerEvent event;
  const bool  ok = stream.Read(&event);
  assert(ok);
  return event;
}

void Finish(Stream& stream) {
  stream.WritesDone();
  ServerEvent drain;
  while (stream.Read(&drain)) {
  }
  const auto status = stream.Finish();
  assert(status.ok());
}

SyncStatus WaitForTerminalStatus(scanhub::db::Repository& repository, int64_t record_id) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    auto tx     = repository.Begin();
    auto record = repository.GetPairing(*tx, record_id);
    tx->Commit();
    if (record && record->sync_status != SyncStatus::kPending) {
      return record->sync_status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return SyncStatus::kPending;
}

void TestRejectedFirstMessage(scanhub::api::SessionService::Stub& stub) {
  ::grpc::ClientContext context;
  auto                  stream = stub.Connect(&context);

  ClientMessage ping;
  ping.mutable_ping();
  assert(stream->Write(ping));
  stream->WritesDone();

  ServerEvent event;
  assert(!stream->Read(&event));
  const auto status = stream->Finish();
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestScannerToDashboardFlow(scanhub::api::SessionService::Stub& stub, scanhub::factory::Application& app) {
  ::grpc::ClientContext dashboard_context;
  auto                  dashboard = stub.Connect(&dashboard_context);
  assert(dashboard->Write(Register("alice", scanhub::api::CONNECTION_ROLE_READER)));

  auto registered = ReadEvent(*dashboard);
  assert(registered.kind_case() == ServerEvent::kRegistered);
  assert(registered.registered().login() == "alice");
  assert(registered.registered().output_count() == 1);
  assert(!registered.registered().has_current_platform());

  ::grpc::ClientContext scanner_context;
  auto                  scanner = stub.Connect(&scanner_context);
  assert(scanner->Write(Register("alice", scanhub::api::CONNECTION_ROLE_WRITER)));
  assert(ReadEvent(*scanner).kind_case() == ServerEvent::kRegistered);
  assert(ReadEvent(*dashboard).kind_case() == ServerEvent::kProducerConnected);

  ClientMessage pairing;
  pairing.mutable_new_pairing()->set_platform(5);
  pairing.mutable_new_pairing()->set_product(42);
  assert(scanner->Write(pairing));

  auto platform_changed = ReadEvent(*dashboard);
  assert(platform_changed.kind_case() == ServerEvent::kPlatformChanged);
  assert(platform_changed.platform_changed().platform() == 5);

  auto new_pairing = ReadEvent(*dashboard);
  assert(new_pairing.kind_case() == ServerEvent::kNewPairing);
  assert(new_pairing.new_pairing().platform() == 5);
  assert(new_pairing.new_pairing().product() == 42);
  assert(!new_pairing.new_pairing().overwrite());

  assert(WaitForTerminalStatus(*app.repository, new_pairing.new_pairing().record_id()) == SyncStatus::kSuccess);

  Finish(*scanner);
  assert(ReadEvent(*dashboard).kind_case() == ServerEvent::kProducerDisconnected);

  Finish(*dashboard);
}

} // namespace

int main() {
  auto app = scanhub::factory::Build(MakeConfig());

  ::grpc::ServerBuilder builder;
  for (auto& service : app.grpc_services) {
    builder.RegisterService(service.get());
  }
  auto server = builder.BuildAndStart();
  assert(server);

  auto channel = server->InProcessChannel(::grpc::ChannelArguments{});
  auto stub    = scanhub::api::SessionService::NewStub(channel);

  TestRejectedFirstMessage(*stub);
  TestScannerToDashboardFlow(*stub, app);

  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  server->Wait();
  for (auto& worker : app.background_workers) {
    worker->Stop();
  }

  // every stream handler returned, so the registry is empty again
  assert(app.registry->Size() == 0);

  std::cout << "scanhub_integration_session_stream: pass\n";
  return 0;
}
