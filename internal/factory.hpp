#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace scanhub::db { class Repository; }
namespace scanhub::session { class SessionRegistry; }
namespace scanhub::reconcile { class ReconciliationWorker; }

namespace scanhub::factory {

/*
  Application

  Everything the server binary needs to run. The gRPC services are handed
  to runtime::Server; the workers must be stopped after the server.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::vector<std::shared_ptr<scanhub::reconcile::ReconciliationWorker>> background_workers;

  std::shared_ptr<scanhub::session::SessionRegistry> registry;
  std::shared_ptr<scanhub::db::Repository>           repository;
};

/*
  Build

  Constructs the entire backend based on runtime config and starts the
  reconciliation workers.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and sink types.
*/
Application Build(const scanhub::runtime::config::RuntimeConfig& config);

std::shared_ptr<scanhub::db::Repository> BuildRepository(const scanhub::runtime::config::RuntimeConfig& config);

} // namespace scanhub::factory
