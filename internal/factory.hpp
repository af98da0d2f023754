#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/catalog_service.hpp"

namespace tams::deletion { class DeletionWorker; }
namespace tams::events { class EventNotifier; }
namespace tams::gc { class ObjectReaper; }

namespace tams::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<service::CatalogService> catalog_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<events::EventNotifier>    notifier;
  std::shared_ptr<deletion::DeletionWorker> deletion_worker;
  std::shared_ptr<gc::ObjectReaper>         object_reaper;

  // notifier -> deletion workers -> reaper
  void StartBackground();
  // reverse start order
  void StopBackground();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and store types.
*/
Application Build(const tams::runtime::config::RuntimeConfig& config);

// Opens the configured catalog backend and bootstraps its schema.
std::shared_ptr<db::Repository> BuildRepository(const tams::runtime::config::RuntimeConfig& config);

} // namespace tams::factory
