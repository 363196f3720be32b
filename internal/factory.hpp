#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/metadata/metadata_cache.hpp"
#include "internal/service/archive_service.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/upload/completion_reconciler.hpp"
#include "internal/upload/session_manager.hpp"
#include "internal/upload/session_reaper.hpp"

namespace vault::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  storage::ObjectStorePtr                  store;
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<metadata::MetadataCache> metadata;

  std::shared_ptr<upload::SessionManager>       sessions;
  std::shared_ptr<upload::CompletionReconciler> reconciler;
  std::shared_ptr<upload::SessionReaper>        reaper;

  std::shared_ptr<service::ArchiveService>      archive_service;
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend from runtime config. The reaper is
  created but not started.

  This is the composition root of the application and the ONLY place
  that knows concrete DB and store types.
*/
Application Build(const vault::runtime::config::RuntimeConfig& config);

// Same graph over caller-supplied store and repository (tests, embedders).
Application Build(const vault::runtime::config::RuntimeConfig& config, storage::ObjectStorePtr store,
                  std::shared_ptr<db::Repository> repository);

} // namespace vault::factory
