#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/artifact_generator.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/unlock_service.hpp"
#include "internal/service/unlock_worker.hpp"
#include "internal/sweep/sweep_scheduler.hpp"

#if CREDITGATE_WITH_GRPC
#include <grpcpp/grpcpp.h>
#endif

namespace creditgate::factory {

/*
  Application

  Owns all long-lived components used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                 context;
  std::shared_ptr<service::UnlockService> unlock_service;

  // Background loops. Null when disabled in config.
  std::shared_ptr<sweep::SweepScheduler> sweep_scheduler;
  std::shared_ptr<service::UnlockWorker> worker;

#if CREDITGATE_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif

  void StartBackground();
  void StopBackground();
};

/*
  Composition root. The only place that knows concrete DB types.

  The worker is built only when worker.enabled is set and a generator
  is supplied.
*/
std::shared_ptr<db::Repository> BuildRepository(const creditgate::runtime::config::RuntimeConfig& config);

Application Build(const creditgate::runtime::config::RuntimeConfig& config, std::shared_ptr<service::ArtifactGenerator> generator = nullptr);

} // namespace creditgate::factory
