#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace sensorweave::db { class Repository; }
namespace sensorweave::registry { class CapabilityRegistry; }
namespace sensorweave::pattern { class PatternLibrary; }
namespace sensorweave::runtime { class MaintenanceWorker; }

namespace sensorweave::factory {

/*
  Application

  Owns all long-lived objects used by the node. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<registry::CapabilityRegistry>   registry;
  std::shared_ptr<pattern::PatternLibrary>        patterns;

  std::vector<std::unique_ptr<::grpc::Service>>        grpc_services;
  std::vector<std::shared_ptr<runtime::MaintenanceWorker>> background_workers;
};

/*
  Build

  Constructs the node from runtime config and hydrates the registry and
  pattern replicas from the repository. Background workers are started.

  This is the composition root: the only place that knows concrete
  repository types.
*/
Application Build(const sensorweave::runtime::config::RuntimeConfig& config);

} // namespace sensorweave::factory
