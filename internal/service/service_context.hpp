#pragma once

#include <memory>

namespace sensorweave::registry { class CapabilityRegistry; }
namespace sensorweave::pattern { class PatternLibrary; }
namespace sensorweave::db { class Repository; }

namespace sensorweave::service {

class CallerAuthenticator;

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sensorweave::registry::CapabilityRegistry> registry;
  std::shared_ptr<sensorweave::pattern::PatternLibrary> patterns;
  std::shared_ptr<sensorweave::db::Repository> repository;
  std::shared_ptr<CallerAuthenticator> callers;
};

}
