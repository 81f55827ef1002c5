#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include "config/config.pb.h"

namespace sensorweave::config {

/*
  Loads the node's RuntimeConfig from YAML.

  The document is mapped onto google.protobuf.Value and parsed with the
  protobuf JSON parser, so field names, enums and Duration strings
  ("60s") follow the proto3 JSON mapping. Unknown keys are rejected.
  Quoted scalars are always strings.

  Every failure is reported as std::runtime_error.
*/
class ConfigLoader {
 public:
  static sensorweave::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static sensorweave::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);

 private:
  static sensorweave::runtime::config::RuntimeConfig FromNode(const YAML::Node& root, const std::string& origin);
};

} // namespace sensorweave::config
