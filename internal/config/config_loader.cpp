#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace sensorweave::config {

using sensorweave::runtime::config::RuntimeConfig;

namespace {

std::string Where(const YAML::Node& node) {
  const auto mark = node.Mark();
  if (mark.is_null()) {
    return "";
  }
  return " at line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1);
}

// plain scalars may be bool, null or numeric; quoted ones never are
void ConvertScalar(const YAML::Node& node, google::protobuf::Value& out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    out.set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out.set_bool_value(text == "true");
    return;
  }
  if (text == "null" || text == "~") {
    out.set_null_value(google::protobuf::NULL_VALUE);
    return;
  }

  if (!text.empty()) {
    char* end = nullptr;
    errno     = 0;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0' && errno == 0) {
      out.set_number_value(number);
      return;
    }
  }
  out.set_string_value(text);
}

void Convert(const YAML::Node& node, google::protobuf::Value& out) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      out.set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = out.mutable_list_value();
      for (const auto& item : node) {
        Convert(item, *list->add_values());
      }
      return;
    }
    case YAML::NodeType::Map: {
      auto* fields = out.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: non-scalar key" + Where(entry.first));
        }
        Convert(entry.second, (*fields)[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw std::runtime_error("Invalid configuration: unsupported YAML node" + Where(node));
}

void Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
  }
  for (const auto& entry : config.identities()) {
    if (entry.identity().empty()) {
      throw std::runtime_error("Invalid configuration: identities entry without identity");
    }
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromNode(root, path);
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return FromNode(root, "<inline>");
}

RuntimeConfig ConfigLoader::FromNode(const YAML::Node& root, const std::string& origin) {
  RuntimeConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("Invalid configuration in " + origin + ": top level must be a mapping");
  }

  google::protobuf::Value document;
  Convert(root, document);

  std::string json;
  const auto  encoded = google::protobuf::util::MessageToJsonString(document, &json);
  if (!encoded.ok()) {
    throw std::runtime_error("Invalid configuration in " + origin + ": " + std::string(encoded.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto parsed             = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration in " + origin + ": " + std::string(parsed.message()));
  }

  Validate(config);
  return config;
}

} // namespace sensorweave::config
