#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace routine::config {

using routine::runtime::config::RuntimeConfig;

namespace {

// Replaces ${NAME} with the environment value, empty when unset.
std::string ExpandEnvironment(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = text.find("${", pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    const auto close = text.find('}', open + 2);
    if (close == std::string::npos) {
      throw std::runtime_error("Unterminated ${ in config value: " + text);
    }

    out.append(text, pos, open - pos);
    const auto  name  = text.substr(open + 2, close - open - 2);
    const char* value = std::getenv(name.c_str());
    if (value) out += value;
    pos = close + 1;
  }
  return out;
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar: {
      const auto scalar = ExpandEnvironment(node.Scalar());

      // quoted scalars carry the "!" tag and always stay strings, so a
      // token like "0123" is not read as a number
      if (node.Tag() != "!") {
        if (scalar == "true" || scalar == "false") {
          value->set_bool_value(scalar == "true");
          return;
        }
        char*        end    = nullptr;
        const double number = std::strtod(scalar.c_str(), &end);
        if (!scalar.empty() && end && *end == '\0') {
          value->set_number_value(number);
          return;
        }
      }
      value->set_string_value(scalar);
      return;
    }

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToValue(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw std::runtime_error("Unsupported YAML node");
}

void Validate(const RuntimeConfig& config) {
  const double confidence = config.triggers().vision_default_min_confidence();
  if (confidence < 0.0 || confidence > 1.0) {
    throw std::runtime_error("Invalid configuration: triggers.vision_default_min_confidence must be within [0, 1]");
  }

  const int32_t importance = config.store().importance();
  if (importance < 0 || importance > 10) {
    throw std::runtime_error("Invalid configuration: store.importance must be within [0, 10]");
  }

  const double pattern_threshold = config.patterns().confidence_threshold();
  if (pattern_threshold < 0.0 || pattern_threshold > 1.0) {
    throw std::runtime_error("Invalid configuration: patterns.confidence_threshold must be within [0, 1]");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
}

RuntimeConfig Parse(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml.IsDefined() || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value root;
  ToValue(yaml, &root);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

} // namespace routine::config
