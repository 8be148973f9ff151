#pragma once

#include <string>

#include "config/config.pb.h"

namespace planner::config {

/*
  Reads the planner RuntimeConfig from YAML.

  The document root must be a mapping. Each YAML node becomes a
  google::protobuf::Value, the tree is printed as JSON and parsed into the
  message, so the schema in config.proto is the only source of field names.
  Unknown keys are rejected. An empty document yields an all-defaults config.

  Errors are util::ConfigError and name the source (file path or "<inline>").
*/
class ConfigLoader {
 public:
  static planner::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static planner::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace planner::config
