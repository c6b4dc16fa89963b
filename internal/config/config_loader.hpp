#pragma once

#include <string>

#include "config/config.pb.h"

namespace pricing::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Zero-valued
  fields are then filled from Defaults() and finally the
  CACHE_* / PRICING_* environment variables are applied on top.
*/
class ConfigLoader {
 public:
  // Parse + defaults + environment.
  static pricing::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static pricing::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(pricing::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironmentOverrides(pricing::runtime::config::RuntimeConfig& config);
};

} // namespace pricing::config
