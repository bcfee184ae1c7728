#pragma once

#include <string>

#include "config/config.pb.h"

namespace market::config {

// Identity that owns the admin and fee destination singletons until replaced.
inline constexpr const char* kDefaultBootstrapPrincipal = "ST1PQHQKV0RJXZFY1DGX8MNSNYVE3VGZJSRTPGZGM";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Missing sections
  fall back to an in-memory store and the default bootstrap identity.
*/
class ConfigLoader {
 public:
  static market::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when no file is given.
  static market::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(market::runtime::config::RuntimeConfig& config);
};

} // namespace market::config
