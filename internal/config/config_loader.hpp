#pragma once

#include <string>

#include "config/config.pb.h"

namespace subnet::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys and
  out-of-range network parameters are rejected.
*/
class ConfigLoader {
 public:
  static subnet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws util::InvalidArgument on values the ledger cannot represent.
  static void Validate(const subnet::runtime::config::RuntimeConfig& config);
};

} // namespace subnet::config
