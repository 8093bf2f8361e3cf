#pragma once

#include <chrono>
#include <string>

#include <google/protobuf/duration.pb.h>

#include "config/config.pb.h"

namespace casetrack::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Validate() enforces the cross-field rules protobuf cannot.
*/
class ConfigLoader {
 public:
  static casetrack::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static casetrack::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void Validate(const casetrack::runtime::config::RuntimeConfig& config);
};

// Unset (or zero) durations fall back to `fallback`.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback);

} // namespace casetrack::config
