#pragma once

#include <string>

#include "config/config.pb.h"

namespace checkpoint::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Load() additionally fills defaults, applies the deployment environment
  variables and validates the result.
*/
class ConfigLoader {
 public:
  static checkpoint::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static checkpoint::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static checkpoint::runtime::config::RuntimeConfig Load(const std::string& path);

  static void ApplyDefaults(checkpoint::runtime::config::RuntimeConfig& config);

  /*
    Environment overrides:
      CHECKPOINTING_STRATEGY      COORDINATED | UNCOORDINATED
      SNAPSHOT_FREQUENCY_SEC      seconds
      COMPACTION_INTERVAL_SEC     seconds
      HEARTBEAT_LIMIT             milliseconds
      HEARTBEAT_CHECK_INTERVAL    milliseconds
      MINIO_HOST / MINIO_PORT / MINIO_ROOT_USER / MINIO_ROOT_PASSWORD
      SNAPSHOT_BUCKET_NAME
      KAFKA_URL                   host:port
  */
  static void ApplyEnvironment(checkpoint::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument naming the first offending field.
  static void Validate(const checkpoint::runtime::config::RuntimeConfig& config);
};

} // namespace checkpoint::config
