#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace checkpoint::config {

using checkpoint::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t    kDefaultSnapshotFrequencySec  = 10;
constexpr uint32_t    kDefaultCompactionIntervalSec = 60;
constexpr uint32_t    kDefaultHeartbeatLimitMs      = 5000;
constexpr uint32_t    kDefaultHeartbeatCheckMs      = 500;
constexpr uint32_t    kDefaultRetryAttempts         = 5;
constexpr uint32_t    kDefaultRetryInitialMs        = 100;
constexpr uint32_t    kDefaultRetryMaxMs            = 2000;
constexpr uint32_t    kDefaultObjectPort            = 9000;
constexpr const char* kDefaultBucket                = "checkpoint-snapshots";
constexpr const char* kDefaultBindAddress           = "0.0.0.0:7100";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("007", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is an empty config.
  if (!yaml.IsDefined() || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') return nullptr;
  return value;
}

uint32_t ParseUnsigned(const char* name, const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" + text + "'");
  }
  auto parsed = std::stoull(text);
  if (parsed > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument(std::string(name) + " is out of range");
  }
  return static_cast<uint32_t>(parsed);
}

checkpoint::manager::core::v1::Strategy ParseStrategy(const std::string& text) {
  if (text == "COORDINATED" || text == "STRATEGY_COORDINATED") {
    return checkpoint::manager::core::v1::STRATEGY_COORDINATED;
  }
  if (text == "UNCOORDINATED" || text == "STRATEGY_UNCOORDINATED") {
    return checkpoint::manager::core::v1::STRATEGY_UNCOORDINATED;
  }
  throw std::invalid_argument("CHECKPOINTING_STRATEGY must be COORDINATED or UNCOORDINATED, got '" + text + "'");
}

bool IsHostPort(const std::string& address) {
  auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) return false;

  auto port = address.substr(colon + 1);
  if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) return false;

  auto value = std::stoul(port);
  return value >= 1 && value <= 65535;
}

bool UsesS3Endpoint(const pb::arrow::storage::ObjectStorageConfig& object) {
  switch (object.filesystem()) {
    case pb::arrow::storage::FILE_SYSTEM_S3:
      return true;
    case pb::arrow::storage::FILE_SYSTEM_LOCAL:
      return false;
    default:
      return object.uri().empty();
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::Load(const std::string& path) {
  auto config = LoadFromYaml(path);
  ApplyDefaults(config);
  ApplyEnvironment(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* checkpoint_cfg = config.mutable_checkpoint();
  if (checkpoint_cfg->snapshot_frequency_sec() == 0) checkpoint_cfg->set_snapshot_frequency_sec(kDefaultSnapshotFrequencySec);
  if (checkpoint_cfg->compaction_interval_sec() == 0) checkpoint_cfg->set_compaction_interval_sec(kDefaultCompactionIntervalSec);

  auto* heartbeat = config.mutable_heartbeat();
  if (heartbeat->limit_ms() == 0) heartbeat->set_limit_ms(kDefaultHeartbeatLimitMs);
  if (heartbeat->check_interval_ms() == 0) heartbeat->set_check_interval_ms(kDefaultHeartbeatCheckMs);

  auto* retry = config.mutable_write_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(kDefaultRetryAttempts);
  if (retry->initial_backoff_ms() == 0) retry->set_initial_backoff_ms(kDefaultRetryInitialMs);
  if (retry->max_backoff_ms() == 0) retry->set_max_backoff_ms(kDefaultRetryMaxMs);

  if (config.storage().has_object()) {
    auto* object = config.mutable_storage()->mutable_object();
    if (UsesS3Endpoint(*object)) {
      if (object->bucket().empty()) object->set_bucket(kDefaultBucket);
      if (object->port() == 0) object->set_port(kDefaultObjectPort);
    }
  }
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (const char* value = Env("CHECKPOINTING_STRATEGY")) {
    config.mutable_checkpoint()->set_strategy(ParseStrategy(value));
  }
  if (const char* value = Env("SNAPSHOT_FREQUENCY_SEC")) {
    config.mutable_checkpoint()->set_snapshot_frequency_sec(ParseUnsigned("SNAPSHOT_FREQUENCY_SEC", value));
  }
  if (const char* value = Env("COMPACTION_INTERVAL_SEC")) {
    config.mutable_checkpoint()->set_compaction_interval_sec(ParseUnsigned("COMPACTION_INTERVAL_SEC", value));
  }
  if (const char* value = Env("HEARTBEAT_LIMIT")) {
    config.mutable_heartbeat()->set_limit_ms(ParseUnsigned("HEARTBEAT_LIMIT", value));
  }
  if (const char* value = Env("HEARTBEAT_CHECK_INTERVAL")) {
    config.mutable_heartbeat()->set_check_interval_ms(ParseUnsigned("HEARTBEAT_CHECK_INTERVAL", value));
  }

  // Any MinIO variable selects the object backend.
  if (const char* value = Env("MINIO_HOST")) {
    config.mutable_storage()->mutable_object()->set_host(value);
  }
  if (const char* value = Env("MINIO_PORT")) {
    config.mutable_storage()->mutable_object()->set_port(ParseUnsigned("MINIO_PORT", value));
  }
  if (const char* value = Env("MINIO_ROOT_USER")) {
    config.mutable_storage()->mutable_object()->set_access_key(value);
  }
  if (const char* value = Env("MINIO_ROOT_PASSWORD")) {
    config.mutable_storage()->mutable_object()->set_secret_key(value);
  }
  if (const char* value = Env("SNAPSHOT_BUCKET_NAME")) {
    config.mutable_storage()->mutable_object()->set_bucket(value);
  }
  if (config.storage().has_object() && config.storage().object().bucket().empty() && UsesS3Endpoint(config.storage().object())) {
    config.mutable_storage()->mutable_object()->set_bucket(kDefaultBucket);
  }

  if (const char* value = Env("KAFKA_URL")) {
    config.mutable_event_log()->set_broker_address(value);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& checkpoint_cfg = config.checkpoint();
  if (checkpoint_cfg.strategy() != checkpoint::manager::core::v1::STRATEGY_COORDINATED &&
      checkpoint_cfg.strategy() != checkpoint::manager::core::v1::STRATEGY_UNCOORDINATED) {
    throw std::invalid_argument("checkpoint.strategy must be STRATEGY_COORDINATED or STRATEGY_UNCOORDINATED");
  }
  if (checkpoint_cfg.snapshot_frequency_sec() == 0) {
    throw std::invalid_argument("checkpoint.snapshot_frequency_sec must be positive");
  }
  if (checkpoint_cfg.compaction_interval_sec() == 0) {
    throw std::invalid_argument("checkpoint.compaction_interval_sec must be positive");
  }

  if (config.heartbeat().limit_ms() == 0) {
    throw std::invalid_argument("heartbeat.limit_ms must be positive");
  }
  if (config.heartbeat().check_interval_ms() == 0) {
    throw std::invalid_argument("heartbeat.check_interval_ms must be positive");
  }

  if (config.write_retry().max_attempts() < 1) {
    throw std::invalid_argument("write_retry.max_attempts must be at least 1");
  }
  if (config.write_retry().max_backoff_ms() < config.write_retry().initial_backoff_ms()) {
    throw std::invalid_argument("write_retry.max_backoff_ms must not be below initial_backoff_ms");
  }

  if (config.storage().has_object()) {
    const auto& object = config.storage().object();
    if (UsesS3Endpoint(object)) {
      if (object.host().empty()) {
        throw std::invalid_argument("storage.object.host is required");
      }
      if (object.bucket().empty()) {
        throw std::invalid_argument("storage.object.bucket is required");
      }
      if (object.port() < 1 || object.port() > 65535) {
        throw std::invalid_argument("storage.object.port must be in 1..65535");
      }
    } else if (object.uri().empty()) {
      throw std::invalid_argument("storage.object.uri is required for local filesystems");
    }
  }

  if (!config.event_log().broker_address().empty() && !IsHostPort(config.event_log().broker_address())) {
    throw std::invalid_argument("event_log.broker_address must be host:port");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path is required");
  }
}

} // namespace checkpoint::config
