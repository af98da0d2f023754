#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace tams::config {

namespace {

constexpr const char* kDefaultBindAddress     = "0.0.0.0:50051";
constexpr uint32_t    kDefaultUploadExpiry    = 3600;
constexpr uint32_t    kDefaultBatchSize       = 100;
constexpr uint32_t    kDefaultDeletionWorkers = 2;
constexpr uint64_t    kDefaultLeaseTtlMs      = 60000;
constexpr uint64_t    kDefaultPollIntervalMs  = 500;
constexpr uint32_t    kDefaultMaxAttempts     = 5;
constexpr uint64_t    kDefaultInitialBackoff  = 100;
constexpr uint64_t    kDefaultMaxBackoff      = 5000;
constexpr uint64_t    kDefaultAttemptTimeout  = 30000;
constexpr uint32_t    kDefaultLanes           = 4;
constexpr uint64_t    kDefaultRetentionSecs   = 7 * 24 * 3600;
constexpr uint64_t    kDefaultScanIntervalMs  = 60000;
constexpr uint32_t    kDefaultPageLimit       = 50;
constexpr uint32_t    kDefaultMaxPageLimit    = 1000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      // "memory:" with no body selects the empty message
      value->mutable_struct_value();
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

tams::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  tams::runtime::config::RuntimeConfig config;

  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

tams::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  try {
    return FromYamlNode(yaml);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

tams::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(tams::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  if (config.database().backend_case() == tams::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }

  auto* store = config.mutable_object_store();
  if (store->upload_expiry_seconds() == 0) store->set_upload_expiry_seconds(kDefaultUploadExpiry);

  auto* deletion = config.mutable_deletion();
  if (deletion->batch_size() == 0) deletion->set_batch_size(kDefaultBatchSize);
  if (deletion->workers() == 0) deletion->set_workers(kDefaultDeletionWorkers);
  if (deletion->lease_ttl_ms() == 0) deletion->set_lease_ttl_ms(kDefaultLeaseTtlMs);

  auto* notifier = config.mutable_notifier();
  if (notifier->poll_interval_ms() == 0) notifier->set_poll_interval_ms(kDefaultPollIntervalMs);
  if (notifier->max_attempts() == 0) notifier->set_max_attempts(kDefaultMaxAttempts);
  if (notifier->initial_backoff_ms() == 0) notifier->set_initial_backoff_ms(kDefaultInitialBackoff);
  if (notifier->max_backoff_ms() == 0) notifier->set_max_backoff_ms(kDefaultMaxBackoff);
  if (notifier->attempt_timeout_ms() == 0) notifier->set_attempt_timeout_ms(kDefaultAttemptTimeout);
  if (notifier->lanes() == 0) notifier->set_lanes(kDefaultLanes);
  if (notifier->user_agent().empty()) notifier->set_user_agent("tams-server");

  auto* cleanup = config.mutable_cleanup();
  if (cleanup->orphaned_object_retention_seconds() == 0) cleanup->set_orphaned_object_retention_seconds(kDefaultRetentionSecs);
  if (cleanup->scan_interval_ms() == 0) cleanup->set_scan_interval_ms(kDefaultScanIntervalMs);

  auto* pagination = config.mutable_pagination();
  if (pagination->default_limit() == 0) pagination->set_default_limit(kDefaultPageLimit);
  if (pagination->max_limit() == 0) pagination->set_max_limit(kDefaultMaxPageLimit);

  auto* service = config.mutable_service();
  if (service->name().empty()) service->set_name("tams");
  if (service->description().empty()) service->set_description("Time-addressable media store catalog");
  if (service->version().empty()) service->set_version("1.0.0");
}

void ConfigLoader::Validate(const tams::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("database.sqlite.path must be set");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("database.postgres.connection_uri must be set");
  }
  if (config.deletion().batch_size() == 0) {
    throw std::runtime_error("deletion.batch_size must be positive");
  }
  if (config.notifier().lanes() == 0) {
    throw std::runtime_error("notifier.lanes must be positive");
  }
  if (config.notifier().max_attempts() == 0) {
    throw std::runtime_error("notifier.max_attempts must be positive");
  }
  if (config.notifier().initial_backoff_ms() > config.notifier().max_backoff_ms()) {
    throw std::runtime_error("notifier.initial_backoff_ms exceeds notifier.max_backoff_ms");
  }
  if (config.pagination().default_limit() > config.pagination().max_limit()) {
    throw std::runtime_error("pagination.default_limit exceeds pagination.max_limit");
  }
}

} // namespace tams::config
