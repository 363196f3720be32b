#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vault::config {

using vault::runtime::config::ClientConfig;
using vault::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

template <typename Message>
static Message ParseYamlFile(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  Message config;
  if (yaml.IsNull()) {
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

static void DefaultDuration(google::protobuf::Duration* d, int64_t seconds, int32_t nanos = 0) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    d->set_seconds(seconds);
    d->set_nanos(nanos);
  }
}

static bool IsZero(const google::protobuf::Duration& d) {
  return d.seconds() <= 0 && d.nanos() <= 0;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(defaults::kBindAddress);

  auto* uploads = config.mutable_uploads();
  if (uploads->small_object_threshold_bytes() == 0) uploads->set_small_object_threshold_bytes(defaults::kSmallObjectThresholdBytes);
  if (uploads->default_chunk_size_bytes() == 0) uploads->set_default_chunk_size_bytes(defaults::kChunkSizeBytes);
  DefaultDuration(uploads->mutable_capability_ttl(), defaults::kCapabilityTtlSeconds);
  DefaultDuration(uploads->mutable_session_max_age(), defaults::kSessionMaxAgeSeconds);
  DefaultDuration(uploads->mutable_reaper_interval(), defaults::kReaperIntervalSeconds);
  if (uploads->capability_base_url().empty()) uploads->set_capability_base_url(defaults::kCapabilityBaseUrl);

  auto* catalog_retry = uploads->mutable_catalog_retry();
  if (catalog_retry->max_attempts() == 0) catalog_retry->set_max_attempts(defaults::kCatalogRetryAttempts);
  DefaultDuration(catalog_retry->mutable_initial_backoff(), 0, defaults::kCatalogRetryBackoffNanos);
}

void ConfigLoader::ApplyDefaults(ClientConfig& config) {
  if (config.endpoint().empty()) config.set_endpoint(defaults::kClientEndpoint);

  auto* transfer = config.mutable_transfer();
  if (transfer->small_object_threshold_bytes() == 0) transfer->set_small_object_threshold_bytes(defaults::kSmallObjectThresholdBytes);
  if (transfer->chunk_size_bytes() == 0) transfer->set_chunk_size_bytes(defaults::kChunkSizeBytes);
  if (transfer->min_part_size_bytes() == 0) transfer->set_min_part_size_bytes(defaults::kChunkSizeBytes);
  if (transfer->parallelism() == 0) transfer->set_parallelism(defaults::kParallelism);
  if (!transfer->has_max_session_restarts()) transfer->set_max_session_restarts(defaults::kMaxSessionRestarts);

  auto* retry = transfer->mutable_part_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(defaults::kPartRetryAttempts);
  DefaultDuration(retry->mutable_initial_backoff(), 0, defaults::kPartRetryInitialNanos);
  DefaultDuration(retry->mutable_max_backoff(), defaults::kPartRetryMaxSeconds);
  if (retry->multiplier() == 0) retry->set_multiplier(defaults::kPartRetryMultiplier);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& uploads = config.uploads();
  if (uploads.small_object_threshold_bytes() == 0) {
    throw util::InvalidArgument("uploads.small_object_threshold_bytes must be at least 1");
  }
  if (uploads.default_chunk_size_bytes() == 0) {
    throw util::InvalidArgument("uploads.default_chunk_size_bytes must be at least 1");
  }
  if (IsZero(uploads.capability_ttl())) {
    throw util::InvalidArgument("uploads.capability_ttl must be positive");
  }
  if (IsZero(uploads.session_max_age())) {
    throw util::InvalidArgument("uploads.session_max_age must be positive");
  }
  if (IsZero(uploads.reaper_interval())) {
    throw util::InvalidArgument("uploads.reaper_interval must be positive");
  }
  if (uploads.catalog_retry().max_attempts() == 0) {
    throw util::InvalidArgument("uploads.catalog_retry.max_attempts must be at least 1");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path must be set");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri must be set");
  }
  if (config.storage().has_object() && config.storage().object().root_path().empty()) {
    throw util::InvalidArgument("storage.object.root_path must be set");
  }
}

void ConfigLoader::Validate(const ClientConfig& config) {
  const auto& transfer = config.transfer();
  if (transfer.small_object_threshold_bytes() == 0) {
    throw util::InvalidArgument("transfer.small_object_threshold_bytes must be at least 1");
  }
  if (transfer.chunk_size_bytes() < transfer.min_part_size_bytes()) {
    throw util::InvalidArgument("transfer.chunk_size_bytes must be >= transfer.min_part_size_bytes");
  }
  if (transfer.parallelism() == 0) {
    throw util::InvalidArgument("transfer.parallelism must be at least 1");
  }
  if (transfer.part_retry().max_attempts() == 0) {
    throw util::InvalidArgument("transfer.part_retry.max_attempts must be at least 1");
  }
  if (transfer.part_retry().multiplier() < 1.0) {
    throw util::InvalidArgument("transfer.part_retry.multiplier must be >= 1.0");
  }
}

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  auto config = ParseYamlFile<RuntimeConfig>(path);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

ClientConfig ConfigLoader::LoadClientFromYaml(const std::string& path) {
  auto config = ParseYamlFile<ClientConfig>(path);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace vault::config
