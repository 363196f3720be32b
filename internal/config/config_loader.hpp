#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace vault::config {

namespace defaults {

inline constexpr const char* kBindAddress               = "0.0.0.0:50061";
inline constexpr uint64_t    kSmallObjectThresholdBytes = 25ull * 1024 * 1024;
inline constexpr uint64_t    kChunkSizeBytes            = 5ull * 1024 * 1024;
inline constexpr int64_t     kCapabilityTtlSeconds      = 900;
inline constexpr int64_t     kSessionMaxAgeSeconds      = 86400;
inline constexpr int64_t     kReaperIntervalSeconds     = 300;
inline constexpr const char* kCapabilityBaseUrl         = "vault://uploads";
inline constexpr uint32_t    kCatalogRetryAttempts      = 5;
inline constexpr int32_t     kCatalogRetryBackoffNanos  = 100'000'000;

inline constexpr const char* kClientEndpoint        = "localhost:50061";
inline constexpr uint32_t    kParallelism           = 4;
inline constexpr uint32_t    kMaxSessionRestarts    = 1;
inline constexpr uint32_t    kPartRetryAttempts     = 3;
inline constexpr int32_t     kPartRetryInitialNanos = 200'000'000;
inline constexpr int64_t     kPartRetryMaxSeconds   = 5;
inline constexpr double      kPartRetryMultiplier   = 2.0;

} // namespace defaults

/*
  Loads RuntimeConfig / ClientConfig from YAML files.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset fields are filled with the documented defaults and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static vault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static vault::runtime::config::ClientConfig  LoadClientFromYaml(const std::string& path);

  static void ApplyDefaults(vault::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(vault::runtime::config::ClientConfig& config);

  // throws util::InvalidArgument
  static void Validate(const vault::runtime::config::RuntimeConfig& config);
  static void Validate(const vault::runtime::config::ClientConfig& config);
};

} // namespace vault::config
