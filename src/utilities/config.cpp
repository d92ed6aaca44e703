#include "utilities/config.hpp"
#include "store/store_error.hpp"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace chunkvault {

namespace {

[[noreturn]] void badValue(const std::string &key, const std::string &value,
                           const std::string &why) {
  throw StoreError(StoreError::Kind::Config,
                   "invalid value '" + value + "' for " + key + ": " + why);
}

unsigned long long parseUnsigned(const std::string &key,
                                 const std::string &value) {
  if (value.empty() || value.front() == '-') {
    badValue(key, value, "expected a non-negative integer");
  }
  try {
    size_t pos = 0;
    unsigned long long v = std::stoull(value, &pos);
    if (pos != value.size()) {
      badValue(key, value, "trailing characters");
    }
    return v;
  } catch (const std::invalid_argument &) {
    badValue(key, value, "expected a non-negative integer");
  } catch (const std::out_of_range &) {
    badValue(key, value, "out of range");
  }
}

int parseInt(const std::string &key, const std::string &value) {
  try {
    size_t pos = 0;
    int v = std::stoi(value, &pos);
    if (pos != value.size()) {
      badValue(key, value, "trailing characters");
    }
    return v;
  } catch (const std::invalid_argument &) {
    badValue(key, value, "expected an integer");
  } catch (const std::out_of_range &) {
    badValue(key, value, "out of range");
  }
}

bool parseBool(const std::string &key, const std::string &value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
    return true;
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
    return false;
  badValue(key, value, "expected a boolean");
}

LogLevel parseLevel(const std::string &key, const std::string &value) {
  try {
    return Logger::parseLevel(value);
  } catch (const std::invalid_argument &e) {
    badValue(key, value, e.what());
  }
}

void checkStoreOptions(const StoreOptions &s) {
  if (s.chunkSize == 0) {
    badValue("chunk_size", "0", "chunk size must be positive");
  }
  if (s.connectionPoolSize == 0) {
    badValue("connection_pool_size", "0", "pool needs at least one connection");
  }
  if (s.busyTimeoutMs < 0) {
    badValue("busy_timeout_ms", std::to_string(s.busyTimeoutMs),
             "must not be negative");
  }
}

void applyYaml(const YAML::Node &node, RuntimeOptions &opts) {
  if (node["storage_root"])
    opts.store.storageRoot = node["storage_root"].as<std::string>();
  if (node["chunk_size"])
    opts.store.chunkSize = node["chunk_size"].as<size_t>();
  if (node["enable_compression"])
    opts.store.compressionEnabled = node["enable_compression"].as<bool>();
  if (node["compression_level"])
    opts.store.compressionLevel = node["compression_level"].as<int>();
  if (node["busy_timeout_ms"])
    opts.store.busyTimeoutMs = node["busy_timeout_ms"].as<int>();
  if (node["connection_pool_size"])
    opts.store.connectionPoolSize = node["connection_pool_size"].as<size_t>();
  if (node["log_level"])
    opts.logLevel =
        parseLevel("log_level", node["log_level"].as<std::string>());
  if (node["log_file"])
    opts.logFile = node["log_file"].as<std::string>();
  if (node["log_max_file_size"])
    opts.logMaxFileSize = node["log_max_file_size"].as<long long>();
  if (node["log_max_backup_files"])
    opts.logMaxBackupFiles = node["log_max_backup_files"].as<int>();
}

} // namespace

RuntimeOptions loadRuntimeOptions(const std::string &path, bool required) {
  RuntimeOptions opts;
  opts.store.storageRoot = defaultStorageRoot();

  std::error_code ec;
  const bool present = std::filesystem::exists(path, ec);
  if (ec) {
    throw StoreError(StoreError::Kind::Config,
                     "cannot access " + path + ": " + ec.message());
  }
  if (present) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      applyYaml(node, opts);
    } catch (const YAML::Exception &e) {
      throw StoreError(StoreError::Kind::Config,
                       "failed to parse " + path + ": " + e.what());
    }
  } else if (required) {
    throw StoreError(StoreError::Kind::Config,
                     "configuration file not found: " + path);
  }

  applyEnvironmentOverrides(opts);
  checkStoreOptions(opts.store);
  return opts;
}

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("CHUNKVAULT_CONFIG");
  if (cfg && cfg[0] != '\0')
    return loadRuntimeOptions(cfg, true);
  return loadRuntimeOptions("chunkvault.yaml", false);
}

void applyEnvironmentOverrides(RuntimeOptions &opts) {
  if (const char *env = std::getenv("CHUNKVAULT_STORAGE_ROOT"))
    opts.store.storageRoot = env;
  if (const char *env = std::getenv("CHUNKVAULT_CHUNK_SIZE"))
    opts.store.chunkSize = parseUnsigned("CHUNKVAULT_CHUNK_SIZE", env);
  if (const char *env = std::getenv("CHUNKVAULT_ENABLE_COMPRESSION"))
    opts.store.compressionEnabled =
        parseBool("CHUNKVAULT_ENABLE_COMPRESSION", env);
  if (const char *env = std::getenv("CHUNKVAULT_COMPRESSION_LEVEL"))
    opts.store.compressionLevel = parseInt("CHUNKVAULT_COMPRESSION_LEVEL", env);
  if (const char *env = std::getenv("CHUNKVAULT_BUSY_TIMEOUT_MS"))
    opts.store.busyTimeoutMs = parseInt("CHUNKVAULT_BUSY_TIMEOUT_MS", env);
  if (const char *env = std::getenv("CHUNKVAULT_LOG_LEVEL"))
    opts.logLevel = parseLevel("CHUNKVAULT_LOG_LEVEL", env);
  if (const char *env = std::getenv("CHUNKVAULT_LOG_FILE"))
    opts.logFile = env;
}

} // namespace chunkvault
