#ifndef CHUNKVAULT_CONFIG_HPP
#define CHUNKVAULT_CONFIG_HPP

#include "store/store_options.hpp"
#include "utilities/logger.h"
#include <string>

namespace chunkvault {

/**
 * @brief Process configuration for ChunkVault tools.
 *
 * Values come from a YAML file first and are then overridden by
 * `CHUNKVAULT_*` environment variables.
 */
struct RuntimeOptions {
  StoreOptions store;
  LogLevel logLevel = LogLevel::INFO;
  std::string logFile; ///< Empty selects `<var dir>/logs/chunkvault.log`
  long long logMaxFileSize = 10 * 1024 * 1024;
  int logMaxBackupFiles = 5;
};

/**
 * @brief Load options from `$CHUNKVAULT_CONFIG` (default `chunkvault.yaml`)
 * and apply environment overrides. A missing file yields the defaults.
 * @throws StoreError (Kind::Config) if the file or a value is malformed.
 */
RuntimeOptions loadRuntimeOptions();

/**
 * @brief Load options from an explicit YAML file.
 * @param path File to read.
 * @param required When true a missing file is an error instead of defaults.
 */
RuntimeOptions loadRuntimeOptions(const std::string &path, bool required);

/// Apply `CHUNKVAULT_*` environment overrides on top of @p opts.
void applyEnvironmentOverrides(RuntimeOptions &opts);

} // namespace chunkvault

#endif // CHUNKVAULT_CONFIG_HPP
