#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace chunkvault {

static std::string varDir = [] {
  const char *env = std::getenv("CHUNKVAULT_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/chunkvault"))
    return std::string("/var/chunkvault");
  return std::string("var/chunkvault");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string defaultStorageRoot() { return getVarDir() + "/store"; }

std::string chunksDir(const std::string &storageRoot) {
  return (std::filesystem::path(storageRoot) / ".chunks").string();
}

std::string metadataDbPath(const std::string &storageRoot) {
  return (std::filesystem::path(storageRoot) / "metadata.db").string();
}

} // namespace chunkvault
