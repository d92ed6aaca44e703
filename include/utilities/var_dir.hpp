#pragma once

#include <string>

namespace chunkvault {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string defaultStorageRoot();

// Layout below a storage root.
std::string chunksDir(const std::string &storageRoot);
std::string metadataDbPath(const std::string &storageRoot);

} // namespace chunkvault
