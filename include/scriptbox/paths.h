#ifndef INCLUDE_SCRIPTBOX_PATHS_H_
#define INCLUDE_SCRIPTBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// every workspace is created directly under this directory
extern fs::path kWorkspaceRoot;

#endif  // INCLUDE_SCRIPTBOX_PATHS_H_
