#ifndef INCLUDE_RUNBOX_PATHS_H_
#define INCLUDE_RUNBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// mount point of the workspace inside every sandbox container
extern const char kContainerWorkdir[];
extern const char kDefaultSocketPath[];
extern const char kDefaultConfigPath[];

fs::path DefaultSandboxRoot();

#endif  // INCLUDE_RUNBOX_PATHS_H_
