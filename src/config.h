#ifndef CONFIG_H_
#define CONFIG_H_

#include <string>
#include <vector>
#include <istream>
#include <filesystem>

#include <runbox/sandbox.h>
#include <runbox/languages.h>

namespace fs = std::filesystem;

class RunboxConfig {
 public:
  std::string socket_path;
  std::string api_version;
  SandboxConfig sandbox;
  // extra or overriding languages, from [language.<key>] sections
  std::vector<LanguageProfile> languages;

  RunboxConfig();
};

// Keys in the root section:
//   socket, api_version, sandbox_root, timeout_ms, memory_limit_mb, max_output_kib,
//   pull_missing_images, languages (comma-separated keys of [language.<key>] sections)
bool ParseConfig(std::istream&, RunboxConfig&);
bool ParseConfigFile(const fs::path&, RunboxConfig&);

LanguageRegistry BuildRegistry(const RunboxConfig&);

#endif  // CONFIG_H_
