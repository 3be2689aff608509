#include "config.h"

#include <fstream>
#include <sstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include "runbox/utils.h" // private helpers: ToLower, SplitCommand

RunboxConfig::RunboxConfig() :
    socket_path(kDefaultSocketPath),
    api_version("v1.41") {}

namespace {

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string item; std::getline(sin, item, ',');) {
    item = ToLower(item);
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (!item.empty()) ret.push_back(std::move(item));
  }
  return ret;
}

} // namespace

bool ParseConfig(std::istream& fin, RunboxConfig& conf) {
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  conf.socket_path = ini[""]["socket"] | conf.socket_path;
  conf.api_version = ini[""]["api_version"] | conf.api_version;
  std::string sandbox_root = ini[""]["sandbox_root"] | "";
  if (sandbox_root.size()) conf.sandbox.sandbox_root = sandbox_root;
  long timeout_ms = ini[""]["timeout_ms"] | (long)conf.sandbox.timeout.count();
  long memory_mb = ini[""]["memory_limit_mb"] | (long)(conf.sandbox.memory_limit / 1024 / 1024);
  long output_kib = ini[""]["max_output_kib"] | (long)(conf.sandbox.max_output / 1024);
  if (timeout_ms <= 0 || memory_mb <= 0 || output_kib <= 0) {
    spdlog::error("timeout_ms, memory_limit_mb and max_output_kib must be positive");
    return false;
  }
  conf.sandbox.timeout = std::chrono::milliseconds(timeout_ms);
  conf.sandbox.memory_limit = (int64_t)memory_mb * 1024 * 1024;
  conf.sandbox.max_output = (size_t)output_kib * 1024;
  conf.sandbox.pull_missing_images = ini[""]["pull_missing_images"] | conf.sandbox.pull_missing_images;

  std::string languages = ini[""]["languages"] | "";
  for (auto& key : SplitList(languages)) {
    const std::string section = "language." + key;
    LanguageProfile profile;
    profile.key = key;
    profile.image = ini[section]["image"] | "";
    profile.filename = ini[section]["file"] | "";
    profile.compile_command = SplitCommand(ini[section]["compile"] | "");
    profile.run_command = SplitCommand(ini[section]["run"] | "");
    if (profile.image.empty() || profile.filename.empty() || profile.run_command.empty()) {
      spdlog::error("Language section [language.{}] needs image, file and run", key);
      return false;
    }
    conf.languages.push_back(std::move(profile));
  }
  return true;
}

bool ParseConfigFile(const fs::path& path, RunboxConfig& conf) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Cannot open configuration file {}", path.string());
    return false;
  }
  return ParseConfig(fin, conf);
}

LanguageRegistry BuildRegistry(const RunboxConfig& conf) {
  LanguageRegistry registry = LanguageRegistry::Default();
  for (auto& profile : conf.languages) registry.Register(profile);
  return registry;
}
