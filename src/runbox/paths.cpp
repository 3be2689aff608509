#include <runbox/paths.h>

const char kContainerWorkdir[] = "/app";
const char kDefaultSocketPath[] = "/var/run/docker.sock";
const char kDefaultConfigPath[] = RUNBOX_CONFIG_PATH;

fs::path DefaultSandboxRoot() {
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  return tmp / "runbox" / "sandbox";
}
