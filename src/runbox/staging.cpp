#include "staging.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

// the container user is not necessarily the host user
constexpr fs::perms kWorkspacePerm = fs::perms::all;

std::optional<fs::path> MakeUniqueDir(const fs::path& root) {
  std::string tmpl = (root / "exec_XXXXXX").string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating workspace under {}: {}", root.c_str(), strerror(errno));
    return std::nullopt;
  }
  return fs::path(tmpl);
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) {
    spdlog::warn("Failed opening {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  fout.write(content.data(), content.size());
  fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

} // namespace

Workspace::~Workspace() {
  if (dir_.empty()) return;
  if (!RemoveAll(dir_)) {
    spdlog::warn("CleanupWarning: workspace {} was not removed", dir_.c_str());
  }
}

std::optional<Workspace> Stage(
    const std::string& code, const LanguageProfile& profile, const fs::path& sandbox_root) {
  if (!CreateDirs(sandbox_root)) return std::nullopt;
  auto dir = MakeUniqueDir(sandbox_root);
  if (!dir) return std::nullopt;
  // from here on the directory is owned and removed on failure
  Workspace workspace(*dir, *dir / profile.filename);
  std::error_code ec;
  fs::permissions(workspace.Dir(), kWorkspacePerm, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", workspace.Dir().c_str(), ec.message());
    return std::nullopt;
  }
  if (!WriteFile(workspace.Source(), code)) return std::nullopt;
  fs::permissions(workspace.Source(), kPerm666, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", workspace.Source().c_str(), ec.message());
    return std::nullopt;
  }
  spdlog::debug("Staged {} bytes of {} code at {}", code.size(), profile.key,
                workspace.Source().c_str());
  return std::optional<Workspace>(std::move(workspace));
}
