#ifndef RUNBOX_STAGING_H_
#define RUNBOX_STAGING_H_

#include <string>
#include <optional>
#include <filesystem>

#include <runbox/languages.h>

namespace fs = std::filesystem;

// Ephemeral host directory holding exactly one execution's source file.
// Owns the directory: it is deleted when the Workspace is destroyed.
class Workspace {
  fs::path dir_;
  fs::path source_;
 public:
  Workspace(fs::path dir, fs::path source) :
      dir_(std::move(dir)), source_(std::move(source)) {}
  Workspace(Workspace&& x) noexcept :
      dir_(std::move(x.dir_)), source_(std::move(x.source_)) {
    x.dir_.clear();
  }
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  Workspace& operator=(Workspace&&) = delete;
  ~Workspace();

  const fs::path& Dir() const { return dir_; }
  const fs::path& Source() const { return source_; }
};

// Create a unique directory under sandbox_root and write code to the profile's
//   file name inside it. nullopt on any filesystem failure; nothing is left behind.
std::optional<Workspace> Stage(
    const std::string& code, const LanguageProfile&, const fs::path& sandbox_root);

#endif  // RUNBOX_STAGING_H_
