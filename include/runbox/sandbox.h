#ifndef INCLUDE_RUNBOX_SANDBOX_H_
#define INCLUDE_RUNBOX_SANDBOX_H_

#include <chrono>
#include <memory>
#include <vector>
#include <cstdint>
#include <filesystem>

#include "engine.h"
#include "execution.h"
#include "languages.h"

// label put on every sandbox container; used to find orphans
extern const char kSandboxLabel[];

class SandboxConfig {
 public:
  std::filesystem::path sandbox_root; // workspaces are created under it
  std::chrono::milliseconds timeout;
  int64_t memory_limit; // bytes
  size_t max_output; // bytes, per stream
  bool pull_missing_images; // pull and retry once if the image is not present

  SandboxConfig();
};

class Sandbox {
  std::shared_ptr<ContainerEngine> engine_;
  SandboxConfig config_;
  LanguageRegistry registry_;
 public:
  Sandbox(std::shared_ptr<ContainerEngine> engine,
          SandboxConfig config = SandboxConfig(),
          LanguageRegistry registry = LanguageRegistry::Default());

  // Blocks until the program completes, times out or fails to start.
  // Safe to call from multiple threads; requests share nothing but the engine.
  // No container or workspace of this request exists anymore once it returns.
  ExecutionResult Execute(const ExecutionRequest&) const;

  bool IsAvailable() const;
  std::vector<ContainerInfo> ListSandboxContainers() const;
  // force-remove every labeled container, e.g. left behind by a crashed process;
  //   returns the number removed
  size_t ReapOrphans() const;
  // pull the image of every registered language; returns the number pulled
  size_t PullImages() const;

  const SandboxConfig& Config() const { return config_; }
  const LanguageRegistry& Registry() const { return registry_; }
  ContainerEngine& Engine() const { return *engine_; }
};

#endif  // INCLUDE_RUNBOX_SANDBOX_H_
