#ifndef RUNBOX_CONTAINER_H_
#define RUNBOX_CONTAINER_H_

#include <chrono>
#include <string>
#include <optional>
#include <cstdint>

#include <runbox/engine.h>
#include <runbox/execution.h>
#include <runbox/languages.h>
#include "staging.h"

// Single-use container bound to one workspace.
// Exactly one create -> exactly one remove: the container is force-removed by
//   Release() or, at the latest, by the destructor.
class ContainerHandle {
  ContainerEngine* engine_;
  std::string id_;
  fs::path workspace_;
  std::string image_;
  std::chrono::system_clock::time_point created_at_;
  bool released_;
 public:
  ContainerHandle(ContainerEngine& engine, std::string id, fs::path workspace, std::string image) :
      engine_(&engine),
      id_(std::move(id)),
      workspace_(std::move(workspace)),
      image_(std::move(image)),
      created_at_(std::chrono::system_clock::now()),
      released_(false) {}
  ContainerHandle(ContainerHandle&& x) noexcept :
      engine_(x.engine_),
      id_(std::move(x.id_)),
      workspace_(std::move(x.workspace_)),
      image_(std::move(x.image_)),
      created_at_(x.created_at_),
      released_(x.released_) {
    x.released_ = true;
  }
  ContainerHandle(const ContainerHandle&) = delete;
  ContainerHandle& operator=(const ContainerHandle&) = delete;
  ContainerHandle& operator=(ContainerHandle&&) = delete;
  ~ContainerHandle() { Release(); }

  const std::string& Id() const { return id_; }
  const fs::path& WorkspaceDir() const { return workspace_; }
  const std::string& Image() const { return image_; }
  std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }
  bool Released() const { return released_; }

  // Idempotent. Kills the container if it is still running.
  // Failures are logged, never reported.
  void Release();
};

ContainerSpec MakeContainerSpec(
    const Workspace&, const LanguageProfile&, int64_t memory_limit);

// Create and start the container. On failure, error is set to
//   CONTAINER_CREATE_ERROR or CONTAINER_START_ERROR and no container is left behind.
std::optional<ContainerHandle> Acquire(
    ContainerEngine&, const Workspace&, const LanguageProfile&, int64_t memory_limit,
    bool pull_missing_image, ExecutionError& error, std::string& error_message);

#endif  // RUNBOX_CONTAINER_H_
