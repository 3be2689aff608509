#include "container.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include <runbox/sandbox.h>

namespace {

// long enough for any execution; the container is removed right after it anyway
const std::vector<std::string> kKeepAliveCommand = {"sleep", "3600"};

inline bool IsMissingImage(const EngineReply& reply) {
  return reply.status == 404;
}

inline std::string DescribeReply(const EngineReply& reply) {
  if (reply.status == 0) return reply.message;
  return fmt::format("HTTP {}: {}", reply.status, reply.message);
}

} // namespace

void ContainerHandle::Release() {
  if (released_) return;
  released_ = true;
  spdlog::debug("Remove container {}", id_);
  EngineReply reply = engine_->RemoveContainer(id_, true);
  // 404: already gone; 409: removal already in progress
  if (reply || reply.status == 404 || reply.status == 409) return;
  spdlog::warn("CleanupWarning: failed removing container {}: {}", id_, DescribeReply(reply));
}

ContainerSpec MakeContainerSpec(
    const Workspace& workspace, const LanguageProfile& profile, int64_t memory_limit) {
  ContainerSpec spec;
  spec.image = profile.image;
  spec.command = kKeepAliveCommand;
  spec.workdir = kContainerWorkdir;
  spec.bind_source = fs::absolute(workspace.Dir()).string();
  spec.bind_target = kContainerWorkdir;
  spec.labels = {{kSandboxLabel, "1"}, {std::string(kSandboxLabel) + ".language", profile.key}};
  spec.memory_limit = memory_limit;
  spec.network_disabled = true;
  return spec;
}

std::optional<ContainerHandle> Acquire(
    ContainerEngine& engine, const Workspace& workspace, const LanguageProfile& profile,
    int64_t memory_limit, bool pull_missing_image,
    ExecutionError& error, std::string& error_message) {
  ContainerSpec spec = MakeContainerSpec(workspace, profile, memory_limit);
  spdlog::debug("Create container image={} bind={}:{} memory={} command={}",
                spec.image, spec.bind_source, spec.bind_target, spec.memory_limit,
                fmt::format("{}", spec.command));
  std::string id;
  EngineReply reply = engine.CreateContainer(spec, id);
  if (!reply && pull_missing_image && IsMissingImage(reply)) {
    spdlog::info("Image {} not present, pulling", spec.image);
    if (EngineReply pull = engine.PullImage(spec.image); pull) {
      reply = engine.CreateContainer(spec, id);
    } else {
      spdlog::warn("Failed pulling {}: {}", spec.image, DescribeReply(pull));
    }
  }
  if (!reply) {
    error = ExecutionError::CONTAINER_CREATE_ERROR;
    error_message = "Failed creating container from " + spec.image + ": " + DescribeReply(reply);
    spdlog::warn("{}", error_message);
    // the engine may hand out an id even if the request failed halfway
    if (!id.empty()) ContainerHandle(engine, id, workspace.Dir(), spec.image).Release();
    return std::nullopt;
  }
  ContainerHandle handle(engine, id, workspace.Dir(), spec.image);
  spdlog::debug("Start container {}", id);
  reply = engine.StartContainer(id);
  if (!reply) {
    error = ExecutionError::CONTAINER_START_ERROR;
    error_message = "Failed starting container " + id + ": " + DescribeReply(reply);
    spdlog::warn("{}", error_message);
    handle.Release();
    return std::nullopt;
  }
  spdlog::info("Container {} running {} for workspace {}", id, spec.image, workspace.Dir().c_str());
  return std::optional<ContainerHandle>(std::move(handle));
}
