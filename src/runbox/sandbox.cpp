#include <runbox/sandbox.h>

#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include "utils.h"
#include "staging.h"
#include "executor.h"
#include "container.h"

const char kSandboxLabel[] = "runbox.sandbox";

namespace {

constexpr int64_t kDefaultMemoryLimit = 512L * 1024 * 1024;
constexpr auto kDefaultTimeout = std::chrono::milliseconds(300'000);
constexpr size_t kDefaultMaxOutput = 1024 * 1024;

} // namespace

SandboxConfig::SandboxConfig() :
    sandbox_root(DefaultSandboxRoot()),
    timeout(kDefaultTimeout),
    memory_limit(kDefaultMemoryLimit),
    max_output(kDefaultMaxOutput),
    pull_missing_images(true) {}

Sandbox::Sandbox(std::shared_ptr<ContainerEngine> engine, SandboxConfig config, LanguageRegistry registry) :
    engine_(std::move(engine)),
    config_(std::move(config)),
    registry_(std::move(registry)) {}

ExecutionResult Sandbox::Execute(const ExecutionRequest& req) const {
  ExecutionResult result;
  const LanguageProfile* profile = registry_.Resolve(req.language);
  if (!profile) {
    result.error = ExecutionError::UNSUPPORTED_LANGUAGE;
    result.error_message = "Unsupported language: " + req.language;
    spdlog::warn("{}", result.error_message);
    return result;
  }
  auto timeout = config_.timeout;
  if (req.timeout && req.timeout->count() > 0) timeout = *req.timeout;
  int64_t memory_limit = config_.memory_limit;
  if (req.memory_limit && *req.memory_limit > 0) memory_limit = *req.memory_limit;
  spdlog::info("Execute {} bytes of {}, timeout={}ms memory={}",
               req.code.size(), profile->key, timeout.count(), memory_limit);

  // declaration order matters: the container goes before the workspace it is bound to
  std::optional<Workspace> workspace = Stage(req.code, *profile, config_.sandbox_root);
  if (!workspace) {
    result.error = ExecutionError::STAGING_IO_ERROR;
    result.error_message = "Failed staging code under " + config_.sandbox_root.string();
    return result;
  }
  std::optional<ContainerHandle> handle = Acquire(
      *engine_, *workspace, *profile, memory_limit, config_.pull_missing_images,
      result.error, result.error_message);
  if (!handle) return result;
  result.outcome = RunInContainer(*engine_, *handle, *profile, timeout, config_.max_output);
  return result;
}

bool Sandbox::IsAvailable() const {
  EngineReply reply = engine_->Ping();
  if (!reply) spdlog::info("Container engine unavailable: {}", reply.message);
  return (bool)reply;
}

std::vector<ContainerInfo> Sandbox::ListSandboxContainers() const {
  std::vector<ContainerInfo> ret;
  if (EngineReply reply = engine_->ListContainers(kSandboxLabel, ret); !reply) {
    spdlog::error("Failed to list containers: {}", reply.message);
    return {};
  }
  return ret;
}

size_t Sandbox::ReapOrphans() const {
  size_t removed = 0;
  for (auto& container : ListSandboxContainers()) {
    EngineReply reply = engine_->RemoveContainer(container.id, true);
    if (reply || reply.status == 404) {
      spdlog::info("Removed sandbox container {} ({})", container.id, container.state);
      removed++;
    } else {
      spdlog::warn("CleanupWarning: failed removing container {}: {}", container.id, reply.message);
    }
  }
  return removed;
}

size_t Sandbox::PullImages() const {
  size_t pulled = 0;
  for (auto& image : registry_.Images()) {
    if (EngineReply reply = engine_->PullImage(image); reply) {
      spdlog::info("Successfully pulled {}", image);
      pulled++;
    } else {
      spdlog::warn("Failed to pull {}: {}", image, reply.message);
    }
  }
  return pulled;
}
