#include "executor.h"

#include <mutex>
#include <atomic>
#include <thread>
#include <condition_variable>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include <runbox/utils.h>
#include "output_collector.h"

namespace {

using Clock = std::chrono::steady_clock;

#define ENUM_STEP_STATUS_ \
  X(FINISHED) \
  X(TIMED_OUT) \
  X(FAILED)
enum class StepStatus {
#define X(name) name,
  ENUM_STEP_STATUS_
#undef X
};

const char* StepStatusName(StepStatus status) {
  switch (status) {
#define X(name) case StepStatus::name: return #name;
    ENUM_STEP_STATUS_
#undef X
  }
  __builtin_unreachable();
}

// the scrub only walks the workspace; it never runs user code
constexpr auto kScrubTimeout = std::chrono::seconds(10);
constexpr size_t kScrubMaxOutput = 4096;

// the exit code may not be published the instant the stream closes
constexpr int kInspectRetries = 10;
constexpr auto kInspectInterval = std::chrono::milliseconds(50);

int ReadExitCode(ContainerEngine& engine, const std::string& exec_id) {
  for (int i = 0; i < kInspectRetries; i++) {
    ExecState state;
    if (EngineReply reply = engine.InspectExec(exec_id, state); !reply) {
      spdlog::warn("Failed inspecting exec {}: {}", exec_id, reply.message);
      return -1;
    }
    if (!state.running) return state.exit_code;
    std::this_thread::sleep_for(kInspectInterval);
  }
  spdlog::warn("Exec {} still reported running after its stream closed", exec_id);
  return -1;
}

// Run one command and race it against the deadline.
// The stream is read on a worker thread; this thread waits for whichever of
//   "stream finished" and "deadline reached" comes first.
void ScrubWorkspace(ContainerEngine& engine, ContainerHandle& handle);

StepStatus RunStep(
    ContainerEngine& engine, ContainerHandle& handle, const std::vector<std::string>& command,
    Clock::time_point deadline, OutputCollector& collector, int& exit_code,
    bool scrub_on_timeout = true) {
  exit_code = -1;
  std::string exec_id;
  if (EngineReply reply = engine.CreateExec(handle.Id(), command, kContainerWorkdir, exec_id); !reply) {
    spdlog::warn("Failed creating exec {} in {}: {}", fmt::format("{}", command), handle.Id(), reply.message);
    return StepStatus::FAILED;
  }
  spdlog::debug("Exec {} in container {}: {}", exec_id, handle.Id(), fmt::format("{}", command));

  std::mutex mtx;
  std::condition_variable cv;
  bool done = false;
  std::atomic_bool cancelled = false;
  EngineReply stream_reply;
  std::thread reader([&]() {
    EngineReply reply = engine.StartExec(exec_id, [&](const char* data, size_t len) {
      if (cancelled) return false;
      collector.Feed(data, len);
      return true;
    });
    {
      std::lock_guard lck(mtx);
      stream_reply = std::move(reply);
      done = true;
    }
    cv.notify_one();
  });

  bool finished;
  {
    std::unique_lock lck(mtx);
    finished = cv.wait_until(lck, deadline, [&]() { return done; });
  }
  if (!finished) {
    spdlog::info("Exec {} exceeded the deadline, killing container {}", exec_id, handle.Id());
    cancelled = true;
    // the scrub also kills the program, which ends the stream
    if (scrub_on_timeout) ScrubWorkspace(engine, handle);
    // removing the container ends the stream; aborting covers an unresponsive engine
    handle.Release();
    engine.AbortExec(exec_id);
    reader.join();
    return StepStatus::TIMED_OUT;
  }
  reader.join();
  if (!stream_reply && collector.Received() == 0) {
    spdlog::warn("Failed starting exec {}: {}", exec_id, stream_reply.message);
    return StepStatus::FAILED;
  }
  if (!stream_reply) {
    spdlog::warn("Exec {} stream broken after {} bytes: {}", exec_id, collector.Received(),
                 stream_reply.message);
  }
  exit_code = ReadExitCode(engine, exec_id);
  return StepStatus::FINISHED;
}

void ScrubWorkspace(ContainerEngine& engine, ContainerHandle& handle) {
  if (handle.Released()) return;
  OutputCollector collector(kScrubMaxOutput);
  int exit_code = -1;
  StepStatus status = RunStep(engine, handle, ScrubCommand(), Clock::now() + kScrubTimeout,
                              collector, exit_code, false);
  if (status != StepStatus::FINISHED || exit_code != 0) {
    spdlog::warn("CleanupWarning: scrubbing workspace {} in {} ended with {} exit={}: {}",
                 handle.WorkspaceDir().c_str(), handle.Id(), StepStatusName(status), exit_code,
                 collector.Stderr());
  }
}

} // namespace

const std::vector<std::string>& ScrubCommand() {
  static const std::vector<std::string> command = {
    "sh", "-c", fmt::format("kill -9 -1 2>/dev/null; chmod -R a+rwX {}", kContainerWorkdir)};
  return command;
}

ExecutionOutcome RunInContainer(
    ContainerEngine& engine, ContainerHandle& handle, const LanguageProfile& profile,
    std::chrono::milliseconds timeout, size_t max_output) {
  ExecutionOutcome outcome;
  OutputCollector collector(max_output);
  const auto start = Clock::now();
  const auto deadline = start + timeout;

  int exit_code = -1;
  StepStatus status = StepStatus::FINISHED;
  if (profile.IsTwoPhase()) {
    status = RunStep(engine, handle, profile.compile_command, deadline, collector, exit_code);
    spdlog::debug("Compile step of {} in {}: {} exit={}", profile.key, handle.Id(),
                  StepStatusName(status), exit_code);
    // a failed compilation is the result
    if (status == StepStatus::FINISHED && exit_code != 0) {
      spdlog::info("Compilation failed in {} with exit code {}", handle.Id(), exit_code);
    }
  }
  if (status == StepStatus::FINISHED && (!profile.IsTwoPhase() || exit_code == 0)) {
    status = RunStep(engine, handle, profile.run_command, deadline, collector, exit_code);
    spdlog::debug("Run step of {} in {}: {} exit={}", profile.key, handle.Id(),
                  StepStatusName(status), exit_code);
  }

  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
  ScrubWorkspace(engine, handle);
  outcome.stdout_text = collector.Stdout();
  outcome.stderr_text = collector.Stderr();
  outcome.truncated = collector.Truncated();
  switch (status) {
    case StepStatus::FINISHED:
      outcome.completion_kind = CompletionKind::COMPLETED;
      outcome.exit_code = exit_code;
      break;
    case StepStatus::TIMED_OUT:
      outcome.completion_kind = CompletionKind::TIMED_OUT;
      break;
    case StepStatus::FAILED:
      outcome.completion_kind = CompletionKind::FAILED_TO_START;
      break;
  }
  spdlog::info("Execution in {} {} after {} ms, exit={} truncated={}", handle.Id(),
               CompletionKindName(outcome.completion_kind), outcome.elapsed.count(),
               outcome.exit_code, outcome.truncated);
  return outcome;
}
