#ifndef INCLUDE_RUNBOX_EXECUTION_H_
#define INCLUDE_RUNBOX_EXECUTION_H_

#include <chrono>
#include <string>
#include <optional>
#include <cstdint>

#define ENUM_COMPLETION_KIND_ \
  X(COMPLETED, "completed") \
  X(TIMED_OUT, "timed-out") \
  X(FAILED_TO_START, "failed-to-start")
enum class CompletionKind {
#define X(name, str) name,
  ENUM_COMPLETION_KIND_
#undef X
};

// setup-phase failures; anything after the container is running is reported
// through ExecutionOutcome instead
#define ENUM_EXECUTION_ERROR_ \
  X(NONE, "None") \
  X(UNSUPPORTED_LANGUAGE, "UnsupportedLanguage") \
  X(STAGING_IO_ERROR, "StagingIOError") \
  X(CONTAINER_CREATE_ERROR, "ContainerCreateError") \
  X(CONTAINER_START_ERROR, "ContainerStartError")
enum class ExecutionError {
#define X(name, str) name,
  ENUM_EXECUTION_ERROR_
#undef X
};

class ExecutionRequest {
 public:
  std::string code;
  std::string language;
  // fall back to the sandbox configuration if unset or non-positive
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<int64_t> memory_limit; // bytes
};

class ExecutionOutcome {
 public:
  std::string stdout_text, stderr_text;
  CompletionKind completion_kind;
  std::chrono::milliseconds elapsed;
  bool truncated; // either stream hit the output cap
  int exit_code; // of the last process run; -1 if unknown (timeout, failed to start)

  ExecutionOutcome() :
      completion_kind(CompletionKind::FAILED_TO_START),
      elapsed(0),
      truncated(false),
      exit_code(-1) {}
};

class ExecutionResult {
 public:
  ExecutionError error;
  std::string error_message;
  // only meaningful if error == NONE
  ExecutionOutcome outcome;

  ExecutionResult() : error(ExecutionError::NONE) {}
  bool Ok() const { return error == ExecutionError::NONE; }
};

#endif  // INCLUDE_RUNBOX_EXECUTION_H_
