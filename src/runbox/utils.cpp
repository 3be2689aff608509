#include "utils.h"

#include <cctype>
#include <cstring>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(CompletionKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CompletionKindName, CompletionKind, ENUM_COMPLETION_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(ExecutionError, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionErrorName, ExecutionError, ENUM_EXECUTION_ERROR_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

std::string FormatOutput(const ExecutionOutcome& outcome) {
  std::string ret;
  if (!outcome.stdout_text.empty()) ret += "STDOUT:\n" + outcome.stdout_text + "\n";
  if (!outcome.stderr_text.empty()) ret += "STDERR:\n" + outcome.stderr_text + "\n";
  return ret.empty() ? "No output" : ret;
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::vector<std::string> SplitCommand(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string token; sin >> token;) ret.push_back(std::move(token));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}
