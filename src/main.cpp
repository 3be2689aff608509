#include <memory>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/logger.h>
#include <runbox/paths.h>
#include <runbox/utils.h>
#include <runbox/sandbox.h>
#include <runbox/docker_engine.h>
#include "config.h"

namespace {

// exit codes of the tool itself, in the spirit of timeout(1) and docker run
constexpr int kExitSetupError = 2;
constexpr int kExitTimeout = 124;
constexpr int kExitFailedToStart = 125;

RunboxConfig config;

#define ENUM_ACTION_ \
  X(EXECUTE) \
  X(PING) \
  X(LIST) \
  X(REAP) \
  X(PULL) \
  X(LANGUAGES)
enum class Action {
#define X(name) name,
  ENUM_ACTION_
#undef X
};

struct Options {
  Action action = Action::EXECUTE;
  std::string language;
  std::string file; // empty = stdin
  bool combined = false;
};

Options ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfigPath))
    .help("Path of configuration file; ignored if it does not exist and was not given explicitly");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-l", "--language")
    .default_value(std::string(""))
    .help("Language of the source code");
  parser.add_argument("-f", "--file")
    .default_value(std::string(""))
    .help("Source file; read from stdin if omitted");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall-clock timeout in milliseconds");
  parser.add_argument("-m", "--memory")
    .scan<'d', long>()
    .help("Memory limit in MiB");
  parser.add_argument("-s", "--socket")
    .help("Path of the container engine socket");
  parser.add_argument("--combined")
    .default_value(false).implicit_value(true)
    .help("Print stdout and stderr as one labeled block");
  parser.add_argument("--ping")
    .default_value(false).implicit_value(true)
    .help("Check whether the container engine is reachable");
  parser.add_argument("--list")
    .default_value(false).implicit_value(true)
    .help("List sandbox containers");
  parser.add_argument("--reap")
    .default_value(false).implicit_value(true)
    .help("Remove all sandbox containers left behind");
  parser.add_argument("--pull")
    .default_value(false).implicit_value(true)
    .help("Pull the images of all languages");
  parser.add_argument("--languages")
    .default_value(false).implicit_value(true)
    .help("List supported languages");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitSetupError);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  std::error_code ec;
  if (parser.is_used("--config") || fs::exists(config_file, ec)) {
    if (!ParseConfigFile(config_file, config)) {
      spdlog::error("Failed to parse configuration file {}", config_file.string());
      exit(kExitSetupError);
    }
  }
  if (auto val = parser.present<long>("--timeout")) {
    config.sandbox.timeout = std::chrono::milliseconds(val.value());
  }
  if (auto val = parser.present<long>("--memory")) {
    config.sandbox.memory_limit = (int64_t)val.value() * 1024 * 1024;
  }
  if (auto val = parser.present("--socket")) {
    config.socket_path = val.value();
  }

  Options opt;
  opt.language = parser.get<std::string>("--language");
  opt.file = parser.get<std::string>("--file");
  opt.combined = parser.get<bool>("--combined");
  if (parser.get<bool>("--ping")) opt.action = Action::PING;
  else if (parser.get<bool>("--list")) opt.action = Action::LIST;
  else if (parser.get<bool>("--reap")) opt.action = Action::REAP;
  else if (parser.get<bool>("--pull")) opt.action = Action::PULL;
  else if (parser.get<bool>("--languages")) opt.action = Action::LANGUAGES;
  if (opt.action == Action::EXECUTE && opt.language.empty()) {
    std::cerr << "--language is required" << std::endl;
    std::cerr << parser;
    exit(kExitSetupError);
  }
  return opt;
}

bool ReadSource(const std::string& file, std::string& code) {
  std::stringstream buf;
  if (file.empty()) {
    buf << std::cin.rdbuf();
  } else {
    std::ifstream fin(file, std::ios::binary);
    if (!fin) {
      spdlog::error("Cannot open {}", file);
      return false;
    }
    buf << fin.rdbuf();
  }
  code = buf.str();
  return true;
}

int RunExecute(const Sandbox& sandbox, const Options& opt) {
  ExecutionRequest req;
  req.language = opt.language;
  if (!ReadSource(opt.file, req.code)) return kExitSetupError;
  ExecutionResult result = sandbox.Execute(req);
  if (!result.Ok()) {
    std::cerr << ExecutionErrorName(result.error) << ": " << result.error_message << std::endl;
    return kExitSetupError;
  }
  const ExecutionOutcome& outcome = result.outcome;
  if (opt.combined) {
    std::cout << FormatOutput(outcome);
  } else {
    std::cout << outcome.stdout_text << std::flush;
    std::cerr << outcome.stderr_text << std::flush;
  }
  spdlog::info("{} in {} ms, exit code {}{}", CompletionKindName(outcome.completion_kind),
               outcome.elapsed.count(), outcome.exit_code, outcome.truncated ? ", truncated" : "");
  switch (outcome.completion_kind) {
    case CompletionKind::COMPLETED: return outcome.exit_code < 0 ? 1 : outcome.exit_code;
    case CompletionKind::TIMED_OUT:
      std::cerr << "Execution timed out after " << outcome.elapsed.count() << " ms" << std::endl;
      return kExitTimeout;
    case CompletionKind::FAILED_TO_START: return kExitFailedToStart;
  }
  __builtin_unreachable();
}

} // namespace

int main(int argc, char** argv) {
  Options opt = ParseArgs(argc, argv);
  auto engine = std::make_shared<DockerEngine>(config.socket_path, config.api_version);
  engine->SetStreamTimeout(std::chrono::duration_cast<std::chrono::seconds>(config.sandbox.timeout) +
                           std::chrono::seconds(60));
  Sandbox sandbox(engine, config.sandbox, BuildRegistry(config));

  switch (opt.action) {
    case Action::LANGUAGES: {
      for (auto& key : sandbox.Registry().Keys()) {
        const LanguageProfile* profile = sandbox.Registry().Resolve(key);
        std::cout << key << '\t' << profile->image << '\t' << profile->filename << '\n';
      }
      return 0;
    }
    case Action::PING: {
      bool ok = sandbox.IsAvailable();
      std::cout << (ok ? "OK" : "unavailable") << std::endl;
      return ok ? 0 : 1;
    }
    default: break;
  }
  if (!sandbox.IsAvailable()) {
    spdlog::error("Container engine at {} is not reachable", config.socket_path);
    return kExitSetupError;
  }
  switch (opt.action) {
    case Action::LIST: {
      for (auto& container : sandbox.ListSandboxContainers()) {
        std::cout << container.id.substr(0, 12) << '\t' << container.image << '\t'
                  << container.state << '\n';
      }
      return 0;
    }
    case Action::REAP: {
      std::cout << sandbox.ReapOrphans() << " container(s) removed" << std::endl;
      return 0;
    }
    case Action::PULL: {
      size_t images = sandbox.Registry().Images().size();
      size_t pulled = sandbox.PullImages();
      std::cout << pulled << "/" << images << " image(s) pulled" << std::endl;
      return pulled == images ? 0 : 1;
    }
    case Action::EXECUTE: return RunExecute(sandbox, opt);
    default: break;
  }
  __builtin_unreachable();
}
