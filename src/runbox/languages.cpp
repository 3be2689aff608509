#include <runbox/languages.h>

#include <set>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr char kCsharpBuild[] =
    "echo '<Project Sdk=\"Microsoft.NET.Sdk\"><PropertyGroup>"
    "<OutputType>Exe</OutputType><TargetFramework>net8.0</TargetFramework>"
    "<ImplicitUsings>enable</ImplicitUsings></PropertyGroup></Project>' > app.csproj"
    " && dotnet build -nologo -o out > build.log 2>&1"
    " || { cat build.log >&2; exit 1; }";

// adding a language = adding a row
const LanguageProfile kBuiltinProfiles[] = {
  // key, image, filename, compile command, run command
  {"python", "python:3.11-slim", "main.py", {}, {"python", "main.py"}},
  {"java", "openjdk:11-jdk-slim", "Main.java", {"javac", "Main.java"}, {"java", "Main"}},
  {"javascript", "node:18-alpine", "main.js", {}, {"node", "main.js"}},
  // type stripping is built into node 22; the container cannot reach a registry for tsc
  {"typescript", "node:22-alpine", "main.ts", {},
   {"node", "--experimental-strip-types", "--no-warnings", "main.ts"}},
  {"go", "golang:1.21-alpine", "main.go", {}, {"go", "run", "main.go"}},
  {"rust", "rust:1.75-slim", "main.rs", {"rustc", "main.rs", "-o", "main"}, {"./main"}},
  {"c", "gcc:latest", "main.c", {"gcc", "-o", "main", "main.c"}, {"./main"}},
  {"cpp", "gcc:latest", "main.cpp", {"g++", "-o", "main", "main.cpp"}, {"./main"}},
  // dotnet needs a project file; restoring it works offline with the SDK's own packs
  {"csharp", "mcr.microsoft.com/dotnet/sdk:8.0", "Program.cs",
   {"sh", "-c", kCsharpBuild}, {"dotnet", "out/app.dll"}},
  {"php", "php:8.2-cli", "main.php", {}, {"php", "main.php"}},
  {"ruby", "ruby:3.2-slim", "main.rb", {}, {"ruby", "main.rb"}},
};

} // namespace

LanguageRegistry LanguageRegistry::Default() {
  LanguageRegistry ret;
  for (auto& profile : kBuiltinProfiles) ret.Register(profile);
  return ret;
}

bool LanguageRegistry::Register(LanguageProfile profile) {
  profile.key = ToLower(profile.key);
  if (profile.key.empty() || profile.image.empty() || profile.filename.empty() ||
      profile.run_command.empty()) {
    spdlog::warn("Incomplete language profile '{}' ignored", profile.key);
    return false;
  }
  // the file is written directly under the workspace
  if (fs::path(profile.filename).has_parent_path()) {
    spdlog::warn("Language '{}': file name {} must not contain a directory",
                 profile.key, profile.filename);
    return false;
  }
  spdlog::debug("Register language {} image={}", profile.key, profile.image);
  std::string key = profile.key;
  profiles_[key] = std::move(profile);
  return true;
}

const LanguageProfile* LanguageRegistry::Resolve(const std::string& key) const {
  auto it = profiles_.find(ToLower(key));
  if (it == profiles_.end()) return nullptr;
  return &it->second;
}

std::vector<std::string> LanguageRegistry::Keys() const {
  std::vector<std::string> ret;
  for (auto& i : profiles_) ret.push_back(i.first);
  return ret;
}

std::vector<std::string> LanguageRegistry::Images() const {
  std::set<std::string> images;
  for (auto& i : profiles_) images.insert(i.second.image);
  return std::vector<std::string>(images.begin(), images.end());
}
