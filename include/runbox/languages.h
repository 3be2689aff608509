#ifndef INCLUDE_RUNBOX_LANGUAGES_H_
#define INCLUDE_RUNBOX_LANGUAGES_H_

#include <map>
#include <string>
#include <vector>

class LanguageProfile {
 public:
  std::string key; // lowercase language identifier
  std::string image;
  std::string filename; // canonical source file name inside the workspace
  // empty for single-phase (interpreted) languages
  std::vector<std::string> compile_command;
  std::vector<std::string> run_command;

  bool IsTwoPhase() const { return !compile_command.empty(); }
};

class LanguageRegistry {
  std::map<std::string, LanguageProfile> profiles_;
 public:
  // the builtin table
  static LanguageRegistry Default();

  // adds or replaces; returns false if the profile is incomplete
  bool Register(LanguageProfile profile);
  // case-insensitive; nullptr if the language is not registered
  const LanguageProfile* Resolve(const std::string& key) const;

  std::vector<std::string> Keys() const;
  // distinct images of all registered languages
  std::vector<std::string> Images() const;
  size_t Size() const { return profiles_.size(); }
};

#endif  // INCLUDE_RUNBOX_LANGUAGES_H_
