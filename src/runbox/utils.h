#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

std::string ToLower(std::string);
// split on whitespace; used for commands written in configuration files
std::vector<std::string> SplitCommand(const std::string&);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

#endif  // RUNBOX_UTILS_H_
