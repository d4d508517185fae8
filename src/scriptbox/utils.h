#ifndef SCRIPTBOX_UTILS_H_
#define SCRIPTBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <scriptbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// traversable by a sandbox uid, listable only by the owner
constexpr fs::perms kPerm711 = fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
constexpr fs::perms kPerm600 = fs::perms::owner_read | fs::perms::owner_write;

// close every descriptor >= minfd; used between fork and exec
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// fails if the file already exists
bool WriteNewFile(const fs::path&, const std::string& content, fs::perms = kPerm600);
bool ChownTree(const fs::path&, int uid, int gid);

#endif  // SCRIPTBOX_UTILS_H_
