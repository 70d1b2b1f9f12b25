// Repository: Stagegate
// Component: JSONL file helpers
// Copyright (c) 2026 Stagegate

#include "stagegate/store/JsonlFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

#include "stagegate/store/StorageError.hpp"

namespace stagegate::store {

void EnsureDirectory(const std::string& dir) {
  if (dir.empty()) return;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = dir.find('/', pos + 1);
    const std::string prefix = dir.substr(0, pos);
    if (prefix.empty()) continue;
    if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
      throw StorageError("cannot create directory " + prefix + ": " + std::strerror(errno));
    }
  }
}

std::vector<std::string> ReadLines(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) return {};
    throw StorageError("cannot stat " + path + ": " + std::strerror(errno));
  }
  std::ifstream in(path);
  if (!in) throw StorageError("cannot open " + path);

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(std::move(line));
  }
  if (in.bad()) throw StorageError("read failed " + path);
  return lines;
}

void WriteLinesAtomically(const std::string& path, const std::vector<std::string>& lines) {
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) throw StorageError("cannot open " + tmp_path);
    for (const auto& line : lines) of << line << '\n';
    of.flush();
    of.close();
    if (!of) {
      (void)unlink(tmp_path.c_str());
      throw StorageError("write failed " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const int err = errno;
    (void)unlink(tmp_path.c_str());
    throw StorageError("rename failed " + tmp_path + " -> " + path + ": " + std::strerror(err));
  }
}

}  // namespace stagegate::store
