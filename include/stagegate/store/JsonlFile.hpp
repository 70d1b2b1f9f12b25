// Repository: Stagegate
// Component: JSONL file helpers
// Purpose: Directory creation, line reads and atomic tmp+rename rewrites shared
//          by the flat-file backends.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STORE_JSONL_FILE_HPP_
#define STAGEGATE_STORE_JSONL_FILE_HPP_

#include <string>
#include <vector>

namespace stagegate::store {

// mkdir -p. Throws StorageError when a component cannot be created.
void EnsureDirectory(const std::string& dir);

// Non-empty lines of path. A missing file reads as no lines.
// Throws StorageError when the file exists but cannot be read.
std::vector<std::string> ReadLines(const std::string& path);

// Replaces path with lines ('\n'-terminated) via <path>.tmp.<pid> + rename, so a
// crash leaves either the old or the new file, never a torn one.
// Throws StorageError on any write or rename failure.
void WriteLinesAtomically(const std::string& path, const std::vector<std::string>& lines);

}  // namespace stagegate::store

#endif  // STAGEGATE_STORE_JSONL_FILE_HPP_
