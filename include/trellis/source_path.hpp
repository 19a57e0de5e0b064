#pragma once

#include <string>
#include <vector>

namespace trellis {

// Paths handed over by discovery are compared as strings after
// normalization: forward slashes, no duplicate or trailing slash, no "./"
// segments. The empty string is the collection root and an ancestor of
// every path.
std::string normalize_path(const std::string& path);

// Directory part of a normalized path ("" for a top-level entry).
std::string parent_dir(const std::string& path);

// dir, its parent, ..., "" (nearest first)
std::vector<std::string> ancestor_dirs(const std::string& dir);

// File name up to its first '.', e.g. "conftest" for "a/conftest.cpp".
std::string file_stem(const std::string& path);

} // namespace trellis
