#pragma once

#include <string>
#include <vector>

// POSIX-style path helpers for the remote side. Never touches the local
// filesystem, so std::filesystem (which follows host conventions) is not used.
namespace RemotePath {

// Absolute, normalized form: '\' → '/', duplicate separators collapsed,
// "." dropped, ".." pops (never above "/"), relative input anchored at "/".
std::string normalize(const std::string& path);

// normalize(base + "/" + name)
std::string join(const std::string& base, const std::string& name);

// Parent of a normalized path ("/" for "/" and top-level entries).
std::string parent(const std::string& path);

// Last segment of a normalized path ("" for "/").
std::string basename(const std::string& path);

// Path segments of a normalized path ("/a/b" → {"a", "b"}).
std::vector<std::string> segments(const std::string& path);

// Path of `path` relative to `root` (both normalized). "" if equal or outside.
std::string relative_to(const std::string& root, const std::string& path);

}
