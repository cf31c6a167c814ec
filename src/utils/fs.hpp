#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace safexec::utils {

// Reads at most `max_bytes` of `path` starting at `offset`. Symlinks, FIFOs
// and anything else that is not a regular file are refused (nullopt), as is a
// missing file.
std::optional<std::string> ReadRegularFile(const std::filesystem::path& path,
                                           std::size_t offset = 0,
                                           std::size_t max_bytes = 1 << 20);

// Creates `path` exclusively with owner-only permissions and writes `content`.
// Never writes through an existing entry, symlink or not.
bool WriteNewFile(const std::filesystem::path& path, const std::string& content);

// Replaces `path` by writing a fresh `path`.tmp and renaming it over.
bool ReplaceFile(const std::filesystem::path& path, const std::string& content);

}  // namespace safexec::utils
