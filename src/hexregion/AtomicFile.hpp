#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hexregion {

// Whole-file IO used by the region serializer.
//
// Writes follow the crash-safe pattern:
//   1) write <path>.tmp
//   2) fsync(tmp)
//   3) rename(tmp -> path)
//   4) fsync(parent directory), best effort
// so a reader never observes a half-written region file.

// Flush file contents to stable storage. Returns false if the OS call fails.
bool SyncFile(const std::filesystem::path& path, std::string& outError);

// Flush directory metadata (best effort; unsupported on some platforms/filesystems).
bool SyncDirectory(const std::filesystem::path& dir, std::string& outError);

bool WriteFileAtomic(const std::filesystem::path& path, const std::uint8_t* data, std::size_t size,
                     std::string& outError);

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& outBytes, std::string& outError);

} // namespace hexregion
