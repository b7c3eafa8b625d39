#include "hexregion/AtomicFile.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #include <windows.h>
#else
  #include <fcntl.h>
  #include <unistd.h>
#endif

namespace hexregion {

namespace {

#if defined(_WIN32)

static bool FlushWin32(const std::filesystem::path& p, DWORD extraFlags, std::string& outError)
{
  HANDLE h = CreateFileW(p.wstring().c_str(),
                         GENERIC_READ | GENERIC_WRITE,
                         FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                         nullptr,
                         OPEN_EXISTING,
                         FILE_ATTRIBUTE_NORMAL | extraFlags,
                         nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    std::ostringstream oss;
    oss << "Unable to open for sync: " << p.string() << " (error " << GetLastError() << ")";
    outError = oss.str();
    return false;
  }
  const BOOL ok = FlushFileBuffers(h);
  const DWORD e = ok ? 0 : GetLastError();
  CloseHandle(h);
  if (!ok) {
    std::ostringstream oss;
    oss << "FlushFileBuffers failed for " << p.string() << " (error " << e << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

#else

static bool FsyncPath(const std::filesystem::path& p, int flags, const char* what, std::string& outError)
{
  const int fd = ::open(p.c_str(), flags);
  if (fd < 0) {
    outError = std::string("Unable to open ") + what + " for sync: " + p.string() + ": " + std::strerror(errno);
    return false;
  }
  if (::fsync(fd) != 0) {
    outError = std::string("fsync failed for ") + what + ": " + p.string() + ": " + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

#endif

static bool ReplaceFile(const std::filesystem::path& src, const std::filesystem::path& dst, std::string& outError)
{
  std::error_code ec;
  std::filesystem::rename(src, dst, ec);
  if (!ec) return true;

  // Windows refuses to rename over an existing file.
  std::error_code ec2;
  std::filesystem::remove(dst, ec2);
  ec2.clear();
  std::filesystem::rename(src, dst, ec2);
  if (!ec2) return true;

  outError = "Failed to replace '" + dst.string() + "': " + ec2.message();
  std::filesystem::remove(src, ec2);
  return false;
}

} // namespace

bool SyncFile(const std::filesystem::path& path, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "SyncFile path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushWin32(path, 0, outError);
#else
  return FsyncPath(path, O_RDONLY, "file", outError);
#endif
}

bool SyncDirectory(const std::filesystem::path& dir, std::string& outError)
{
  outError.clear();
  if (dir.empty()) {
    outError = "SyncDirectory path is empty";
    return false;
  }
#if defined(_WIN32)
  return FlushWin32(dir, FILE_FLAG_BACKUP_SEMANTICS, outError);
#else
  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  flags |= O_DIRECTORY;
#endif
  return FsyncPath(dir, flags, "directory", outError);
#endif
}

bool WriteFileAtomic(const std::filesystem::path& path, const std::uint8_t* data, std::size_t size,
                     std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "Output path is empty";
    return false;
  }

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      outError = "Unable to open file for writing: " + tmp.string();
      return false;
    }
    if (size > 0) {
      f.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }
    f.flush();
    if (!f) {
      outError = "Write failed: " + tmp.string();
      f.close();
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }

  std::string syncErr;
  if (!SyncFile(tmp, syncErr)) {
    outError = syncErr;
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  }

  if (!ReplaceFile(tmp, path, outError)) return false;

  const std::filesystem::path parent = path.parent_path();
  // Directory sync is not supported everywhere; the data itself is already durable.
  (void)SyncDirectory(parent.empty() ? std::filesystem::path(".") : parent, syncErr);
  return true;
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outError.clear();
  outBytes.clear();

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Unable to open file: " + path.string();
    return false;
  }

  f.seekg(0, std::ios::end);
  const std::streamoff sizeOff = f.tellg();
  if (sizeOff < 0) {
    outError = "Unable to determine file size: " + path.string();
    return false;
  }
  f.seekg(0, std::ios::beg);

  outBytes.resize(static_cast<std::size_t>(sizeOff));
  if (!outBytes.empty()) {
    f.read(reinterpret_cast<char*>(outBytes.data()), static_cast<std::streamsize>(outBytes.size()));
    if (!f) {
      outError = "Read failed: " + path.string();
      outBytes.clear();
      return false;
    }
  }
  return true;
}

} // namespace hexregion
