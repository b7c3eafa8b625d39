#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace hexregion {

// Duplicates std::cout / std::cerr into a log file for the lifetime of the object.
//
// Diagnostics from Logf() go to std::cerr, so a tee on stderr captures them along
// with regular tool output. Console output is passed through untouched; file
// lines get a UTC timestamp and a stream tag:
//
//   2026-03-02T09:15:41.027Z [ERR] [hexregion:info] generated region 'Isle' ...

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups kept as <path>.1 .. <path>.N. 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool timestampLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Stops any active tee first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original console buffers and closes the file.
  void stop();

  bool active() const { return m_impl != nullptr; }

  // Shift <base> -> <base>.1 -> ... -> <base>.keepFiles, dropping the oldest.
  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace hexregion
