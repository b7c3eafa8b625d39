#include "hexregion/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

namespace hexregion {

namespace {

static std::filesystem::path NumberedPath(const std::filesystem::path& base, int n)
{
  if (n <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(n);
  return p;
}

static std::string UtcTimestamp()
{
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch());
  const std::time_t secs = static_cast<std::time_t>(ms.count() / 1000);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count() % 1000));
  return buf;
}

// File side shared by the stdout and stderr buffers.
struct LogFileSink {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool timestamps = true;

  // Caller holds mutex.
  void writeLocked(const char* tag, const char* s, std::size_t n)
  {
    const char* end = s + n;
    while (s < end) {
      if (atLineStart && timestamps) {
        file << UtcTimestamp() << " [" << tag << "] ";
      }
      atLineStart = false;

      const char* nl = static_cast<const char*>(std::memchr(s, '\n', static_cast<std::size_t>(end - s)));
      const char* stop = nl ? nl + 1 : end;
      file.write(s, stop - s);
      s = stop;
      if (nl) {
        atLineStart = true;
        file.flush();
      }
    }
  }
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, LogFileSink* sink, const char* tag) : m_console(console), m_sink(sink), m_tag(tag) {}

protected:
  int overflow(int ch) override
  {
    if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
    const char c = traits_type::to_char_type(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const std::streamsize written = m_console->sputn(s, n);
    m_sink->writeLocked(m_tag, s, static_cast<std::size_t>(n));
    return written;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    m_sink->file.flush();
    return m_console->pubsync();
  }

private:
  std::streambuf* m_console = nullptr;
  LogFileSink* m_sink = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  LogFileSink sink;
  std::streambuf* origOut = nullptr;
  std::streambuf* origErr = nullptr;
  std::unique_ptr<TeeBuf> outBuf;
  std::unique_ptr<TeeBuf> errBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path from = NumberedPath(basePath, i - 1);
    if (!std::filesystem::exists(from, ec)) continue;

    const std::filesystem::path to = NumberedPath(basePath, i);
    std::filesystem::remove(to, ec);
    std::filesystem::rename(from, to, ec);
    if (ec) {
      outError = "failed to rotate log '" + from.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  stop();
  outError.clear();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->sink.timestamps = opt.timestampLines;
  impl->sink.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->sink.file) {
    outError = "unable to open log file: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origOut = std::cout.rdbuf();
    impl->outBuf = std::make_unique<TeeBuf>(impl->origOut, &impl->sink, "OUT");
    std::cout.rdbuf(impl->outBuf.get());
  }
  if (opt.teeStderr) {
    impl->origErr = std::cerr.rdbuf();
    impl->errBuf = std::make_unique<TeeBuf>(impl->origErr, &impl->sink, "ERR");
    std::cerr.rdbuf(impl->errBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  if (m_impl->outBuf && std::cout.rdbuf() == m_impl->outBuf.get()) std::cout.rdbuf(m_impl->origOut);
  if (m_impl->errBuf && std::cerr.rdbuf() == m_impl->errBuf.get()) std::cerr.rdbuf(m_impl->origErr);

  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace hexregion
