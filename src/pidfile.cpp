#include "pidfile.h"
#include "cutils.h"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utils_log/logger.hpp>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#else
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#endif

namespace {

#ifdef _WIN32
  class WindowsProcessProbe : public ProcessProbe {
  public:
    bool isAlive(uint32_t pid) const override {
      HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
      if (h) {
        DWORD exitCode = 0;
        BOOL ok = GetExitCodeProcess(h, &exitCode);
        CloseHandle(h);
        return !ok || exitCode == STILL_ACTIVE;
      }
      return GetLastError() == ERROR_ACCESS_DENIED;
    }
  };
#else
  class UnixProcessProbe : public ProcessProbe {
  public:
    bool isAlive(uint32_t pid) const override {
      if (pid == 0) return false;
      if (kill(static_cast<pid_t>(pid), 0) == 0) return true;
      // EPERM: the process exists but belongs to someone else.
      return errno == EPERM;
    }
  };
#endif

} // anonymous namespace

std::unique_ptr<ProcessProbe> ProcessProbe::system()
{
#ifdef _WIN32
  return std::make_unique<WindowsProcessProbe>();
#else
  return std::make_unique<UnixProcessProbe>();
#endif
}

//---------------------------------------------------------------------------

PidFile::PidFile(const std::string &path, std::shared_ptr<const ProcessProbe> probe)
  : path_(path)
  , probe_(probe ? std::move(probe) : std::shared_ptr<const ProcessProbe>(ProcessProbe::system()))
{
}

PidFile::~PidFile()
{
  release();
}

std::string PidFile::defaultPath()
{
  return (std::filesystem::path(utils::runtimeDir()) / "burrow.pid").string();
}

bool PidFile::createExclusive()
{
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  const std::string content = std::to_string(utils::currentProcessId());
#ifdef _WIN32
  int fd = _open(path_.c_str(), _O_CREAT | _O_EXCL | _O_WRONLY, 0644);
  if (fd < 0) {
    if (errno == EEXIST) return false;
    throw std::runtime_error("Cannot create pid file " + path_);
  }
  int written = _write(fd, content.data(), static_cast<unsigned>(content.size()));
  _close(fd);
#else
  int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
  if (fd < 0) {
    if (errno == EEXIST) return false;
    throw std::runtime_error("Cannot create pid file " + path_ + ": " + std::strerror(errno));
  }
  ssize_t written = ::write(fd, content.data(), content.size());
  ::close(fd);
#endif
  if (written != static_cast<decltype(written)>(content.size())) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    throw std::runtime_error("Cannot write pid file " + path_);
  }
  return true;
}

bool PidFile::acquire()
{
  if (owned_) return true;
  // One retry: the first failure may be a stale file that runningPid() clears.
  for (int attempt = 0; attempt < 2; ++attempt) {
    if (createExclusive()) {
      owned_ = true;
      LOG_MSG << "Acquired pid file" << path_;
      return true;
    }
    if (auto pid = runningPid()) {
      LOG_MSG << "Daemon already running with pid" << *pid;
      return false;
    }
  }
  return false;
}

void PidFile::release()
{
  if (!owned_) return;
  owned_ = false;
  // Only remove the file if it still names us.
  auto pid = readPid();
  if (pid && *pid == static_cast<uint32_t>(utils::currentProcessId())) {
    remove();
  }
}

void PidFile::write()
{
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream file(path_, std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write pid file " + path_);
  }
  file << utils::currentProcessId();
}

void PidFile::remove()
{
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    LOG_MSG << "Failed to remove pid file" << path_ << ":" << ec.message();
  }
}

std::optional<uint32_t> PidFile::readPid() const
{
  std::ifstream file(path_);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::string content;
  std::getline(file, content);
  content = utils::trimmed(content);
  if (content.empty()) {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    unsigned long v = std::stoul(content, &pos);
    if (pos != content.size() || v == 0 || v > UINT32_MAX) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(v);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<uint32_t> PidFile::runningPid()
{
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }
  auto pid = readPid();
  if (pid && probe_->isAlive(*pid)) {
    return pid;
  }
  // A concurrent acquire() may have replaced the stale lease since the read.
  auto current = readPid();
  if (current != pid) {
    if (current && probe_->isAlive(*current)) {
      return current;
    }
    return std::nullopt;
  }
  LOG_MSG << "Removing stale pid file" << path_;
  remove();
  return std::nullopt;
}
