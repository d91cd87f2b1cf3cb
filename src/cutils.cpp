#include "cutils.h"

#include <vector>
#include <chrono>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <cctype>
#include <ctime>

#include <utils_log/logger.hpp>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace {
  std::string envOrEmpty(const char *name) {
    const char *v = std::getenv(name);
    return v ? std::string(v) : std::string{};
  }
}

namespace utils {
  SqliteStmt::~SqliteStmt()
  {
    if (stmt_) {
      auto rc = sqlite3_finalize(stmt_);
      if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        const char *msg = sq_ ? sqlite3_errmsg(sq_) : "'no handle'";
        LOG_MSG << "SQLite finalize error: " << msg;
      }
    }
  }

  std::string SqliteStmt::getStr(int i) const
  {
    auto p = reinterpret_cast<const char *>(sqlite3_column_text(ref(), i));
    return p ? std::string{ p } : std::string{};
  }

  sqlite3_int64 SqliteStmt::getInt64(int i) const
  {
    return sqlite3_column_int64(ref(), i);
  }

  double SqliteStmt::getDouble(int i) const
  {
    return sqlite3_column_double(ref(), i);
  }

  std::vector<unsigned char> SqliteStmt::getBlob(int i) const
  {
    auto p = static_cast<const unsigned char *>(sqlite3_column_blob(ref(), i));
    int n = sqlite3_column_bytes(ref(), i);
    if (!p || n <= 0) return {};
    return std::vector<unsigned char>(p, p + n);
  }

  bool SqliteStmt::isNull(int i) const
  {
    return sqlite3_column_type(ref(), i) == SQLITE_NULL;
  }
}

std::string utils::currentTimestamp()
{
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::stringstream ss;
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

double utils::getFileModificationTime(const std::string &path)
{
#if defined(_WIN32)

  WIN32_FILE_ATTRIBUTE_DATA data;
  if (!GetFileAttributesExA(path.c_str(), GetFileExInfoStandard, &data))
    return 0;

  ULARGE_INTEGER ull;
  ull.LowPart = data.ftLastWriteTime.dwLowDateTime;
  ull.HighPart = data.ftLastWriteTime.dwHighDateTime;

  // Windows FILETIME counts 100ns ticks since 1601
  constexpr uint64_t WINDOWS_TO_UNIX_EPOCH = 116444736000000000ULL;
  return static_cast<double>(ull.QuadPart - WINDOWS_TO_UNIX_EPOCH) / 1e7;

#else

  struct stat st;
  if (stat(path.c_str(), &st) != 0)
    return 0;

#if defined(__APPLE__)
  return static_cast<double>(st.st_mtimespec.tv_sec) + st.st_mtimespec.tv_nsec / 1e9;
#else
  return static_cast<double>(st.st_mtim.tv_sec) + st.st_mtim.tv_nsec / 1e9;
#endif

#endif
}

std::string utils::trimmed(std::string_view sv)
{
  auto wsfront = std::find_if_not(sv.begin(), sv.end(), ::isspace);
  auto wsback = std::find_if_not(sv.rbegin(), sv.rend(), ::isspace).base();
  return (wsfront < wsback ? std::string(wsfront, wsback) : std::string{});
}

std::string utils::toLower(std::string_view sv)
{
  std::string res(sv);
  std::transform(res.begin(), res.end(), res.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return res;
}

std::string utils::utf8Prefix(std::string_view s, size_t maxChars)
{
  size_t pos = 0;
  size_t chars = 0;
  while (pos < s.size() && chars < maxChars) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    pos = (std::min)(pos + len, s.size());
    ++chars;
  }
  return std::string(s.substr(0, pos));
}

std::string utils::toValidUtf8(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  size_t pos = 0;
  while (pos < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c < 0x80) len = 1;
    else if (0xC2 <= c && c <= 0xDF) len = 2;
    else if (c == 0xE0) { len = 3; lo = 0xA0; }
    else if (0xE1 <= c && c <= 0xEC) len = 3;
    else if (c == 0xED) { len = 3; hi = 0x9F; }
    else if (0xEE <= c && c <= 0xEF) len = 3;
    else if (c == 0xF0) { len = 4; lo = 0x90; }
    else if (0xF1 <= c && c <= 0xF3) len = 4;
    else if (c == 0xF4) { len = 4; hi = 0x8F; }

    bool valid = len != 0 && pos + len <= s.size();
    for (size_t k = 1; valid && k < len; ++k) {
      unsigned char cc = static_cast<unsigned char>(s[pos + k]);
      // Only the first continuation byte has a narrowed range.
      valid = k == 1 ? (lo <= cc && cc <= hi) : (0x80 <= cc && cc <= 0xBF);
    }
    if (valid) {
      out.append(s.substr(pos, len));
      pos += len;
    } else {
      out += "\xEF\xBF\xBD";
      ++pos;
    }
  }
  return out;
}

std::string utils::homeDir()
{
#ifdef _WIN32
  return envOrEmpty("USERPROFILE");
#else
  return envOrEmpty("HOME");
#endif
}

std::string utils::expandHome(const std::string &path)
{
  if (path == "~") return homeDir();
  if (path.starts_with("~/")) {
    auto home = homeDir();
    if (!home.empty()) {
      return (std::filesystem::path(home) / path.substr(2)).string();
    }
  }
  return path;
}

std::string utils::dataDir()
{
  auto dir = envOrEmpty("BURROW_DATA_DIR");
  if (!dir.empty()) return dir;
  auto home = homeDir();
  if (home.empty()) return "burrow";
  return (std::filesystem::path(home) / ".local" / "share" / "burrow").string();
}

std::string utils::configDir()
{
  auto dir = envOrEmpty("BURROW_CONFIG_DIR");
  if (!dir.empty()) return dir;
  auto home = homeDir();
  if (home.empty()) return "burrow";
  return (std::filesystem::path(home) / ".config" / "burrow").string();
}

std::string utils::runtimeDir()
{
  auto dir = envOrEmpty("BURROW_RUNTIME_DIR");
  if (!dir.empty()) return dir;
  auto xdg = envOrEmpty("XDG_RUNTIME_DIR");
  if (!xdg.empty()) {
    return (std::filesystem::path(xdg) / "burrow").string();
  }
  return (std::filesystem::path(dataDir()) / "run").string();
}

int utils::currentProcessId()
{
#ifdef _WIN32
  return static_cast<int>(GetCurrentProcessId());
#else
  return static_cast<int>(getpid());
#endif
}
