#ifndef _BURROW_UTILS_H_
#define _BURROW_UTILS_H_

#include <string>
#include <string_view>
#include <vector>
#include <sqlite3.h>

namespace utils {
  struct SqliteStmt {
    sqlite3 *sq_ = nullptr;
    explicit SqliteStmt(sqlite3 *sq) : sq_(sq) {}
    sqlite3_stmt *stmt_ = nullptr;
    sqlite3_stmt *&ref() { return stmt_; }
    sqlite3_stmt *ref() const { return stmt_; }
    ~SqliteStmt();
    SqliteStmt() = default;
    SqliteStmt(const SqliteStmt &) = delete;
    SqliteStmt &operator=(const SqliteStmt &) = delete;

    std::string getStr(int i) const;
    sqlite3_int64 getInt64(int i) const;
    double getDouble(int i) const;
    std::vector<unsigned char> getBlob(int i) const;
    bool isNull(int i) const;
  };

  std::string currentTimestamp();

  // Seconds since Unix epoch with sub-second precision, 0 when the file cannot be stat'ed.
  double getFileModificationTime(const std::string &path);

  std::string trimmed(std::string_view sv);
  std::string toLower(std::string_view sv);

  // Prefix of `s` holding at most `maxChars` UTF-8 code points.
  std::string utf8Prefix(std::string_view s, size_t maxChars);

  // Copy of `s` with every invalid UTF-8 sequence replaced by U+FFFD.
  std::string toValidUtf8(std::string_view s);

  std::string homeDir();
  std::string expandHome(const std::string &path);

  // Well-known directories, each overridable through an environment variable.
  std::string dataDir();
  std::string configDir();
  std::string runtimeDir();

  int currentProcessId();

} // namespace utils

#endif // _BURROW_UTILS_H_
