#ifndef _PIDFILE_H_
#define _PIDFILE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Answers "does this process exist?".
class ProcessProbe {
public:
  virtual ~ProcessProbe() = default;
  virtual bool isAlive(uint32_t pid) const = 0;

  // kill(pid, 0) on Unix, OpenProcess on Windows.
  static std::unique_ptr<ProcessProbe> system();
};

// Singleton marker for the daemon. The lease is taken by creating the file
// exclusively; a file left behind by a dead process is removed and the
// creation retried. An acquired lease is released on destruction.
class PidFile {
public:
  explicit PidFile(const std::string &path, std::shared_ptr<const ProcessProbe> probe = nullptr);
  ~PidFile();

  static std::string defaultPath();

  // Creates the file with our pid if no live process holds it.
  // Returns false when another live process owns it.
  bool acquire();
  void release();
  bool owned() const { return owned_; }

  // Unconditionally writes the current process id.
  void write();
  void remove();
  std::optional<uint32_t> readPid() const;

  // Pid of the live owner, or nullopt. A stale file is deleted as a side effect.
  std::optional<uint32_t> runningPid();

  const std::string &path() const { return path_; }

private:
  PidFile(const PidFile &) = delete;
  PidFile &operator =(const PidFile &) = delete;

  bool createExclusive();

  std::string path_;
  std::shared_ptr<const ProcessProbe> probe_;
  bool owned_ = false;
};

#endif // _PIDFILE_H_
