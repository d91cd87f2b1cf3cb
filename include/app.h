#ifndef _APP_H_
#define _APP_H_

#include <memory>
#include <string>

class Settings;
class VectorStore;
class EmbeddingClient;
class TextExtractor;
class DaemonClient;
struct IndexerProgress;

class App {
  struct Impl;
  std::unique_ptr<Impl> imp;
public:
  explicit App(std::unique_ptr<Settings> settings);
  ~App();

  // CLI commands; each returns the process exit code.
  int reindex(bool quiet);
  int update(bool quiet);
  int indexFile(const std::string &path, bool force);
  int progress();
  int search(const std::string &query, bool asJson);
  int health(bool asJson);
  int stats(bool asJson);
  int daemonStart(bool background);
  int daemonStop();
  int daemonStatus();
  int watch();
  int config(bool pathOnly, bool init);

  const Settings &settings() const;
  VectorStore &store();

public:
  static int run(int argc, char *argv[]);

private:
  int runIndexer(bool full, bool quiet);
  int runIndexerInProcess(bool full, bool quiet);
  int runIndexerViaDaemon(const DaemonClient &client, bool full, bool quiet);
  int spawnBackgroundDaemon();
  static void printProgressLine(const IndexerProgress &p);
};

#endif // _APP_H_
