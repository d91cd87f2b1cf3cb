#ifndef _HTTPSERVER_H_
#define _HTTPSERVER_H_

#include <memory>
#include <string>

class Daemon;

// JSON request/response endpoints of the daemon, served over a Unix domain socket.
class HttpServer {
  struct Impl;
  std::unique_ptr<Impl> imp;

public:
  HttpServer(Daemon &daemon);
  ~HttpServer();
  bool bindToSocket(const std::string &socketPath);
  // Blocks until stop() is called.
  bool startServer();
  void waitUntilReady();
  void stop();

private:
  HttpServer(const HttpServer &) = delete;
  HttpServer &operator =(const HttpServer &) = delete;
};

#endif // _HTTPSERVER_H_
