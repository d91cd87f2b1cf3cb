#include "daemonclient.h"
#include "pidfile.h"
#include "cutils.h"
#include <chrono>
#include <future>
#include <thread>
#include <httplib.h>
#include <utils_log/logger.hpp>
#include <fmt/core.h>

#ifndef _WIN32
#include <sys/socket.h>
#endif

using json = nlohmann::json;

DaemonClient::DaemonClient(const std::string &socketPath, size_t timeoutMs)
  : socketPath_(socketPath)
  , timeoutMs_(timeoutMs)
{
}

std::string DaemonClient::defaultSocketPath()
{
  return Daemon::socketPathIn(utils::runtimeDir());
}

json DaemonClient::request(const std::string &method, const std::string &path, const std::string &body) const
{
#ifdef _WIN32
  throw DaemonError(DaemonError::Kind::Connect, "daemon sockets are not supported on this platform");
#else
  httplib::Client client(socketPath_, 80);
  client.set_address_family(AF_UNIX);
  client.set_connection_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
  client.set_read_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
  client.set_write_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
  client.set_keep_alive(false);

  // The per-phase timeouts above do not bound a peer that trickles bytes,
  // so the whole exchange also runs against one deadline.
  auto pending = std::async(std::launch::async, [&]() {
    return method == "POST"
      ? client.Post(path, body.empty() ? std::string("{}") : body, "application/json")
      : client.Get(path);
    });
  if (pending.wait_for(std::chrono::milliseconds(timeoutMs_)) == std::future_status::timeout) {
    client.stop();
    pending.wait();
    throw DaemonError(DaemonError::Kind::Timeout, "connection timeout");
  }
  auto res = pending.get();

  if (!res) {
    auto err = res.error();
    if (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read) {
      throw DaemonError(DaemonError::Kind::Timeout, "connection timeout");
    }
    throw DaemonError(DaemonError::Kind::Connect, fmt::format("failed to connect to daemon: {}", httplib::to_string(err)));
  }
  if (res->status < 200 || 300 <= res->status) {
    throw DaemonError(DaemonError::Kind::Status, fmt::format("daemon returned status {}", res->status), res->status);
  }
  try {
    return json::parse(res->body);
  } catch (const json::exception &e) {
    LOG_MSG << "Unparsable daemon response for" << path << ":" << e.what();
    throw DaemonError(DaemonError::Kind::Parse, "failed to parse response");
  }
#endif
}

DaemonStatus DaemonClient::status() const
{
  auto j = request("GET", "/daemon/status");
  try {
    DaemonStatus s;
    s.version = j.at("version").get<std::string>();
    s.pid = j.at("pid").get<uint32_t>();
    s.uptimeSecs = j.at("uptime_secs").get<uint64_t>();
    return s;
  } catch (const json::exception &) {
    throw DaemonError(DaemonError::Kind::Parse, "failed to parse response");
  }
}

void DaemonClient::shutdown() const
{
  request("POST", "/daemon/shutdown");
}

IndexerProgress DaemonClient::progress() const
{
  auto j = request("GET", "/indexer/progress");
  try {
    return IndexerProgress::fromJson(j);
  } catch (const json::exception &) {
    throw DaemonError(DaemonError::Kind::Parse, "failed to parse response");
  }
}

StartIndexerResult DaemonClient::startIndexer(bool full) const
{
  json body = { {"full", full} };
  auto j = request("POST", "/indexer/start", body.dump());
  try {
    StartIndexerResult r;
    r.started = j.at("started").get<bool>();
    r.message = j.at("message").get<std::string>();
    return r;
  } catch (const json::exception &) {
    throw DaemonError(DaemonError::Kind::Parse, "failed to parse response");
  }
}

HealthStatus DaemonClient::health() const
{
  auto j = request("GET", "/health");
  try {
    return HealthStatus::fromJson(j);
  } catch (const json::exception &) {
    throw DaemonError(DaemonError::Kind::Parse, "failed to parse response");
  }
}

StatsInfo DaemonClient::stats() const
{
  auto j = request("GET", "/stats");
  try {
    return StatsInfo::fromJson(j);
  } catch (const json::exception &) {
    throw DaemonError(DaemonError::Kind::Parse, "failed to parse response");
  }
}

//---------------------------------------------------------------------------

IndexerProgress pollUntilDone(const DaemonClient &client,
  const std::function<void(const IndexerProgress &)> &onChange,
  const PollOptions &options)
{
  std::optional<IndexerProgress> last;
  size_t consecutiveErrors = 0;
  while (true) {
    try {
      auto p = client.progress();
      consecutiveErrors = 0;
      bool changed = !last
        || last->phase != p.phase
        || last->processed != p.processed
        || last->total != p.total
        || last->errors != p.errors;
      if (changed && onChange) {
        onChange(p);
      }
      if (!p.running) {
        return p;
      }
      last = std::move(p);
    } catch (const DaemonError &e) {
      ++consecutiveErrors;
      LOG_MSG << "Progress poll failed (" << consecutiveErrors << "/" << options.maxConsecutiveErrors << "):" << e.what();
      if (options.maxConsecutiveErrors <= consecutiveErrors) {
        throw DaemonError(e.kind(),
          fmt::format("lost contact with daemon after {} attempts: {}", consecutiveErrors, e.what()), e.status());
      }
    }
    std::this_thread::sleep_for(options.interval);
  }
}

std::optional<uint32_t> runningDaemonPid(const std::string &runtimeDir)
{
  PidFile pidFile(Daemon::pidPathIn(runtimeDir));
  return pidFile.runningPid();
}
