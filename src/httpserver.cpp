#include "httpserver.h"
#include "daemon.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <utils_log/logger.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#ifndef _WIN32
#include <sys/socket.h>
#endif

using json = nlohmann::json;

namespace {

  // Strings from the filesystem may hold invalid UTF-8; replace it instead of throwing.
  void sendJson(httplib::Response &res, const json &body) {
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
  }

  void sendError(httplib::Response &res, int status, const std::string &message) {
    res.status = status;
    sendJson(res, { {"error", message} });
  }

} // anonymous namespace


struct HttpServer::Impl {
  Daemon &daemon_;
  httplib::Server server_;
  std::string socketPath_;

  explicit Impl(Daemon &d) : daemon_(d) {}
  void registerRoutes();
};

HttpServer::HttpServer(Daemon &daemon)
  : imp(new Impl(daemon))
{
  imp->server_.new_task_queue = [] { return new httplib::ThreadPool(4); };

  imp->server_.set_error_logger([](const httplib::Error &err, const httplib::Request *req) {
    std::cerr << httplib::to_string(err) << " while processing request";
    if (req) {
      std::cerr << ", request: '" << req->method << " " << req->path << " " << req->version << "'";
    }
    std::cerr << std::endl;
    });

  imp->registerRoutes();
}

HttpServer::~HttpServer()
{
  stop();
}

bool HttpServer::bindToSocket(const std::string &socketPath)
{
#ifdef _WIN32
  LOG_MSG << "Unix domain sockets are not supported on this platform";
  return false;
#else
  imp->socketPath_ = socketPath;
  imp->server_.set_address_family(AF_UNIX);
  // The port is ignored for AF_UNIX.
  if (!imp->server_.bind_to_port(socketPath, 80)) {
    LOG_MSG << "Unable to bind daemon socket" << socketPath;
    return false;
  }
  std::error_code ec;
  std::filesystem::permissions(socketPath,
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
    std::filesystem::perm_options::replace, ec);
  if (ec) {
    LOG_MSG << "Unable to restrict permissions of" << socketPath << ":" << ec.message();
  }
  return true;
#endif
}

void HttpServer::Impl::registerRoutes()
{
  auto &server = server_;

  server.Get("/daemon/status", [this](const httplib::Request &, httplib::Response &res) {
    try {
      LOG_MSG << "GET /daemon/status";
      sendJson(res, daemon_.statusJson());
    } catch (const std::exception &e) {
      sendError(res, 500, e.what());
    }
    });

  server.Post("/daemon/shutdown", [this](const httplib::Request &, httplib::Response &res) {
    try {
      LOG_MSG << "POST /daemon/shutdown";
      // The serve loop notices the request and stops after this response is sent.
      daemon_.requestShutdown();
      sendJson(res, json::object());
    } catch (const std::exception &e) {
      sendError(res, 500, e.what());
    }
    });

  server.Get("/indexer/progress", [this](const httplib::Request &, httplib::Response &res) {
    try {
      sendJson(res, daemon_.progress().toJson());
    } catch (const std::exception &e) {
      sendError(res, 500, e.what());
    }
    });

  server.Post("/indexer/start", [this](const httplib::Request &req, httplib::Response &res) {
    LOG_MSG << "POST /indexer/start";
    bool full = false;
    try {
      if (!req.body.empty()) {
        json request = json::parse(req.body);
        if (request.contains("full") && !request["full"].is_boolean()) {
          throw std::invalid_argument("'full' must be a boolean");
        }
        full = request.value("full", false);
      }
    } catch (const std::exception &e) {
      sendError(res, 400, e.what());
      return;
    }
    try {
      auto result = daemon_.startIndexer(full);
      sendJson(res, result.toJson());
    } catch (const std::exception &e) {
      sendError(res, 500, e.what());
    }
    });

  server.Get("/health", [this](const httplib::Request &, httplib::Response &res) {
    try {
      LOG_MSG << "GET /health";
      sendJson(res, daemon_.health().toJson());
    } catch (const std::exception &e) {
      sendError(res, 500, e.what());
    }
    });

  server.Get("/stats", [this](const httplib::Request &, httplib::Response &res) {
    try {
      LOG_MSG << "GET /stats";
      sendJson(res, daemon_.stats().toJson());
    } catch (const std::exception &e) {
      sendError(res, 500, e.what());
    }
    });
}

bool HttpServer::startServer()
{
  LOG_MSG << "\nEndpoints:";
  LOG_MSG << "  GET  /daemon/status";
  LOG_MSG << "  POST /daemon/shutdown";
  LOG_MSG << "  GET  /indexer/progress";
  LOG_MSG << "  POST /indexer/start   - {\"full\": false}";
  LOG_MSG << "  GET  /health";
  LOG_MSG << "  GET  /stats";
  LOG_MSG << "\nListening on" << imp->socketPath_;
  return imp->server_.listen_after_bind();
}

void HttpServer::waitUntilReady()
{
  imp->server_.wait_until_ready();
}

void HttpServer::stop()
{
  if (imp->server_.is_running()) {
    LOG_MSG << "Server stopping...";
    imp->server_.stop();
    LOG_MSG << "Server stopped!";
  }
}
