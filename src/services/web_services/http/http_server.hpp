#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "mongoose.h"

#include "core/common/logger/logger.hpp"
#include "services/web_services/api/rest_api.hpp"
#include "services/web_services/http/worker_pool.hpp"

namespace devinv::services::web_services::http {

// Responses finished by workers, waiting for the event loop. Only connections
// that are still open accept a response; closing one drops whatever is pending.
class ResponseMailbox {
public:
  using ConnId = unsigned long;

  void Open(ConnId id);
  void Close(ConnId id);

  // False when the connection closed before the response was ready.
  bool Put(ConnId id, api::HttpResponse resp);
  bool Take(ConnId id, api::HttpResponse& out);

  std::size_t Pending() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<ConnId, std::optional<api::HttpResponse>> slots_;
};

// Mongoose event loop on the calling thread; request handlers run on a worker
// pool. A worker leaves the response in the mailbox and sends a one-byte
// mg_wakeup() so the loop picks it up; the body never crosses the wakeup pipe.
class MongooseServer {
public:
  struct Options {
    std::string listen_addr = "http://0.0.0.0:3001";
    std::size_t workers = 4;
  };

  using RequestHandler = std::function<api::HttpResponse(const api::HttpRequest& req)>;

  MongooseServer(Options opt, RequestHandler handler,
                 std::shared_ptr<devinv::core::common::log::Logger> logger);
  ~MongooseServer();

  MongooseServer(const MongooseServer&) = delete;
  MongooseServer& operator=(const MongooseServer&) = delete;

  bool Start();
  void Poll(int timeout_ms);

  // Finishes in-flight handlers; the listener stays open until destruction.
  void Stop();

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data);
  void HandleEvent(struct mg_connection* c, int ev, void* ev_data);
  void Dispatch(struct mg_connection* c, struct mg_http_message* hm);
  static void Reply(struct mg_connection* c, const api::HttpResponse& resp);

private:
  Options opt_;
  RequestHandler handler_;
  std::shared_ptr<devinv::core::common::log::Logger> logger_;
  struct mg_mgr mgr_;
  ResponseMailbox mailbox_;
  WorkerPool pool_;
};

}  // namespace devinv::services::web_services::http
