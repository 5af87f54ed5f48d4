#include "services/web_services/http/http_server.hpp"

#include <string>
#include <utility>

#include "services/web_services/api/api_json.hpp"

namespace devinv::services::web_services::http {

namespace {

constexpr const char* kJsonHeaders = "Content-Type: application/json\r\n";
constexpr char kWakeToken = 'r';

}  // namespace

void ResponseMailbox::Open(ConnId id) {
  std::lock_guard<std::mutex> lk(mu_);
  slots_[id].reset();
}

void ResponseMailbox::Close(ConnId id) {
  std::lock_guard<std::mutex> lk(mu_);
  slots_.erase(id);
}

bool ResponseMailbox::Put(ConnId id, api::HttpResponse resp) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = slots_.find(id);
  if (it == slots_.end()) return false;
  it->second = std::move(resp);
  return true;
}

bool ResponseMailbox::Take(ConnId id, api::HttpResponse& out) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = slots_.find(id);
  if (it == slots_.end() || !it->second.has_value()) return false;
  out = std::move(*it->second);
  it->second.reset();
  return true;
}

std::size_t ResponseMailbox::Pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& kv : slots_) {
    if (kv.second.has_value()) ++n;
  }
  return n;
}

MongooseServer::MongooseServer(Options opt, RequestHandler handler,
                               std::shared_ptr<devinv::core::common::log::Logger> logger)
    : opt_(std::move(opt)),
      handler_(std::move(handler)),
      logger_(logger),
      pool_(opt_.workers, logger) {
  mg_mgr_init(&mgr_);
}

MongooseServer::~MongooseServer() {
  Stop();
  mg_mgr_free(&mgr_);
}

bool MongooseServer::Start() {
  if (!mg_wakeup_init(&mgr_)) {
    if (logger_) logger_->Error("Failed to initialize wakeup pipe");
    return false;
  }
  if (mg_http_listen(&mgr_, opt_.listen_addr.c_str(), EventHandler, this) == nullptr) {
    if (logger_) logger_->Error("Failed to listen on " + opt_.listen_addr);
    return false;
  }
  pool_.Start();
  if (logger_) {
    logger_->Info("Mongoose listening on " + opt_.listen_addr + " with " +
                  std::to_string(pool_.Size()) + " workers");
  }
  return true;
}

void MongooseServer::Poll(int timeout_ms) {
  mg_mgr_poll(&mgr_, timeout_ms);
}

void MongooseServer::Stop() {
  pool_.Stop();
}

void MongooseServer::EventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* self = static_cast<MongooseServer*>(c->fn_data);
  if (self != nullptr) self->HandleEvent(c, ev, ev_data);
}

void MongooseServer::HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
  if (ev == MG_EV_HTTP_MSG) {
    Dispatch(c, static_cast<struct mg_http_message*>(ev_data));
  } else if (ev == MG_EV_WAKEUP) {
    api::HttpResponse resp;
    if (mailbox_.Take(c->id, resp)) {
      Reply(c, resp);
    } else if (logger_) {
      logger_->Warn("wakeup without a pending response, conn " + std::to_string(c->id));
    }
  } else if (ev == MG_EV_CLOSE) {
    mailbox_.Close(c->id);
  } else if (ev == MG_EV_ERROR) {
    const char* err = static_cast<const char*>(ev_data);
    if (logger_) logger_->Warn(std::string("HTTP connection error: ") + (err ? err : "unknown"));
  }
}

void MongooseServer::Dispatch(struct mg_connection* c, struct mg_http_message* hm) {
  api::HttpRequest req;
  req.method.assign(hm->method.buf, hm->method.len);
  req.uri.assign(hm->uri.buf, hm->uri.len);
  req.body.assign(hm->body.buf, hm->body.len);

  struct mg_mgr* mgr = &mgr_;
  ResponseMailbox* mailbox = &mailbox_;
  const unsigned long conn_id = c->id;
  const RequestHandler& handler = handler_;

  mailbox_.Open(conn_id);
  const bool queued = pool_.Submit([mgr, mailbox, conn_id, &handler, req = std::move(req)]() {
    if (mailbox->Put(conn_id, handler(req))) {
      mg_wakeup(mgr, conn_id, &kWakeToken, sizeof(kWakeToken));
    }
  });

  if (!queued) {
    mailbox_.Close(conn_id);
    Reply(c, api::HttpResponse{503, api::ErrorEnvelope("Server shutting down")});
  }
}

void MongooseServer::Reply(struct mg_connection* c, const api::HttpResponse& resp) {
  if (resp.status == 204) {
    mg_http_reply(c, 204, "", "");
    return;
  }
  mg_http_reply(c, resp.status, kJsonHeaders, "%s\n", resp.body.c_str());
}

}  // namespace devinv::services::web_services::http
