#include "websocket.h"

WsClient::WsClient(const std::string& url, const std::string& subprotocol) :
    url_(url), subprotocol_(subprotocol), connected_(false), close_issued_(false) {
  // wss:// selects the TLS endpoint; it has to be chosen before the asio thread starts
  if (url.rfind("wss://", 0) == 0) client_.emplace<TLSClient>();
  std::visit([this](auto& c) { Init_(c); }, client_);
}

WsClient::~WsClient() {
  std::visit([this](auto& c) { Destroy_(c); }, client_);
  thr_->join();
}

bool WsClient::Connect() {
  return std::visit([this](auto& c) { return Connect_(c); }, client_);
}

bool WsClient::Send(const std::string& str) {
  if (!CanSend()) return false;
  return std::visit([&](auto& c) { return Send_(c, str); }, client_);
}

bool WsClient::Close() {
  if (!CanSend()) return false;
  return std::visit([this](auto& c) { return Close_(c); }, client_);
}
