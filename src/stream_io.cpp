#include "stream_io.h"

#include <chrono>

#include <spdlog/spdlog.h>
#include <boxrunner/dispatcher.h>

std::string kBrokerUrl = "ws://localhost:15674/ws";
std::string kBrokerLogin = "guest";
std::string kBrokerPasscode = "guest";
std::string kBrokerVhost = "/";
std::string kInboundStream = "Server2Runner";
std::string kOutboundStream = "Runner2Server";
long kMaxStreamBytes = 1'000'000'000; // 1 GB
int kPrefetch = 16;
double kPublishTimeout = 30;

namespace {

inline std::string Destination(const std::string& stream) {
  return "/queue/" + stream;
}

inline auto Timeout(double sec) {
  return std::chrono::duration<double>(sec);
}

} // namespace

StreamClient::StreamClient(const std::string& url) :
    WsClient(url, "v12.stomp"), state_(State::IDLE), receipt_seq_(0), subscription_seq_(0) {}

StreamClient::~StreamClient() {
  Shutdown();
}

void StreamClient::SetState_(State state) {
  {
    std::lock_guard lck(mtx_);
    state_ = state;
  }
  cv_.notify_all();
}

void StreamClient::OnOpen() {
  StompFrame frame("CONNECT");
  frame.Add("accept-version", "1.2")
       .Add("host", kBrokerVhost)
       .Add("login", kBrokerLogin)
       .Add("passcode", kBrokerPasscode)
       .Add("heart-beat", "0,0");
  if (!SendFrame_(frame)) {
    spdlog::error("Failed sending CONNECT to broker");
    SetState_(State::CLOSED);
  }
}

void StreamClient::OnFail() {
  spdlog::error("Failed to connect to broker {}", kBrokerUrl);
  SetState_(State::CLOSED);
}

void StreamClient::OnClose() {
  spdlog::warn("Connection with broker closed");
  SetState_(State::CLOSED);
}

void StreamClient::OnMessage(const std::string& msg) {
  StompFrame frame;
  if (!ParseStompFrame(msg, frame)) {
    spdlog::warn("Invalid STOMP frame from broker ({} bytes)", msg.size());
    return;
  }
  if (frame.IsHeartbeat()) return;
  spdlog::debug("Frame from broker: {}", frame.command);
  if (frame.command == "CONNECTED") {
    spdlog::info("Connected to broker, server={}", frame.HeaderOr("server", "unknown"));
    SetState_(State::CONNECTED);
  } else if (frame.command == "MESSAGE") {
    const std::string* ack = frame.Header("ack");
    if (!ack) ack = frame.Header("message-id");
    std::string subscription = frame.HeaderOr("subscription", "");
    {
      std::lock_guard lck(mtx_);
      if (subscription_id_.empty() || subscription != subscription_id_) {
        spdlog::debug("Ignoring message of subscription {}", subscription);
        return;
      }
      deliveries_.push_back({ack ? *ack : "", std::move(frame.body)});
    }
    cv_.notify_all();
  } else if (frame.command == "RECEIPT") {
    std::string id = frame.HeaderOr("receipt-id", "");
    {
      std::lock_guard lck(mtx_);
      auto it = pending_receipts_.find(id);
      if (it == pending_receipts_.end()) {
        spdlog::debug("Ignoring late receipt {}", id);
        return;
      }
      it->second = true;
    }
    cv_.notify_all();
  } else if (frame.command == "ERROR") {
    // the broker closes the connection after an ERROR frame
    spdlog::error("Broker error: {} {}", frame.HeaderOr("message", ""), frame.body);
    SetState_(State::CLOSED);
  } else {
    spdlog::warn("Unexpected frame from broker: {}", frame.command);
  }
}

bool StreamClient::SendFrame_(const StompFrame& frame) {
  bool ret = Send(frame.Serialize());
  spdlog::debug("Send frame: {}, result={}", frame.command, ret);
  return ret;
}

bool StreamClient::SendWithReceipt_(StompFrame&& frame, double timeout) {
  std::string receipt;
  {
    std::lock_guard lck(mtx_);
    receipt = "r-" + std::to_string(++receipt_seq_);
    // registered before sending; the RECEIPT may arrive before we start waiting
    pending_receipts_[receipt] = false;
  }
  frame.Add("receipt", receipt);
  bool sent = SendFrame_(frame);
  std::unique_lock lck(mtx_);
  bool ok = sent && cv_.wait_for(lck, Timeout(timeout), [&]() {
    return pending_receipts_[receipt] || state_ == State::CLOSED;
  });
  ok = ok && pending_receipts_[receipt];
  pending_receipts_.erase(receipt);
  if (sent && !ok) {
    spdlog::warn("No receipt for {} {} within {} seconds", frame.command, receipt, timeout);
  }
  return ok;
}

void StreamClient::AddDeclareHeaders_(StompFrame& frame) const {
  frame.Add("durable", "true")
       .Add("auto-delete", "false")
       .Add("x-queue-type", "stream")
       .Add("x-max-length-bytes", std::to_string(kMaxStreamBytes));
}

bool StreamClient::Open(double timeout) {
  {
    std::lock_guard lck(mtx_);
    state_ = State::CONNECTING;
  }
  if (!Connect()) {
    spdlog::error("Invalid broker url {}", kBrokerUrl);
    return false;
  }
  std::unique_lock lck(mtx_);
  cv_.wait_for(lck, Timeout(timeout), [this]() { return state_ != State::CONNECTING; });
  return state_ == State::CONNECTED;
}

bool StreamClient::IsOpen() {
  std::lock_guard lck(mtx_);
  return state_ == State::CONNECTED;
}

bool StreamClient::DeclareStream(const std::string& stream, double timeout) {
  std::string id;
  {
    std::lock_guard lck(mtx_);
    id = "declare-" + std::to_string(++subscription_seq_);
  }
  StompFrame sub("SUBSCRIBE");
  sub.Add("id", id)
     .Add("destination", Destination(stream))
     .Add("ack", "client")
     .Add("prefetch-count", "1")
     .Add("x-stream-offset", "next");
  AddDeclareHeaders_(sub);
  if (!SendWithReceipt_(std::move(sub), timeout)) {
    spdlog::error("Failed declaring stream {}", stream);
    return false;
  }
  StompFrame unsub("UNSUBSCRIBE");
  unsub.Add("id", id);
  if (!SendWithReceipt_(std::move(unsub), timeout)) return false;
  spdlog::info("Stream {} ready", stream);
  return true;
}

bool StreamClient::Subscribe(const std::string& stream, int prefetch, double timeout) {
  std::string id;
  {
    std::lock_guard lck(mtx_);
    id = "sub-" + std::to_string(++subscription_seq_);
    // messages may precede the receipt
    subscription_id_ = id;
  }
  StompFrame sub("SUBSCRIBE");
  sub.Add("id", id)
     .Add("destination", Destination(stream))
     .Add("ack", "client-individual")
     .Add("prefetch-count", std::to_string(prefetch > 0 ? prefetch : 1))
     .Add("x-stream-offset", "next");
  AddDeclareHeaders_(sub);
  if (!SendWithReceipt_(std::move(sub), timeout)) {
    spdlog::error("Failed subscribing to stream {}", stream);
    return false;
  }
  spdlog::info("Subscribed to stream {} at offset next", stream);
  return true;
}

bool StreamClient::Ack(const Delivery& delivery) {
  if (delivery.ack_id.empty()) return true;
  StompFrame frame("ACK");
  frame.Add("id", delivery.ack_id);
  return SendFrame_(frame);
}

bool StreamClient::NextDelivery(Delivery& delivery) {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]() { return !deliveries_.empty() || state_ == State::CLOSED; });
  // deliver what already arrived even if the connection dropped since
  if (deliveries_.empty()) return false;
  delivery = std::move(deliveries_.front());
  deliveries_.pop_front();
  return true;
}

bool StreamClient::SendConfirmed(const std::string& stream, const std::string& body, double timeout) {
  StompFrame frame("SEND");
  frame.Add("destination", Destination(stream))
       .Add("content-type", "application/json")
       .Add("persistent", "true");
  AddDeclareHeaders_(frame);
  frame.body = body;
  return SendWithReceipt_(std::move(frame), timeout);
}

void StreamClient::Shutdown() {
  if (!CanSend()) return;
  if (!SendFrame_(StompFrame("DISCONNECT"))) spdlog::debug("Failed sending DISCONNECT");
  if (!Close()) spdlog::debug("Failed closing broker connection");
}

size_t StreamClient::PendingReceipts() {
  std::lock_guard lck(mtx_);
  return pending_receipts_.size();
}

bool StreamPublisher::Publish(const JobResult& result) {
  std::string body = SerializeJobResult(result);
  std::lock_guard lck(send_mtx_);
  if (!client_.SendConfirmed(stream_, body, kPublishTimeout)) {
    spdlog::error("Failed publishing result of {} to {}", result.submit_id, stream_);
    return false;
  }
  spdlog::debug("Published result of {} ({} bytes)", result.submit_id, body.size());
  return true;
}

void ConsumeLoop(StreamClient& client, Dispatcher& dispatcher) {
  Delivery delivery;
  while (client.NextDelivery(delivery)) {
    dispatcher.Dispatch(delivery.body);
    // acknowledged once handed off; a crash after this point loses the job, as documented
    if (!client.Ack(delivery)) {
      spdlog::warn("Failed acknowledging delivery {}", delivery.ack_id);
    }
  }
  spdlog::error("Stopped consuming {}: connection lost", kInboundStream);
}
