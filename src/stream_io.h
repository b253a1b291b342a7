#ifndef STREAM_IO_H_
#define STREAM_IO_H_

#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <condition_variable>

#include <boxrunner/job.h>
#include <boxrunner/publisher.h>
#include <boxrunner/stomp.h>
#include "websocket.h"

extern std::string kBrokerUrl;
extern std::string kBrokerLogin;
extern std::string kBrokerPasscode;
extern std::string kBrokerVhost;
extern std::string kInboundStream;
extern std::string kOutboundStream;
extern long kMaxStreamBytes;
extern int kPrefetch;
extern double kPublishTimeout; // seconds

// Streams are RabbitMQ streams reached through the Web-STOMP plugin:
//   SUBSCRIBE/SEND to /queue/<name> declares the stream if it does not exist yet,
//   and a SEND carrying a receipt header is answered only after the broker confirmed it.

struct Delivery {
  std::string ack_id;
  std::string body;
};

class StreamClient : public WsClient {
  enum class State { IDLE, CONNECTING, CONNECTED, CLOSED };

  std::mutex mtx_;
  std::condition_variable cv_;
  State state_;
  std::list<Delivery> deliveries_;
  std::string subscription_id_; // MESSAGE frames of other subscriptions are ignored
  // receipt id -> arrived; a RECEIPT nobody waits for any more is dropped
  std::unordered_map<std::string, bool> pending_receipts_;
  long receipt_seq_;
  long subscription_seq_;

  void SetState_(State state);
  bool SendFrame_(const StompFrame& frame);
  // send a frame with a fresh receipt header and wait for the RECEIPT
  bool SendWithReceipt_(StompFrame&& frame, double timeout);
  void AddDeclareHeaders_(StompFrame& frame) const;
 public:
  explicit StreamClient(const std::string& url = kBrokerUrl);
  ~StreamClient();

  void OnOpen() override;
  void OnFail() override;
  void OnClose() override;
  void OnMessage(const std::string& msg) override;

  // Connect and complete the STOMP handshake
  bool Open(double timeout);
  bool IsOpen();
  // Create the stream if needed by subscribing to it once
  bool DeclareStream(const std::string& stream, double timeout);
  // Deliveries start at the stream's next offset; older messages are not replayed
  bool Subscribe(const std::string& stream, int prefetch, double timeout);
  bool Ack(const Delivery& delivery);
  // Block until the next delivery; false once the connection is gone
  bool NextDelivery(Delivery& delivery);
  // Return only after the broker acknowledged durable storage
  bool SendConfirmed(const std::string& stream, const std::string& body, double timeout);
  void Shutdown();
  // confirmed sends still waiting for their RECEIPT
  size_t PendingReceipts();
};

class StreamPublisher : public Publisher {
  StreamClient& client_;
  std::string stream_;
  std::mutex send_mtx_; // one confirmed send on the connection at a time
 public:
  StreamPublisher(StreamClient& client, const std::string& stream) :
      client_(client), stream_(stream) {}
  bool Publish(const JobResult& result) override;
};

class Dispatcher;
// Feed deliveries to the dispatcher in order until the connection drops
void ConsumeLoop(StreamClient& client, Dispatcher& dispatcher);

#endif  // STREAM_IO_H_
