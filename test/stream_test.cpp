#include <set>
#include <algorithm>
#include <future>
#include <thread>
#include <chrono>
#include <functional>

#include <boxrunner/dispatcher.h>
#include "stream_io.h"
#include "utils.h"

namespace {

// StreamClient with the websocket replaced by a scripted broker
class ScriptedBroker : public StreamClient {
  std::mutex mtx_;
  std::vector<StompFrame> sent_;
  std::vector<std::thread> replies_;
  int outstanding_sends_;
  int max_outstanding_sends_;

  void Reply_(const std::string& receipt, bool is_send) {
    if (is_send) {
      std::lock_guard lck(mtx_);
      outstanding_sends_--;
    }
    StompFrame frame("RECEIPT");
    frame.Add("receipt-id", receipt);
    Inject(frame);
  }
 public:
  bool auto_receipt;
  double receipt_delay; // seconds
  std::function<void(const StompFrame&)> on_send;

  ScriptedBroker() :
      StreamClient("ws://127.0.0.1:9/ws"), outstanding_sends_(0), max_outstanding_sends_(0),
      auto_receipt(true), receipt_delay(0) {}
  ~ScriptedBroker() {
    for (auto& i : replies_) i.join();
  }

  bool Send(const std::string& str) override {
    StompFrame frame;
    if (!ParseStompFrame(str, frame)) {
      ADD_FAILURE() << "client sent an invalid frame";
      return false;
    }
    bool is_send = frame.command == "SEND";
    {
      std::lock_guard lck(mtx_);
      sent_.push_back(frame);
      if (is_send) max_outstanding_sends_ = std::max(max_outstanding_sends_, ++outstanding_sends_);
    }
    if (on_send) on_send(frame);
    const std::string* receipt = frame.Header("receipt");
    if (!receipt || !auto_receipt) return true;
    if (receipt_delay <= 0) {
      Reply_(*receipt, is_send);
    } else {
      std::lock_guard lck(mtx_);
      replies_.emplace_back([this, id = *receipt, is_send]() {
        std::this_thread::sleep_for(std::chrono::duration<double>(receipt_delay));
        Reply_(id, is_send);
      });
    }
    return true;
  }

  void Inject(const StompFrame& frame) { OnMessage(frame.Serialize()); }
  void InjectMessage(const std::string& subscription, const std::string& ack, const std::string& body) {
    StompFrame frame("MESSAGE");
    frame.Add("subscription", subscription).Add("message-id", "m-" + ack).Add("ack", ack);
    frame.body = body;
    Inject(frame);
  }

  std::vector<StompFrame> Sent(const std::string& command) {
    std::lock_guard lck(mtx_);
    std::vector<StompFrame> ret;
    for (auto& i : sent_) {
      if (i.command == command) ret.push_back(i);
    }
    return ret;
  }
  int MaxOutstandingSends() {
    std::lock_guard lck(mtx_);
    return max_outstanding_sends_;
  }
};

JobResult MakeResult(const std::string& submit_id) {
  JobResult res;
  res.submit_id = submit_id;
  res.results.resize(1);
  res.results[0].outcome = Outcome::SUCCESS;
  return res;
}

} // namespace

TEST(StreamClient, Handshake) {
  ScriptedBroker broker;
  EXPECT_FALSE(broker.IsOpen());
  StompFrame connected("CONNECTED");
  connected.Add("version", "1.2").Add("server", "RabbitMQ/3.13");
  broker.Inject(connected);
  EXPECT_TRUE(broker.IsOpen());
  broker.OnClose();
  EXPECT_FALSE(broker.IsOpen());
}

TEST(StreamClient, SubscribeAtNextOffset) {
  ScriptedBroker broker;
  ASSERT_TRUE(broker.Subscribe("Server2Runner", 4, 1));
  auto subs = broker.Sent("SUBSCRIBE");
  ASSERT_EQ(subs.size(), 1);
  const StompFrame& sub = subs[0];
  EXPECT_EQ(sub.HeaderOr("id", ""), "sub-1");
  EXPECT_EQ(sub.HeaderOr("destination", ""), "/queue/Server2Runner");
  EXPECT_EQ(sub.HeaderOr("x-stream-offset", ""), "next");
  EXPECT_EQ(sub.HeaderOr("x-queue-type", ""), "stream");
  EXPECT_EQ(sub.HeaderOr("durable", ""), "true");
  EXPECT_EQ(sub.HeaderOr("x-max-length-bytes", ""), std::to_string(kMaxStreamBytes));
  EXPECT_EQ(sub.HeaderOr("ack", ""), "client-individual");
  EXPECT_EQ(sub.HeaderOr("prefetch-count", ""), "4");
  EXPECT_NE(sub.Header("receipt"), nullptr);
  EXPECT_EQ(broker.PendingReceipts(), 0);
}

TEST(StreamClient, DeclareStream) {
  ScriptedBroker broker;
  ASSERT_TRUE(broker.DeclareStream("Runner2Server", 1));
  auto subs = broker.Sent("SUBSCRIBE");
  auto unsubs = broker.Sent("UNSUBSCRIBE");
  ASSERT_EQ(subs.size(), 1);
  ASSERT_EQ(unsubs.size(), 1);
  EXPECT_EQ(subs[0].HeaderOr("destination", ""), "/queue/Runner2Server");
  EXPECT_EQ(subs[0].HeaderOr("x-queue-type", ""), "stream");
  EXPECT_EQ(subs[0].HeaderOr("id", ""), unsubs[0].HeaderOr("id", "-"));
}

TEST(StreamClient, SendWaitsForReceipt) {
  ScriptedBroker broker;
  broker.receipt_delay = 0.05;
  ASSERT_TRUE(broker.SendConfirmed("Runner2Server", "{}", 5));
  auto sends = broker.Sent("SEND");
  ASSERT_EQ(sends.size(), 1);
  EXPECT_EQ(sends[0].body, "{}");
  EXPECT_EQ(sends[0].HeaderOr("destination", ""), "/queue/Runner2Server");
  EXPECT_EQ(sends[0].HeaderOr("content-length", ""), "2");
  EXPECT_EQ(broker.PendingReceipts(), 0);
}

TEST(StreamClient, LateReceiptIsDropped) {
  ScriptedBroker broker;
  broker.auto_receipt = false;
  EXPECT_FALSE(broker.SendConfirmed("Runner2Server", "{}", 0.05));
  EXPECT_EQ(broker.PendingReceipts(), 0);
  auto sends = broker.Sent("SEND");
  ASSERT_EQ(sends.size(), 1);
  StompFrame late("RECEIPT");
  late.Add("receipt-id", sends[0].HeaderOr("receipt", ""));
  broker.Inject(late);
  EXPECT_EQ(broker.PendingReceipts(), 0);
  // the late receipt does not confirm the next send
  EXPECT_FALSE(broker.SendConfirmed("Runner2Server", "{}", 0.05));
}

TEST(StreamClient, ErrorFrameFailsPendingSend) {
  ScriptedBroker broker;
  broker.auto_receipt = false;
  auto start = std::chrono::steady_clock::now();
  auto sent = std::async(std::launch::async, [&]() {
    return broker.SendConfirmed("Runner2Server", "{}", 30);
  });
  while (broker.PendingReceipts() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  StompFrame error("ERROR");
  error.Add("message", "access refused");
  broker.Inject(error);
  EXPECT_FALSE(sent.get());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  EXPECT_EQ(broker.PendingReceipts(), 0);
}

TEST(StreamClient, DeliveriesOfOtherSubscriptionsIgnored) {
  ScriptedBroker broker;
  ASSERT_TRUE(broker.DeclareStream("Server2Runner", 1));
  ASSERT_TRUE(broker.Subscribe("Server2Runner", 4, 1));
  broker.InjectMessage("declare-1", "d-1", "stray");
  broker.InjectMessage("sub-2", "a-1", "one");
  broker.InjectMessage("sub-9", "x-1", "unknown");
  broker.InjectMessage("sub-2", "a-2", "two");
  broker.OnClose();
  // already queued deliveries are drained after the connection closed
  Delivery delivery;
  ASSERT_TRUE(broker.NextDelivery(delivery));
  EXPECT_EQ(delivery.ack_id, "a-1");
  EXPECT_EQ(delivery.body, "one");
  ASSERT_TRUE(broker.NextDelivery(delivery));
  EXPECT_EQ(delivery.ack_id, "a-2");
  EXPECT_EQ(delivery.body, "two");
  EXPECT_FALSE(broker.NextDelivery(delivery));
}

TEST(StreamPublisher, SendsAreSerialized) {
  constexpr int kResults = 4;
  ScriptedBroker broker;
  broker.receipt_delay = 0.03;
  StreamPublisher publisher(broker, "Runner2Server");
  std::vector<std::future<bool>> published;
  for (int i = 0; i < kResults; i++) {
    published.push_back(std::async(std::launch::async, [&, i]() {
      return publisher.Publish(MakeResult("job-" + std::to_string(i)));
    }));
  }
  for (auto& i : published) EXPECT_TRUE(i.get());
  EXPECT_EQ(broker.MaxOutstandingSends(), 1);
  auto sends = broker.Sent("SEND");
  ASSERT_EQ(sends.size(), kResults);
  std::set<std::string> ids;
  for (auto& i : sends) {
    auto obj = nlohmann::json::parse(i.body);
    ids.insert(obj.at("submit_id").get<std::string>());
    EXPECT_EQ(obj.at("sandbox_results").size(), 1);
  }
  EXPECT_EQ(ids.size(), kResults);
}

TEST(StreamPublisher, UnconfirmedPublishFails) {
  ScriptedBroker broker;
  broker.auto_receipt = false;
  double timeout = kPublishTimeout;
  kPublishTimeout = 0.05;
  StreamPublisher publisher(broker, "Runner2Server");
  EXPECT_FALSE(publisher.Publish(MakeResult("lost")));
  kPublishTimeout = timeout;
}

class ConsumeLoopTest : public RunnerTest {};

TEST_F(ConsumeLoopTest, DispatchInOrderThenAck) {
  ScriptedBroker broker;
  ASSERT_TRUE(broker.Subscribe("Server2Runner", 4, 1));
  RecordingPublisher publisher;
  Dispatcher dispatcher(publisher);
  std::vector<std::pair<std::string, size_t>> acks; // ack id, messages received by then
  broker.on_send = [&](const StompFrame& frame) {
    if (frame.command == "ACK") acks.emplace_back(frame.HeaderOr("id", ""), dispatcher.Stats().received);
  };
  broker.InjectMessage("sub-1", "a-1", MakeJobBody("first", "echo", 1));
  broker.InjectMessage("sub-1", "a-2", "{not json");
  broker.InjectMessage("sub-1", "a-3", MakeJobBody("second", "echo", 2));
  StompFrame error("ERROR");
  error.Add("message", "connection closed");
  broker.Inject(error);

  ConsumeLoop(broker, dispatcher);
  dispatcher.WaitIdle();
  ASSERT_EQ(acks.size(), 3);
  for (size_t i = 0; i < acks.size(); i++) {
    EXPECT_EQ(acks[i].first, "a-" + std::to_string(i + 1));
    EXPECT_EQ(acks[i].second, i + 1);
  }
  DispatchStats stats = dispatcher.Stats();
  EXPECT_EQ(stats.received, 3);
  EXPECT_EQ(stats.malformed, 1);
  EXPECT_EQ(stats.published, 2);
  EXPECT_NE(publisher.Find("first"), nullptr);
  ASSERT_NE(publisher.Find("second"), nullptr);
  EXPECT_EQ(publisher.Find("second")->results.size(), 2);
}
